#ifndef LZJSON_STRING_CURSOR_HPP
#define LZJSON_STRING_CURSOR_HPP

#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "internal/config.hpp"
#include "internal/core.hpp"
#include "internal/unicode.hpp"
#include "text.hpp"

namespace lzjson {

//
// Cursor over the contents of a string literal.
// ------------------------
// Yields one decoded code point at a time, with escapes
// resolved. front() is the current code point and
// escape_width() the number of raw units its escape took
// beyond the backslash (0 if it was not escaped).
// 
// \uXXXX escapes are decoded one at a time; surrogate
// pairs are not combined.
//
template <typename Reader>
class string_cursor
{
private:
    using Input = typename Reader::input_type;
    using is_sliceable = std::integral_constant<bool, Input::is_sliceable>;

public:
    using unit_type = typename Reader::unit_type;
    using text_type = basic_text<unit_type>;

public:
    // Must be positioned on the opening quote.
    explicit string_cursor(Reader& rd) :
        m_rd(&rd)
    {
        auto& is = in();
        if (is.end())
            throw parse_error(is.ipos(), ERROR_eof);
        if (is.peek() != U'"')
            throw parse_error(is.ipos(), ERROR_str_delim, is.peek());

        is.take();
        m_rd->m_scalar_open = true;
        step();
    }

    string_cursor(string_cursor&& rhs) noexcept :
        m_rd(rhs.m_rd), m_front(rhs.m_front), m_width(rhs.m_width),
        m_empty(rhs.m_empty), m_front_ptr(rhs.m_front_ptr)
    {
        rhs.m_rd = nullptr;
    }

    string_cursor(const string_cursor&) = delete;
    string_cursor& operator=(const string_cursor&) = delete;
    string_cursor& operator=(string_cursor&&) = delete;

    // True once the closing quote was consumed.
    inline bool empty(void) const noexcept { return m_empty; }

    // Current code point. If empty(), behavior is undefined.
    inline char32_t front(void) const noexcept { return m_front; }

    // 0 for a literal code point, 1 for \n etc., 5 for \uXXXX.
    inline unsigned escape_width(void) const noexcept { return m_width; }

    // Move to the next code point.
    inline void advance(void)
    {
        if (!m_rd || m_empty)
            throw std::logic_error("string_cursor::advance: String is exhausted.");
        step();
    }

    // Drains the remaining code points.
    // Borrows from the input if it is sliceable and there
    // were no escapes, copies otherwise.
    inline text_type whole(void)
    {
        if (!m_rd)
            throw std::logic_error("string_cursor::whole: Cursor was moved from.");
        return whole(is_sliceable());
    }

private:
    inline Input& in(void) noexcept { return m_rd->in(); }

    inline void mark(std::true_type) noexcept { m_front_ptr = in().ipcur(); }
    inline void mark(std::false_type) noexcept {}

    inline void step(void)
    {
        auto& is = in();
        mark(is_sliceable());

        if (is.end())
            throw parse_error(is.ipos(), ERROR_str_delim);

        auto pos = is.ipos();
        char32_t c = is.take();
        m_width = 0;

        if (c == U'"')
        {
            m_empty = true;
            m_rd->m_scalar_open = false;
        }
        else if (c == U'\\')
        {
            if (is.end())
                throw parse_error(is.ipos(), ERROR_str_delim);

            pos = is.ipos();
            char32_t sel = is.take();
            char ctrl = iutil::ctrl_lut(sel);
            if (ctrl)
            {
                m_front = (char32_t)ctrl;
                m_width = 1;
            }
            else if (sel == U'u')
            {
                char32_t cp = 0;
                for (int i = 0; i < 4; ++i)
                {
                    if (is.end())
                        throw parse_error(is.ipos(), ERROR_str_unicode);

                    char32_t h = iutil::hex_value(is.peek());
                    if (h == iutil::HEX_ERR)
                        throw parse_error(is.ipos(), ERROR_str_unicode, is.peek());

                    is.take();
                    cp = (cp << 4) | h;
                }
                m_front = cp;
                m_width = 5;
            }
            else throw parse_error(pos, ERROR_str_escape, sel);
        }
        else if (c < 0x20)
            throw parse_error(pos, ERROR_str_ctrl, c);
        else
            m_front = c;
    }

    inline text_type whole(std::true_type)
    {
        typename text_type::buffer_type buf;
        const unit_type* run = m_front_ptr;
        bool copied = false;

        while (!m_empty)
        {
            if (m_width)
            {
                buf.insert(buf.end(), run, m_front_ptr);
                iutil::cp_convert<unit_type>::put(buf, m_front);
                copied = true;
                // past the escape
                run = m_front_ptr + m_width + 1;
            }
            step();
        }

        // m_front_ptr is at the closing quote
        if (!copied)
            return text_type::borrow(run, (std::size_t)(m_front_ptr - run));

        buf.insert(buf.end(), run, m_front_ptr);
        return text_type(std::move(buf));
    }

    inline text_type whole(std::false_type)
    {
        typename text_type::buffer_type buf;
        while (!m_empty)
        {
            iutil::cp_convert<unit_type>::put(buf, m_front);
            step();
        }
        return text_type(std::move(buf));
    }

private:
    Reader* m_rd;
    char32_t m_front = 0;
    unsigned m_width = 0;
    bool m_empty = false;
    // first raw unit of front(), sliceable inputs only
    const unit_type* m_front_ptr = nullptr;
};

}

#endif
