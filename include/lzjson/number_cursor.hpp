#ifndef LZJSON_NUMBER_CURSOR_HPP
#define LZJSON_NUMBER_CURSOR_HPP

#include <cmath>
#include <cstddef>
#include <string>
#include <stdexcept>
#include <system_error>
#include <type_traits>

#include "fast_float/fast_float.h"

#include "internal/config.hpp"
#include "internal/core.hpp"

namespace lzjson {

//
// Cursor over the characters of a number literal.
// ------------------------
// Validates the literal one code point at a time:
// 
//   -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
// 
// The literal ends at the first code point that cannot
// continue it, which is left in the input.
//
template <typename Reader>
class number_cursor
{
private:
    using Input = typename Reader::input_type;
    using unit_type = typename Reader::unit_type;

    // in-place conversion needs contiguous single-byte units
    using is_in_place = std::integral_constant<bool,
        Input::is_sliceable && iutil::is_char8_like<unit_type>::value>;

    enum stage : int
    {
        STAGE_minus,    // after '-'
        STAGE_zero,     // after a leading '0'
        STAGE_int,      // integer digits
        STAGE_dot,      // after '.'
        STAGE_frac,     // fraction digits
        STAGE_exp_e,    // after 'e' or 'E'
        STAGE_exp_sign, // after exponent sign
        STAGE_exp       // exponent digits
    };

public:
    // Must be positioned on '-' or a digit.
    explicit number_cursor(Reader& rd) :
        m_rd(&rd)
    {
        auto& is = in();
        if (is.end())
            throw parse_error(is.ipos(), ERROR_eof);

        char32_t c = is.peek();
        if (c == U'-')
            m_stage = STAGE_minus;
        else if (c == U'0')
            m_stage = STAGE_zero;
        else if (iutil::is_digit(c))
            m_stage = STAGE_int;
        else
            throw parse_error(is.ipos(), ERROR_num_digit, c);

        m_pos = is.ipos();
        mark(is_in_place());
        m_front = is.take();
        m_rd->m_scalar_open = true;
    }

    number_cursor(number_cursor&& rhs) noexcept :
        m_rd(rhs.m_rd), m_front(rhs.m_front), m_stage(rhs.m_stage),
        m_empty(rhs.m_empty), m_pos(rhs.m_pos), m_front_ptr(rhs.m_front_ptr)
    {
        rhs.m_rd = nullptr;
    }

    number_cursor(const number_cursor&) = delete;
    number_cursor& operator=(const number_cursor&) = delete;
    number_cursor& operator=(number_cursor&&) = delete;

    // True once the literal has ended.
    inline bool empty(void) const noexcept { return m_empty; }

    // Current character. If empty(), behavior is undefined.
    inline char32_t front(void) const noexcept { return m_front; }

    // Move to the next character.
    // Throws parse_error if the literal cannot end or continue here.
    inline void advance(void)
    {
        if (!m_rd || m_empty)
            throw std::logic_error("number_cursor::advance: Number is exhausted.");
        step();
    }

    // Drains the remaining characters into a string.
    inline std::string whole_text(void)
    {
        if (!m_rd)
            throw std::logic_error("number_cursor::whole_text: Cursor was moved from.");

        std::string res;
        while (!m_empty)
        {
            res.push_back((char)m_front);
            step();
        }
        return res;
    }

    // Drains the remaining characters and converts them to a double.
    inline double whole(void)
    {
        if (!m_rd)
            throw std::logic_error("number_cursor::whole: Cursor was moved from.");
        if (m_empty)
            throw std::logic_error("number_cursor::whole: Number is exhausted.");
        return whole(is_in_place());
    }

private:
    inline Input& in(void) noexcept { return m_rd->in(); }

    inline void mark(std::true_type) noexcept { m_front_ptr = in().ipcur(); }
    inline void mark(std::false_type) noexcept {}

    inline bool accepting(void) const noexcept
    {
        return m_stage == STAGE_zero || m_stage == STAGE_int ||
            m_stage == STAGE_frac || m_stage == STAGE_exp;
    }

    inline void finish(void) noexcept
    {
        m_empty = true;
        m_rd->m_scalar_open = false;
    }

    inline void step(void)
    {
        auto& is = in();
        mark(is_in_place());

        if (is.end())
        {
            if (!accepting())
                throw parse_error(is.ipos(), ERROR_num_digit);
            finish();
            return;
        }

        char32_t c = is.peek();
        bool digit = iutil::is_digit(c);
        bool exp = c == U'e' || c == U'E';

        switch (m_stage)
        {
        case STAGE_minus:
            if (!digit)
                throw parse_error(is.ipos(), ERROR_num_digit, c);
            m_stage = c == U'0' ? STAGE_zero : STAGE_int;
            break;

        case STAGE_zero:
            if (digit)
                throw parse_error(is.ipos(), ERROR_num_leading_zero, c);
            // fallthrough
        case STAGE_int:
            if (digit) m_stage = STAGE_int;
            else if (c == U'.') m_stage = STAGE_dot;
            else if (exp) m_stage = STAGE_exp_e;
            else return finish();
            break;

        case STAGE_dot:
            if (!digit)
                throw parse_error(is.ipos(), ERROR_num_digit, c);
            m_stage = STAGE_frac;
            break;

        case STAGE_frac:
            if (exp) m_stage = STAGE_exp_e;
            else if (!digit) return finish();
            break;

        case STAGE_exp_e:
            if (c == U'+' || c == U'-') m_stage = STAGE_exp_sign;
            else if (digit) m_stage = STAGE_exp;
            else throw parse_error(is.ipos(), ERROR_num_digit, c);
            break;

        case STAGE_exp_sign:
            if (!digit)
                throw parse_error(is.ipos(), ERROR_num_digit, c);
            m_stage = STAGE_exp;
            break;

        case STAGE_exp:
            if (!digit) return finish();
            break;
        }

        m_front = is.take();
    }

    template <typename UC>
    inline double convert(const UC* first, const UC* last) const
    {
        double res = 0;
        auto ff = fast_float::from_chars(first, last, res);
        // underflow may also report result_out_of_range, but yields 0
        if (std::isinf(res))
            throw parse_error(m_pos, ERROR_out_of_range);
        // e.g. whole() on a remainder like "e5"
        if ((ff.ec != std::errc() && ff.ec != std::errc::result_out_of_range) || ff.ptr != last)
            throw parse_error(m_pos, ERROR_num_digit);
        return res;
    }

    inline double whole(std::true_type)
    {
        auto first = m_front_ptr;
        while (!m_empty)
            step();

        // m_front_ptr is one past the literal
        return convert(reinterpret_cast<const char*>(first), 
            reinterpret_cast<const char*>(m_front_ptr));
    }

    inline double whole(std::false_type)
    {
        auto str = whole_text();
        return convert(str.data(), str.data() + str.size());
    }

private:
    Reader* m_rd;
    char32_t m_front = 0;
    stage m_stage = STAGE_minus;
    bool m_empty = false;
    // offset of the literal
    typename Input::size_type m_pos = 0;
    // first raw unit of front(), in-place inputs only
    const unit_type* m_front_ptr = nullptr;
};

}

#endif
