//
// Adapters that turn an input of raw units into an
// input of code points. Cursors only ever see these.
//

#ifndef LZJSON_CODEPOINT_INPUT_HPP
#define LZJSON_CODEPOINT_INPUT_HPP

#include <cstddef>
#include <type_traits>

#include "internal/config.hpp"
#include "internal/core.hpp"
#include "internal/unicode.hpp"
#include "concepts.hpp"

namespace lzjson {

namespace internal {
namespace util {

template <typename RawInput>
using input_type_t = iutil::remove_cvref_t<RawInput>;

template <typename RawInput>
using unit_of_t = typename input_type_t<RawInput>::char_type;

template <typename RawInput>
using is_sliceable_input = is_contiguous_input<input_type_t<RawInput>, unit_of_t<RawInput>>;

}
}


//
// UTF-8 decoder over a basic input.
// ------------------------
// Buffers the units of at most one code point,
// so the underlying input is read strictly once.
//
template <typename RawInput, typename = void>
class utf8_input
{
private:
    using Input = iutil::input_type_t<RawInput>;

public:
    using unit_type = typename Input::char_type;
    using char_type = char32_t;
    using size_type = typename Input::size_type;
    using input_kind = io_basic;

    static constexpr bool is_sliceable = false;

public:
    template <typename T>
    explicit utf8_input(T& is) :
        m_is(is), m_pos(m_is.ipos())
    {}

    utf8_input(utf8_input&&) = default;
    utf8_input& operator=(utf8_input&&) = delete;

    // Get code point. If end(), behavior is undefined.
    inline char_type peek(void)
    {
        decode();
        return m_cp;
    }

    // Extract code point. If end(), behavior is undefined.
    inline char_type take(void)
    {
        decode();
        m_have = false;
        m_pos += m_len;
        return m_cp;
    }

    // True if input has run out of code points.
    inline bool end(void) { return !m_have && m_is.end(); }

    // Offset of the next code point, in units.
    inline size_type ipos(void) const noexcept { return m_pos; }

    inline void rewind(void)
    {
        m_is.rewind();
        m_have = false;
        m_pos = m_is.ipos();
    }

private:
    inline void decode(void)
    {
        if (m_have)
            return;

        LZJSON_ASSERT(!m_is.end());

        m_buf[0] = m_is.take();
        unsigned len = iutil::utf8_stride((unsigned char)m_buf[0]);
        if (len == 0)
            throw parse_error(m_pos, ERROR_utf8_invalid);

        // take continuation units one by one, so that a bad one
        // stays in the input
        for (unsigned i = 1; i < len; ++i)
        {
            if (m_is.end())
                throw parse_error(m_pos, ERROR_utf8_truncated);
            if (!iutil::utf8_is_cont((unsigned char)m_is.peek()))
                throw parse_error(m_pos, ERROR_utf8_invalid);
            m_buf[i] = m_is.take();
        }

        unsigned stride = 0;
        if (iutil::utf8_decode(m_buf, len, m_cp, stride) != iutil::UTF8_ok)
            throw parse_error(m_pos, ERROR_utf8_invalid);

        m_len = stride;
        m_have = true;
    }

private:
    RawInput m_is;
    unit_type m_buf[4] = {};
    char32_t m_cp = 0;
    unsigned m_len = 0;
    bool m_have = false;
    size_type m_pos;
};


//
// UTF-8 decoder over a contiguous input.
// ------------------------
// Decodes in place. ipcur() points to the
// first unit of the next code point.
//
template <typename RawInput>
class utf8_input<RawInput, iutil::enable_if_t<iutil::is_sliceable_input<RawInput>::value, void>>
{
private:
    using Input = iutil::input_type_t<RawInput>;

public:
    using unit_type = typename Input::char_type;
    using char_type = char32_t;
    using size_type = typename Input::size_type;
    using input_kind = io_contiguous;

    static constexpr bool is_sliceable = true;

public:
    template <typename T>
    explicit utf8_input(T& is) :
        m_is(is)
    {}

    utf8_input(utf8_input&&) = default;
    utf8_input& operator=(utf8_input&&) = delete;

    // Get code point. If end(), behavior is undefined.
    inline char_type peek(void)
    {
        decode();
        return m_cp;
    }

    // Extract code point. If end(), behavior is undefined.
    inline char_type take(void)
    {
        decode();
        m_have = false;
        m_is.icommit(m_len);
        return m_cp;
    }

    inline bool end(void) const noexcept { return m_is.end(); }

    inline size_type ipos(void) const noexcept { return m_is.ipos(); }

    inline void rewind(void)
    {
        m_is.rewind();
        m_have = false;
    }

    inline const unit_type* ipbeg(void) const noexcept { return m_is.ipbeg(); }

    inline const unit_type* ipcur(void) const noexcept { return m_is.ipcur(); }

    inline const unit_type* ipend(void) const noexcept { return m_is.ipend(); }

private:
    inline void decode(void)
    {
        if (m_have)
            return;

        LZJSON_ASSERT(!m_is.end());

        auto res = iutil::utf8_decode(m_is.ipcur(),
            (std::size_t)(m_is.ipend() - m_is.ipcur()), m_cp, m_len);
        if (res == iutil::UTF8_truncated)
            throw parse_error(m_is.ipos(), ERROR_utf8_truncated);
        else if (res != iutil::UTF8_ok)
            throw parse_error(m_is.ipos(), ERROR_utf8_invalid);

        m_have = true;
    }

private:
    RawInput m_is;
    char32_t m_cp = 0;
    unsigned m_len = 0;
    bool m_have = false;
};


//
// Input that already holds code points.
// Values above U+10FFFF and surrogates are rejected,
// as they are when decoding UTF-8.
//
template <typename RawInput>
class cp_input
{
private:
    using Input = iutil::input_type_t<RawInput>;

public:
    using unit_type = typename Input::char_type;
    using char_type = char32_t;
    using size_type = typename Input::size_type;
    using input_kind = typename Input::input_kind;

    static constexpr bool is_sliceable = iutil::is_sliceable_input<RawInput>::value;

public:
    template <typename T>
    explicit cp_input(T& is) :
        m_is(is)
    {}

    cp_input(cp_input&&) = default;
    cp_input& operator=(cp_input&&) = delete;

    inline char_type peek(void) { return checked((char_type)m_is.peek()); }

    inline char_type take(void)
    {
        char_type c = checked((char_type)m_is.peek());
        m_is.take();
        return c;
    }

    inline bool end(void) { return m_is.end(); }

    inline size_type ipos(void) { return m_is.ipos(); }

    inline void rewind(void) { m_is.rewind(); }

    // Only if is_sliceable.
    inline const unit_type* ipbeg(void) const noexcept { return m_is.ipbeg(); }

    // Only if is_sliceable.
    inline const unit_type* ipcur(void) const noexcept { return m_is.ipcur(); }

    // Only if is_sliceable.
    inline const unit_type* ipend(void) const noexcept { return m_is.ipend(); }

private:
    inline char_type checked(char_type c)
    {
        if (c > 0x10ffffu || (c >= 0xd800u && c <= 0xdfffu))
            throw parse_error(m_is.ipos(), ERROR_codepoint, c);
        return c;
    }

private:
    RawInput m_is;
};


template <typename RawInput>
struct decode_input
{
    using unit_type = iutil::unit_of_t<RawInput>;

    static_assert(iutil::is_char8_like<unit_type>::value || std::is_same<unit_type, char32_t>::value,
        "Input units must be UTF-8 code units or char32_t code points.");

    static_assert(is_basic_input<iutil::input_type_t<RawInput>, unit_type>::value,
        "Input does not implement BasicInput.");

    using type = typename std::conditional<std::is_same<unit_type, char32_t>::value,
        cp_input<RawInput>, utf8_input<RawInput>>::type;
};

// Code point input over RawInput (a value or reference type).
template <typename RawInput>
using decode_input_t = typename decode_input<RawInput>::type;

}

#endif
