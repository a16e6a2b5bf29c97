#ifndef LZJSON_IO_STRING_HPP
#define LZJSON_IO_STRING_HPP

#include <cstddef>
#include <string>
#include <stdexcept>
#include <type_traits>

#include "internal/config.hpp"
#include "internal/core.hpp"

#if LZJSON_HAS_STRING_VIEW
#include <string_view>
#endif


namespace lzjson {

//
// Input string.
// ------------------------
// Implements ContiguousInput.
// ------------------------
// Does not own the data. Source must outlive
// this object and every view taken from it.
//
template <typename CharT>
class basic_in_str
{
private:
    using Traits = std::char_traits<CharT>;

public:
    using char_type = CharT;
    using size_type = std::size_t;
    using input_kind = io_contiguous;

public:
    basic_in_str(memspan<const char_type> src) :
        m_begin(src.begin), m_cur(src.begin), m_end(src.end)
    {
#if LZJSON_USE_LOGIC_ERRORS
        if (!src.begin || !src.end)
            throw std::invalid_argument(LZJSON_SRCLOC ": basic_in_str: src is null.");
#else
        LZJSON_ASSERT(src.begin && src.end);
#endif
    }

    basic_in_str(const char_type* src, std::size_t size) :
        basic_in_str(memspan<const char_type>(src, src + size))
    {}

    basic_in_str(const char_type* src) :
        basic_in_str(src, Traits::length(src))
    {}

#if LZJSON_HAS_STRING_VIEW
    basic_in_str(std::basic_string_view<CharT, std::char_traits<CharT>> src) :
        basic_in_str(src.data(), src.size())
    {}
#endif
    template <typename ...Ts>
    basic_in_str(const std::basic_string<CharT, std::char_traits<CharT>, Ts...>& src) :
        basic_in_str(src.data(), src.size())
    {}

    basic_in_str(basic_in_str&&) = default;
    basic_in_str(const basic_in_str&) = delete;

    basic_in_str& operator=(basic_in_str&&) = default;
    basic_in_str& operator=(const basic_in_str&) = delete;


    // Get char. If end(), behavior is undefined.
    inline char_type peek(void) const noexcept { return *m_cur; }

    // Extract char. If end(), behavior is undefined.
    inline char_type take(void) noexcept { return *m_cur++; }

    // True if input has run out of characters.
    inline bool end(void) const noexcept { return m_cur == m_end; }

    // Jump to the beginning.
    inline void rewind(void) noexcept { m_cur = m_begin; }

    // Get input position.
    inline size_type ipos(void) const noexcept
    {
        return (size_type)(m_cur - m_begin);
    }

    // Pointer to the first char.
    inline const char_type* ipbeg(void) const noexcept { return m_begin; }

    // Pointer to the current char.
    inline const char_type* ipcur(void) const noexcept { return m_cur; }

    // Pointer to one past the last char.
    inline const char_type* ipend(void) const noexcept { return m_end; }

    // Commit the next count chars (i.e. mark them as 'read').
    inline void icommit(size_type count) noexcept { m_cur += count; }

private:
    const CharT* m_begin;
    const CharT* m_cur;
    const CharT* m_end;
};

using in_str = basic_in_str<char>;
// Raw bytes, decoded as UTF-8.
using in_ustr = basic_in_str<unsigned char>;
#ifdef __cpp_char8_t
using in_u8str = basic_in_str<char8_t>;
#endif
// Already-decoded code points.
using in_u32str = basic_in_str<char32_t>;

}

#endif
