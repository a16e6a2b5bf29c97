//
// https://en.wikipedia.org/wiki/UTF-8#Codepage_layout
// https://stackoverflow.com/questions/6240055/
//

#ifndef LZJSON_INTERNAL_UNICODE_HPP
#define LZJSON_INTERNAL_UNICODE_HPP

#include <cstddef>
#include <cstdint>

#include "config.hpp"

namespace lzjson {
namespace internal {
namespace util {

static constexpr char32_t HEX_ERR = 0xFFFFFFFF;

enum utf8_status
{
    UTF8_ok = 0,
    UTF8_invalid,
    UTF8_truncated
};

// Value of a hex digit, or HEX_ERR.
constexpr char32_t hex_value(char32_t c) noexcept
{
    return (c >= 0x30 && c <= 0x39) ? c - 0x30 :        // '0' to '9'
           (c >= 0x41 && c <= 0x46) ? c - (0x41 - 10) : // 'A' to 'F'
           (c >= 0x61 && c <= 0x66) ? c - (0x61 - 10) : // 'a' to 'f'
           HEX_ERR;
}

// Length of the sequence introduced by lead, or 0 if lead cannot start one.
constexpr unsigned utf8_stride(unsigned char lead) noexcept
{
    return lead < 0x80u ? 1 :
           lead < 0xc2u ? 0 : // continuation, or overlong 2-byte lead
           lead < 0xe0u ? 2 :
           lead < 0xf0u ? 3 :
           lead < 0xf5u ? 4 :
           0;
}

constexpr bool utf8_is_cont(unsigned char c) noexcept
{
    return (c & 0xc0u) == 0x80u;
}

// Decodes the sequence at the start of s[0, n).
// On success, writes the code point and its length in units.
template <typename Unit>
inline utf8_status utf8_decode(const Unit* s, std::size_t n, char32_t& cp, unsigned& stride) noexcept
{
    using uchar = unsigned char;

    if (n == 0)
        return UTF8_truncated;

    uchar lead = (uchar)s[0];
    unsigned len = utf8_stride(lead);
    if (len == 0)
        return UTF8_invalid;
    if (len == 1)
    {
        cp = lead;
        stride = 1;
        return UTF8_ok;
    }

    static constexpr char32_t lead_mask[] = { 0, 0, 0x1fu, 0x0fu, 0x07u };
    static constexpr char32_t min_cp[] = { 0, 0, 0x80u, 0x800u, 0x10000u };

    char32_t res = lead & lead_mask[len];
    unsigned avail = n < len ? (unsigned)n : len;
    for (unsigned i = 1; i < avail; ++i)
    {
        uchar c = (uchar)s[i];
        if (!utf8_is_cont(c))
            return UTF8_invalid;
        res = (res << 6) | (c & 0x3fu);
    }
    if (avail < len)
        return UTF8_truncated;

    if (res < min_cp[len] || res > 0x10ffffu ||
        (res >= 0xd800u && res <= 0xdfffu))
        return UTF8_invalid;

    cp = res;
    stride = len;
    return UTF8_ok;
}

// Appends the UTF-8 encoding of cp to a container of byte-sized units.
// Surrogates are encoded as-is, 3 bytes each.
template <typename Container>
inline void put_utf8(Container& os, char32_t cp)
{
    using unit = typename Container::value_type;

    if (cp < 0x80u) {
        os.push_back((unit)cp);
    }
    else if (cp < 0x800u)
    {
        os.push_back((unit)(0xc0u | (cp >> 6)));
        os.push_back((unit)(0x80u | (cp & 0x3fu)));
    }
    else if (cp < 0x10000u)
    {
        os.push_back((unit)(0xe0u | (cp >> 12)));
        os.push_back((unit)(0x80u | ((cp >> 6) & 0x3fu)));
        os.push_back((unit)(0x80u | (cp & 0x3fu)));
    }
    else
    {
        os.push_back((unit)(0xf0u | (cp >> 18)));
        os.push_back((unit)(0x80u | ((cp >> 12) & 0x3fu)));
        os.push_back((unit)(0x80u | ((cp >> 6) & 0x3fu)));
        os.push_back((unit)(0x80u | (cp & 0x3fu)));
    }
}

// Appends a code point to a container of Unit.
template <typename Unit>
struct cp_convert
{
    template <typename Container>
    static inline void put(Container& os, char32_t cp)
    {
        put_utf8(os, cp);
    }
};

template <>
struct cp_convert<char32_t>
{
    template <typename Container>
    static inline void put(Container& os, char32_t cp)
    {
        os.push_back(cp);
    }
};

}
}
}

#endif
