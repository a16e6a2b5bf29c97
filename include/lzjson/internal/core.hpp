
#ifndef LZJSON_INTERNAL_CORE_HPP
#define LZJSON_INTERNAL_CORE_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iosfwd>
#include <iterator>
#include <limits>
#include <memory>
#include <utility>
#include <string>
#include <type_traits>
#include <stdexcept>

#include "config.hpp"
#include "unicode.hpp"

#if LZJSON_EXC_STACKTRACE
#if !defined(LZJSON_HAS_STACKTRACE)
#error "Cannot find stacktrace implementation."
#else
#include <stacktrace>
#endif
#endif


namespace lzjson {

// always >= 0
enum error : int
{
    ERROR_none = 0,
    ERROR_eof,
    ERROR_root,
    ERROR_value,
    ERROR_num_digit,
    ERROR_num_leading_zero,
    ERROR_out_of_range,
    ERROR_str_delim,
    ERROR_str_escape,
    ERROR_str_unicode,
    ERROR_str_ctrl,
    ERROR_token_end_object,
    ERROR_token_end_array,
    ERROR_token_key_sep,
    ERROR_literal,
    ERROR_utf8_invalid,
    ERROR_utf8_truncated,
    ERROR_trailing,
    ERROR_codepoint,
    ERROR_depth
};

inline const char* error_msg(error e)
{
    switch (e)
    {
    case ERROR_none:             return "No error.";
    case ERROR_eof:              return "Unexpected end of input.";
    case ERROR_root:             return "Expected '{' or '[' at document root.";
    case ERROR_value:            return "Invalid first character of JSON value.";
    case ERROR_num_digit:        return "Digit 0..9 expected.";
    case ERROR_num_leading_zero: return "A dot '.', 'e' or 'E' expected.";
    case ERROR_out_of_range:     return "Out of range.";
    case ERROR_str_delim:        return "String delimiter missing.";
    case ERROR_str_escape:       return "Invalid escape character.";
    case ERROR_str_unicode:      return "Incomplete unicode escape.";
    case ERROR_str_ctrl:         return "Unexpected control character.";
    case ERROR_token_end_object: return "A comma ',' or closing bracket '}' expected.";
    case ERROR_token_end_array:  return "A comma ',' or closing bracket ']' expected.";
    case ERROR_token_key_sep:    return "Expected ':'.";
    case ERROR_literal:          return "Invalid literal.";
    case ERROR_utf8_invalid:     return "Invalid UTF-8 sequence.";
    case ERROR_utf8_truncated:   return "Truncated UTF-8 sequence.";
    case ERROR_trailing:         return "Unexpected characters after root value.";
    case ERROR_codepoint:        return "Invalid code point.";
    case ERROR_depth:            return "Maximum nesting depth exceeded.";
    default:                     return "Unknown error.";
    }
}

class parse_error : public std::runtime_error
{
public:
    template <typename OffT>
    parse_error(OffT offset, error e) :
        std::runtime_error(get_msg(offset, e, nullptr, nullptr)),
        m_offset((std::size_t)offset), m_code(e), m_cp(0), m_has_cp(false)
    {}

    // found is the offending code point.
    template <typename OffT>
    parse_error(OffT offset, error e, char32_t found) :
        std::runtime_error(get_msg(offset, e, &found, nullptr)),
        m_offset((std::size_t)offset), m_code(e), m_cp(found), m_has_cp(true)
    {}

    // expected is the token that should have been at offset.
    template <typename OffT>
    parse_error(OffT offset, error e, char32_t found, const char* expected) :
        std::runtime_error(get_msg(offset, e, &found, expected)),
        m_offset((std::size_t)offset), m_code(e), m_cp(found), m_has_cp(true)
    {}

    // Offset of the error, in input units.
    inline std::size_t offset(void) const noexcept { return m_offset; }

    inline error code(void) const noexcept { return m_code; }

    // Offending code point. Only valid if has_code_point().
    inline char32_t code_point(void) const noexcept { return m_cp; }

    inline bool has_code_point(void) const noexcept { return m_has_cp; }

private:
    template <typename OffT>
    static inline std::string get_msg(OffT off, error e, const char32_t* found, const char* expected)
    {
        auto res = "JSON parse error at offset " + std::to_string(off) + ": " + error_msg(e);
        if (found)
        {
            res += " Found ";
            // quote only if printable
            if (*found >= 0x20 && *found != 0x7f && *found <= 0x10ffff &&
                !(*found >= 0xd800 && *found <= 0xdfff))
            {
                res += '"';
                internal::util::put_utf8(res, *found);
                res += "\" ";
            }
            char hex[16];
            std::snprintf(hex, sizeof(hex), "(U+%04lX)", (unsigned long)*found);
            res += hex;
            res += '.';
        }
        if (expected)
        {
            res += " Expected '";
            res += expected;
            res += "'.";
        }
#if LZJSON_EXC_STACKTRACE
        res += "\nStack trace:\n" + std::to_string(std::stacktrace::current());
#endif
        return res;
    }

private:
    std::size_t m_offset;
    error m_code;
    char32_t m_cp;
    bool m_has_cp;
};

// Implements the basic I/O interface (see is_basic_input in concepts.hpp).
struct io_basic { static constexpr unsigned flags = 0x1; };

// Implements the contiguous I/O interface (see is_contiguous_input in concepts.hpp).
struct io_contiguous { static constexpr unsigned flags = 0x2 | 0x1; };


namespace internal {
namespace util {}
}
namespace iutil = internal::util;

namespace internal {
// Data
namespace util {

template <typename = void>
struct LUTS
{
    // row = 16 chars
    // \b, \f, \n, \r, \t, /, \, "
    static constexpr char ctrl[] = 
    {
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0, '"', 0,0,0,0,0,0,0,0,0,0,0,0, '/',
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0, '\\', 0,0,0,
        0,0, '\b', 0,0,0, '\f', 0,0,0,0,0,0,0, '\n', 0,
        0,0, '\r', 0, '\t', 0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0
    };
};

template <typename T>
constexpr char LUTS<T>::ctrl[];

// Unescaped value of a single-char escape selector, or 0.
constexpr char ctrl_lut(char32_t c) noexcept
{
    return c <= 255 ? LUTS<>::ctrl[(unsigned char)c] : 0;
}

// space, \t, \n, \r (and nothing else)
constexpr bool is_ws(char32_t c) noexcept
{
    return c == 0x20 || c == 0x09 || c == 0x0a || c == 0x0d;
}

constexpr bool is_digit(char32_t c) noexcept { return c >= U'0' && c <= U'9'; }
}

// Low-level utils
namespace util {

template <bool test, typename T = int>
using enable_if_t = typename std::enable_if<test, T>::type;

template <typename A, typename B, typename T = int>
using enable_if_same_t = iutil::enable_if_t<std::is_same<A, B>::value, T>;

// https://en.cppreference.com/w/cpp/types/void_t
// https://cplusplus.github.io/CWG/issues/1558.html
template <typename ...Ts> struct make_void { using type = void; };
template <typename ...Ts> using void_t = typename make_void<Ts...>::type;

template <typename T>
using remove_cvref_t = typename std::remove_cv<
    typename std::remove_reference<T>::type>::type;

template <typename T>
using make_unsigned_t = typename std::make_unsigned<T>::type;

template <typename T>
using is_nb_unsigned_integral = std::integral_constant<bool,
    !std::is_same<T, bool>::value && std::is_integral<T>::value && std::is_unsigned<T>::value>;

// True if T may be used for UTF-8 character representation.
template <typename T>
using is_char8_like = std::integral_constant<bool,
#ifdef __cpp_char8_t
    std::is_same<T, char8_t>::value ||
#endif
    std::is_same<T, unsigned char>::value ||
    std::is_same<T, char>::value
>;

template <typename T, typename = void>
struct inherits_std_basic_istream : std::false_type {};

template <typename T>
struct inherits_std_basic_istream<T,
    void_t<std::is_convertible<T*,
    std::basic_istream<typename T::char_type, typename T::traits_type>*>>> :
    std::is_convertible<T*, std::basic_istream<typename T::char_type, typename T::traits_type>*>
{};
}

// Memory
namespace util {

// Allocate and construct a single T.
template <typename T, typename ...Args>
inline T* alloc_new(Args&&... args)
{
    using Altraits = std::allocator_traits<std::allocator<T>>;

    std::allocator<T> alloc;
    T* p = Altraits::allocate(alloc, 1);
    try {
        Altraits::construct(alloc, p, std::forward<Args>(args)...);
    }
    catch (...) {
        Altraits::deallocate(alloc, p, 1);
        throw;
    }
    return p;
}

// Destroy and free a T from alloc_new(). Does nothing if p is null.
template <typename T>
inline void alloc_delete(T* p) noexcept
{
    using Altraits = std::allocator_traits<std::allocator<T>>;

    if (!p) return;
    std::allocator<T> alloc;
    Altraits::destroy(alloc, p);
    Altraits::deallocate(alloc, p, 1);
}
}

// Concepts
namespace util {

template <typename T, typename CharT>
using check_io_typedefs = iutil::void_t<
    iutil::enable_if_same_t<typename T::char_type, CharT>,
    iutil::enable_if_t<iutil::is_nb_unsigned_integral<typename T::size_type>::value>>;


template <typename T, typename CharT>
using is_basic_input_impl = iutil::void_t<
    check_io_typedefs<T, CharT>,
    iutil::enable_if_t<(T::input_kind::flags & 0x1u) != 0>,
    iutil::enable_if_same_t<decltype(std::declval<T>().peek()), CharT>,
    iutil::enable_if_same_t<decltype(std::declval<T>().take()), CharT>,
    iutil::enable_if_same_t<decltype(std::declval<T>().ipos()), typename T::size_type>,
    iutil::enable_if_same_t<decltype(std::declval<T>().end()), bool>,
    decltype(std::declval<T>().rewind())>;


template <typename T, typename CharT>
using is_nothrow_basic_input_impl = std::integral_constant<bool,
    noexcept(std::declval<T>().peek()) &&
    noexcept(std::declval<T>().take()) &&
    noexcept(std::declval<T>().ipos()) &&
    noexcept(std::declval<T>().end()) &&
    noexcept(std::declval<T>().rewind())>;


template <typename T, typename CharT>
using is_contiguous_input_impl = iutil::void_t<
    is_basic_input_impl<T, CharT>,
    iutil::enable_if_t<(T::input_kind::flags & 0x2u) != 0>,
    iutil::enable_if_same_t<decltype(std::declval<const T>().ipbeg()), const CharT*>,
    iutil::enable_if_same_t<decltype(std::declval<const T>().ipend()), const CharT*>,
    iutil::enable_if_same_t<decltype(std::declval<const T>().ipcur()), const CharT*>,
    decltype(std::declval<T>().icommit(std::declval<typename T::size_type>()))>;


template <typename T, typename CharT>
using is_nothrow_contiguous_input_impl = std::integral_constant<bool,
    is_nothrow_basic_input_impl<T, CharT>::value &&
    noexcept(std::declval<const T>().ipbeg()) &&
    noexcept(std::declval<const T>().ipend()) &&
    noexcept(std::declval<const T>().ipcur()) &&
    noexcept(std::declval<T>().icommit(std::declval<typename T::size_type>()))>;


#define LZJSON_GEN_IO_CONCEPT(name, impl) \
template <typename, typename, typename = void> \
struct name : std::false_type {}; \
\
template <typename T, typename CharT> \
struct name<T, CharT, impl<T, CharT>> : \
    std::true_type \
{};

#define LZJSON_GEN_NT_IO_CONCEPT(name, impl, nt_impl) \
template <typename, typename, typename = void> \
struct name : std::false_type {}; \
\
template <typename T, typename CharT> \
struct name<T, CharT, impl<T, CharT>> : \
    nt_impl<T, CharT> \
{};

LZJSON_GEN_IO_CONCEPT(is_basic_input, is_basic_input_impl)
LZJSON_GEN_IO_CONCEPT(is_contiguous_input, is_contiguous_input_impl)

LZJSON_GEN_NT_IO_CONCEPT(is_nothrow_basic_input, is_basic_input_impl, is_nothrow_basic_input_impl)
LZJSON_GEN_NT_IO_CONCEPT(is_nothrow_contiguous_input, is_contiguous_input_impl, is_nothrow_contiguous_input_impl)

#undef LZJSON_GEN_IO_CONCEPT
#undef LZJSON_GEN_NT_IO_CONCEPT

}
}


// Describes a contiguous section of memory.
template <typename T>
struct memspan
{
    constexpr memspan(T* begin, T* end) noexcept :
        begin(begin), end(end)
    {}

    template <typename U,
        // Check if U* is implicitly convertible to T*
        // via cv-qualification conversion only
        // https://stackoverflow.com/questions/42992663/
        iutil::enable_if_t<std::is_convertible<U(*)[], T(*)[]>::value> = 0
    >
    constexpr memspan(const memspan<U>& rhs) noexcept :
        begin(rhs.begin), end(rhs.end)
    {}

    inline std::size_t size(void) const noexcept
    {
        return (std::size_t)(end - begin);
    }

    T* begin;
    // Always one past the last element.
    T* end;
};

}

#endif
