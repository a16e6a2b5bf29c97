#ifndef LZJSON_TEXT_HPP
#define LZJSON_TEXT_HPP

#include <cstddef>
#include <cstring>
#include <string>
#include <vector>
#include <utility>
#include <type_traits>

#include "internal/config.hpp"
#include "internal/core.hpp"
#include "internal/unicode.hpp"

namespace lzjson {

//
// Unescaped string contents, in the units of the input.
// ------------------------
// Either borrowed (a view into the input, which must 
// outlive it) or owned (a copy with escapes resolved).
//
template <typename Unit>
class basic_text
{
public:
    using unit_type = Unit;
    using size_type = std::size_t;
    // std::string for char, so str() can hand the buffer over
    using buffer_type = typename std::conditional<std::is_same<Unit, char>::value,
        std::string, std::vector<Unit>>::type;
    using const_iterator = const Unit*;

public:
    basic_text(void) noexcept :
        m_ptr(nullptr), m_size(0)
    {}

    explicit basic_text(buffer_type owned) :
        m_own(std::move(owned)), m_ptr(m_own.data()), m_size(m_own.size()), m_owned(true)
    {}

    // View into memory owned by someone else.
    static inline basic_text borrow(const Unit* ptr, size_type size) noexcept
    {
        basic_text res;
        res.m_ptr = ptr;
        res.m_size = size;
        return res;
    }

    basic_text(const basic_text& rhs) :
        m_own(rhs.m_own), m_ptr(rhs.m_owned ? m_own.data() : rhs.m_ptr),
        m_size(rhs.m_size), m_owned(rhs.m_owned)
    {}

    basic_text(basic_text&& rhs) noexcept :
        m_own(std::move(rhs.m_own)), m_ptr(rhs.m_owned ? m_own.data() : rhs.m_ptr),
        m_size(rhs.m_size), m_owned(rhs.m_owned)
    {
        rhs.m_ptr = nullptr;
        rhs.m_size = 0;
        rhs.m_owned = false;
    }

    basic_text& operator=(basic_text rhs) noexcept
    {
        m_own.swap(rhs.m_own);
        m_ptr = rhs.m_owned ? m_own.data() : rhs.m_ptr;
        m_size = rhs.m_size;
        m_owned = rhs.m_owned;
        return *this;
    }

    inline const Unit* data(void) const noexcept { return m_ptr; }

    inline size_type size(void) const noexcept { return m_size; }

    inline bool empty(void) const noexcept { return m_size == 0; }

    // True if this is a view into the input.
    inline bool is_borrowed(void) const noexcept { return !m_owned && m_ptr; }

    inline const_iterator begin(void) const noexcept { return m_ptr; }

    inline const_iterator end(void) const noexcept { return m_ptr + m_size; }

    inline Unit operator[](size_type i) const noexcept { return m_ptr[i]; }

    // Copy as UTF-8.
    inline std::string str(void) const &
    {
        std::string res;
        append_to(res);
        return res;
    }

    // As UTF-8. Moves an owned char buffer instead of copying it.
    inline std::string str(void) &&
    {
        return release(std::is_same<buffer_type, std::string>());
    }

    friend inline bool operator==(const basic_text& lhs, const basic_text& rhs) noexcept
    {
        if (lhs.m_size != rhs.m_size)
            return false;
        for (size_type i = 0; i < lhs.m_size; ++i)
            if (lhs.m_ptr[i] != rhs.m_ptr[i])
                return false;
        return true;
    }

    friend inline bool operator!=(const basic_text& lhs, const basic_text& rhs) noexcept
    {
        return !(lhs == rhs);
    }

private:
    inline std::string release(std::true_type)
    {
        if (!m_owned)
            return str();

        std::string res = std::move(m_own);
        m_own.clear();
        m_ptr = nullptr;
        m_size = 0;
        m_owned = false;
        return res;
    }

    inline std::string release(std::false_type) const { return str(); }

    template <typename U = Unit, iutil::enable_if_t<iutil::is_char8_like<U>::value> = 0>
    inline void append_to(std::string& out) const
    {
        out.append(reinterpret_cast<const char*>(m_ptr), m_size);
    }

    template <typename U = Unit, iutil::enable_if_t<!iutil::is_char8_like<U>::value> = 0>
    inline void append_to(std::string& out) const
    {
        out.reserve(m_size);
        for (size_type i = 0; i < m_size; ++i)
            iutil::put_utf8(out, (char32_t)m_ptr[i]);
    }

private:
    buffer_type m_own;
    const Unit* m_ptr;
    size_type m_size;
    bool m_owned = false;
};

// Compare with a NUL-terminated UTF-8 string.
template <typename Unit>
inline bool operator==(const basic_text<Unit>& lhs, const char* rhs)
{
    return lhs.str() == rhs;
}

template <typename Unit>
inline bool operator!=(const basic_text<Unit>& lhs, const char* rhs)
{
    return !(lhs == rhs);
}

using text = basic_text<char>;

}

#endif
