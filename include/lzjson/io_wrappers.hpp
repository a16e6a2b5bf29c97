#ifndef LZJSON_IO_WRAPPERS_HPP
#define LZJSON_IO_WRAPPERS_HPP

#include <cstddef>
#include <type_traits>
#include <istream>
#include <iterator>

#include "internal/core.hpp"


namespace lzjson {

// Wraps a std::basic_istream.
// Respects the user's exception mask.
// 
template <typename StdIstream = std::istream>
class std_istream_wrapper
{
private:
    using Traits = typename StdIstream::traits_type;

public:
    using char_type = typename StdIstream::char_type;
    using size_type = iutil::make_unsigned_t<std::streamoff>;
    using input_kind = io_basic;
    using underlying_type = StdIstream;

public:
    std_istream_wrapper(StdIstream& is) :
        m_is(is)
    {}

    std_istream_wrapper(std_istream_wrapper&&) = default;
    std_istream_wrapper(const std_istream_wrapper&) = default;

    std_istream_wrapper& operator=(std_istream_wrapper&&) = delete;
    std_istream_wrapper& operator=(const std_istream_wrapper&) = delete;

    // Get character. If end(), behavior is undefined.
    inline char_type peek(void) { return Traits::to_char_type(m_is.peek()); }

    // Extract character. If end(), behavior is undefined.
    inline char_type take(void)
    {
        ++m_pos;
        return Traits::to_char_type(m_is.get());
    }

    // Get input position, relative to where the wrapper started.
    // Counted rather than queried, since tellg() fails once eofbit is set.
    inline size_type ipos(void) const noexcept { return m_pos; }

    // True if input has run out of characters.
    // eof() is only set after a failed read, so look ahead instead.
    inline bool end(void) { return Traits::eq_int_type(m_is.peek(), Traits::eof()); }

    // Jump to the beginning of the input.
    inline void rewind(void)
    {
        m_is.clear();
        m_is.seekg(0);
        m_pos = 0;
    }

private:
    StdIstream& m_is;
    size_type m_pos = 0;
};


//
// Input over an iterator range.
// ------------------------
// Implements BasicInput.
// ------------------------
// rewind() requires a forward iterator.
//
template <typename InputIt>
class basic_in_iter
{
public:
    using char_type = typename std::iterator_traits<InputIt>::value_type;
    using size_type = std::size_t;
    using input_kind = io_basic;

public:
    basic_in_iter(InputIt first, InputIt last) :
        m_begin(first), m_cur(first), m_end(last), m_pos(0)
    {}

    basic_in_iter(basic_in_iter&&) = default;
    basic_in_iter(const basic_in_iter&) = delete;

    basic_in_iter& operator=(basic_in_iter&&) = default;
    basic_in_iter& operator=(const basic_in_iter&) = delete;

    // Get char. If end(), behavior is undefined.
    inline char_type peek(void) const { return *m_cur; }

    // Extract char. If end(), behavior is undefined.
    inline char_type take(void)
    {
        char_type c = *m_cur;
        ++m_cur;
        ++m_pos;
        return c;
    }

    // True if input has run out of characters.
    inline bool end(void) const { return m_cur == m_end; }

    // Jump to the beginning.
    inline void rewind(void)
    {
        m_cur = m_begin;
        m_pos = 0;
    }

    // Get input position.
    inline size_type ipos(void) const noexcept { return m_pos; }

private:
    InputIt m_begin;
    InputIt m_cur;
    InputIt m_end;
    size_type m_pos;
};

template <typename InputIt>
inline basic_in_iter<InputIt> make_in_iter(InputIt first, InputIt last)
{
    return basic_in_iter<InputIt>(first, last);
}


// Streams are wrapped, any other input is used by reference.
template <typename T>
using wrap_input_t = typename std::conditional<
    iutil::inherits_std_basic_istream<T>::value, std_istream_wrapper<T>, T&>::type;

}
#endif
