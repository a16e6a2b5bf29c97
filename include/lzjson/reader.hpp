#ifndef LZJSON_READER_HPP
#define LZJSON_READER_HPP

#include <cstddef>
#include <stdexcept>
#include <type_traits>

#include "internal/config.hpp"
#include "internal/core.hpp"

#include "io_wrappers.hpp"
#include "codepoint_input.hpp"
#include "cursor.hpp"

namespace lzjson {

//
// Lazy JSON reader.
// ------------------------
// Decodes Input (see concepts.hpp) into code points and hands
// out cursors over it. Input must outlive the reader, and
// the reader must outlive every cursor made from it.
//
// The document root must be an object or an array.
//
template <typename Input>
class reader
{
public:
    using input_type = decode_input_t<wrap_input_t<Input>>;
    using unit_type = typename input_type::unit_type;
    using size_type = typename input_type::size_type;

    using value_cursor = lzjson::value_cursor<reader>;
    using member_cursor = lzjson::member_cursor<reader>;
    using object_cursor = lzjson::object_cursor<reader>;
    using array_cursor = lzjson::array_cursor<reader>;
    using string_cursor = lzjson::string_cursor<reader>;
    using number_cursor = lzjson::number_cursor<reader>;

public:
    // Throws parse_error if the first non-whitespace
    // character is not '{' or '['.
    explicit reader(Input& in) :
        m_is(in)
    {
        skip_ws();
        if (m_is.end())
            throw parse_error(m_is.ipos(), ERROR_root);

        char32_t c = m_is.peek();
        if (c != U'{' && c != U'[')
            throw parse_error(m_is.ipos(), ERROR_root, c);
    }

    reader(const reader&) = delete;
    reader& operator=(const reader&) = delete;

    // Skip space, \t, \n and \r.
    // Returns true if input has more characters.
    LZJSON_ALWAYS_INLINE bool skip_ws(void)
    {
        while (!m_is.end() && iutil::is_ws(m_is.peek())) {
            m_is.take();
        }
        return !m_is.end();
    }

    // Consume literal, character by character.
    template <std::size_t N>
    inline void expect(const char (&literal)[N])
    {
        static_assert(N > 1, "");

        for (std::size_t i = 0; i < N - 1; ++i)
        {
            if (m_is.end())
                throw parse_error(m_is.ipos(), ERROR_eof);

            char32_t c = m_is.peek();
            if (c != (char32_t)(unsigned char)literal[i])
                throw parse_error(m_is.ipos(), ERROR_literal, c, literal);
            m_is.take();
        }
    }

    // Cursor over the root value. Can be taken once.
    inline value_cursor root(void)
    {
        if (m_root_taken)
            throw std::logic_error("reader::root: Root was already taken.");

        m_root_taken = true;
        return value_cursor(*this);
    }

    // Skips trailing whitespace.
    // True if nothing else is left in the input.
    inline bool at_end(void) { return !skip_ws(); }

    // Offset of the next code point, in input units.
    inline size_type ipos(void) { return m_is.ipos(); }

    // Decoded input.
    inline input_type& in(void) noexcept { return m_is; }

private:
    template <typename> friend class lzjson::value_cursor;
    template <typename> friend class lzjson::member_cursor;
    template <typename> friend class lzjson::object_cursor;
    template <typename> friend class lzjson::array_cursor;
    template <typename> friend class lzjson::string_cursor;
    template <typename> friend class lzjson::number_cursor;

    // Call after an opening bracket was consumed.
    // Returns true if the container is empty (the closing
    // bracket is consumed as well).
    inline bool open_container(char32_t close)
    {
        if (m_depth >= LZJSON_MAX_DEPTH)
            throw parse_error(m_is.ipos(), ERROR_depth);

        ++m_depth;
        skip_ws();
        if (m_is.end())
            throw parse_error(m_is.ipos(), ERROR_eof);

        if (m_is.peek() == close)
        {
            m_is.take();
            --m_depth;
            return true;
        }
        return false;
    }

    // Consumes the ',' after a child, or the closing bracket.
    // Returns true if the container was closed.
    inline bool next_or_close(char32_t close, error e)
    {
        skip_ws();
        if (m_is.end())
            throw parse_error(m_is.ipos(), ERROR_eof);

        char32_t c = m_is.peek();
        if (c == U',')
        {
            m_is.take();
            skip_ws();
            return false;
        }
        else if (c == close)
        {
            m_is.take();
            --m_depth;
            return true;
        }
        else throw parse_error(m_is.ipos(), e, c);
    }

private:
    input_type m_is;
    // open containers
    unsigned m_depth = 0;
    // a string or number is being read
    bool m_scalar_open = false;
    // the last value cursor handed out was not consumed yet
    bool m_pending = false;
    bool m_root_taken = false;
};

}

#endif
