//
// Lazy cursors over JSON values, objects and arrays.
//
// All cursors made from one reader share its input position.
// A child cursor must be drained before its parent can move
// on; misuse throws std::logic_error.
//

#ifndef LZJSON_CURSOR_HPP
#define LZJSON_CURSOR_HPP

#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <stdexcept>

#include "internal/config.hpp"
#include "internal/core.hpp"
#include "string_cursor.hpp"
#include "number_cursor.hpp"
#include "value.hpp"

namespace lzjson {

template <typename Reader> class value_cursor;
template <typename Reader> class member_cursor;
template <typename Reader> class object_cursor;
template <typename Reader> class array_cursor;

namespace internal {

// Input iterator over an object or array cursor.
// Dereferencing yields the current child; incrementing advances.
template <typename Cursor, typename Item>
class container_iterator
{
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Item;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Item;

public:
    container_iterator(Cursor* c = nullptr) noexcept : m_c(c) {}

    inline Item operator*() const { return m_c->front(); }

    inline container_iterator& operator++()
    {
        m_c->advance();
        return *this;
    }

    friend inline bool operator==(const container_iterator& lhs, const container_iterator& rhs) noexcept
    {
        return lhs.done() == rhs.done();
    }

    friend inline bool operator!=(const container_iterator& lhs, const container_iterator& rhs) noexcept
    {
        return !(lhs == rhs);
    }

private:
    inline bool done(void) const noexcept { return !m_c || m_c->empty(); }

    Cursor* m_c;
};

}


//
// Cursor over a JSON value whose type is known
// but whose contents have not been read yet.
// 
// Consume it exactly once: narrow it with one of the as_*() 
// functions (and drain the result), or call whole().
//
template <typename Reader>
class value_cursor
{
public:
    using type_t = value::type_t;

public:
    // Classifies the value at the current position,
    // without consuming anything.
    explicit value_cursor(Reader& rd) :
        m_rd(&rd)
    {
        auto& is = rd.in();
        if (is.end())
            throw parse_error(is.ipos(), ERROR_eof);

        char32_t c = is.peek();
        switch (c)
        {
        case U'{': m_type = value::TYPE_object; break;
        case U'[': m_type = value::TYPE_array; break;
        case U'"': m_type = value::TYPE_text; break;
        case U't':
        case U'f': m_type = value::TYPE_boolean; break;
        case U'n': m_type = value::TYPE_null; break;
        case U'-': m_type = value::TYPE_number; break;
        default:
            if (iutil::is_digit(c))
                m_type = value::TYPE_number;
            else
                throw parse_error(is.ipos(), ERROR_value, c);
        }

        m_rd->m_pending = true;
    }

    value_cursor(value_cursor&& rhs) noexcept :
        m_rd(rhs.m_rd), m_type(rhs.m_type), m_used(rhs.m_used)
    {
        rhs.m_rd = nullptr;
    }

    value_cursor(const value_cursor&) = delete;
    value_cursor& operator=(const value_cursor&) = delete;
    value_cursor& operator=(value_cursor&&) = delete;

    inline type_t type(void) const noexcept { return m_type; }

    inline bool is_object(void) const noexcept { return m_type == value::TYPE_object; }
    inline bool is_array(void) const noexcept { return m_type == value::TYPE_array; }
    inline bool is_string(void) const noexcept { return m_type == value::TYPE_text; }
    inline bool is_number(void) const noexcept { return m_type == value::TYPE_number; }
    inline bool is_bool(void) const noexcept { return m_type == value::TYPE_boolean; }
    inline bool is_null(void) const noexcept { return m_type == value::TYPE_null; }

    inline string_cursor<Reader> as_string(void)
    {
        consume(value::TYPE_text, "as_string");
        return string_cursor<Reader>(*m_rd);
    }

    inline number_cursor<Reader> as_number(void)
    {
        consume(value::TYPE_number, "as_number");
        return number_cursor<Reader>(*m_rd);
    }

    // Consumes the '{'.
    inline object_cursor<Reader> as_members(void)
    {
        consume(value::TYPE_object, "as_members");
        return object_cursor<Reader>(*m_rd);
    }

    // Consumes the '['.
    inline array_cursor<Reader> as_elements(void)
    {
        consume(value::TYPE_array, "as_elements");
        return array_cursor<Reader>(*m_rd);
    }

    // Reads the entire value.
    inline value whole(void)
    {
        switch (m_type)
        {
        case value::TYPE_object: return value(as_members().whole());
        case value::TYPE_array: return value(as_elements().whole());
        case value::TYPE_text: return value(as_string().whole().str());
        case value::TYPE_number: return value(as_number().whole());

        case value::TYPE_boolean:
            consume(value::TYPE_boolean, "whole");
            if (m_rd->in().peek() == U't')
            {
                m_rd->expect("true");
                return value(true);
            }
            m_rd->expect("false");
            return value(false);

        default:
            consume(value::TYPE_null, "whole");
            m_rd->expect("null");
            return value();
        }
    }

private:
    inline void consume(type_t type, const char* fn)
    {
        if (!m_rd)
            throw std::logic_error(std::string("value_cursor::") + fn + ": Cursor was moved from.");
        if (m_used)
            throw std::logic_error(std::string("value_cursor::") + fn + ": Value was already consumed.");
        if (m_type != type)
            throw std::logic_error(std::string("value_cursor::") + fn + ": Value has a different type.");

        m_used = true;
        m_rd->m_pending = false;
    }

private:
    Reader* m_rd;
    type_t m_type = value::TYPE_null;
    bool m_used = false;
};


//
// One member of an object.
// Read name() to the end before calling value().
//
template <typename Reader>
class member_cursor
{
public:
    explicit member_cursor(Reader& rd) noexcept :
        m_rd(&rd)
    {}

    member_cursor(member_cursor&& rhs) noexcept :
        m_rd(rhs.m_rd), m_name_taken(rhs.m_name_taken), m_value_taken(rhs.m_value_taken)
    {
        rhs.m_rd = nullptr;
    }

    member_cursor(const member_cursor&) = delete;
    member_cursor& operator=(const member_cursor&) = delete;
    member_cursor& operator=(member_cursor&&) = delete;

    inline string_cursor<Reader> name(void)
    {
        check("name");
        if (m_name_taken)
            throw std::logic_error("member_cursor::name: Name was already taken.");

        m_name_taken = true;
        return string_cursor<Reader>(*m_rd);
    }

    // Consumes the ':'.
    inline value_cursor<Reader> value(void)
    {
        check("value");
        if (!m_name_taken || m_rd->m_scalar_open)
            throw std::logic_error("member_cursor::value: Name was not consumed.");
        if (m_value_taken)
            throw std::logic_error("member_cursor::value: Value was already taken.");

        m_value_taken = true;
        m_rd->skip_ws();

        auto& is = m_rd->in();
        if (is.end())
            throw parse_error(is.ipos(), ERROR_eof);
        if (is.peek() != U':')
            throw parse_error(is.ipos(), ERROR_token_key_sep, is.peek());

        is.take();
        m_rd->skip_ws();
        return value_cursor<Reader>(*m_rd);
    }

    // Reads the name and the entire value.
    inline std::pair<std::string, lzjson::value> whole(void)
    {
        std::string key = name().whole().str();
        lzjson::value val = value().whole();
        return std::make_pair(std::move(key), std::move(val));
    }

private:
    inline void check(const char* fn) const
    {
        if (!m_rd)
            throw std::logic_error(std::string("member_cursor::") + fn + ": Cursor was moved from.");
    }

private:
    Reader* m_rd;
    bool m_name_taken = false;
    bool m_value_taken = false;
};


//
// Single-pass sequence of the members of an object.
// ------------------------
// front() gives the current member, advance() moves past
// the following ',' or the closing '}'. The current member
// must be fully consumed before advancing.
//
template <typename Reader>
class object_cursor
{
public:
    using iterator = internal::container_iterator<object_cursor, member_cursor<Reader>>;

public:
    // Must be positioned on the '{'.
    explicit object_cursor(Reader& rd) :
        m_rd(&rd)
    {
        LZJSON_ASSERT(!rd.in().end() && rd.in().peek() == U'{');
        rd.in().take();
        m_level = rd.m_depth + 1;
        m_empty = rd.open_container(U'}');
    }

    object_cursor(object_cursor&& rhs) noexcept :
        m_rd(rhs.m_rd), m_level(rhs.m_level), m_empty(rhs.m_empty), m_front_taken(rhs.m_front_taken)
    {
        rhs.m_rd = nullptr;
    }

    object_cursor(const object_cursor&) = delete;
    object_cursor& operator=(const object_cursor&) = delete;
    object_cursor& operator=(object_cursor&&) = delete;

    // True once the closing '}' was consumed.
    inline bool empty(void) const noexcept { return m_empty; }

    // Current member. Can be taken once per member.
    inline member_cursor<Reader> front(void)
    {
        if (!m_rd)
            throw std::logic_error("object_cursor::front: Cursor was moved from.");
        if (m_empty)
            throw std::logic_error("object_cursor::front: Object is exhausted.");
        if (m_front_taken)
            throw std::logic_error("object_cursor::front: Member was already taken.");

        m_front_taken = true;
        m_rd->m_pending = true;
        return member_cursor<Reader>(*m_rd);
    }

    inline void advance(void)
    {
        if (!m_rd)
            throw std::logic_error("object_cursor::advance: Cursor was moved from.");
        if (m_empty)
            throw std::logic_error("object_cursor::advance: Object is exhausted.");
        if (!m_front_taken || m_rd->m_pending || m_rd->m_scalar_open || m_rd->m_depth != m_level)
            throw std::logic_error("object_cursor::advance: Member was not consumed.");

        m_front_taken = false;
        m_empty = m_rd->next_or_close(U'}', ERROR_token_end_object);
    }

    // Reads the remaining members.
    // A later duplicate key replaces the earlier value.
    inline object whole(void)
    {
        object res;
        while (!m_empty)
        {
            auto kv = front().whole();
            res.insert_or_assign(std::move(kv.first), std::move(kv.second));
            advance();
        }
        return res;
    }

    inline iterator begin(void) noexcept { return iterator(this); }
    inline iterator end(void) noexcept { return iterator(); }

private:
    Reader* m_rd;
    unsigned m_level;
    bool m_empty = false;
    bool m_front_taken = false;
};


//
// Single-pass sequence of the elements of an array.
// ------------------------
// Same discipline as object_cursor.
//
template <typename Reader>
class array_cursor
{
public:
    using iterator = internal::container_iterator<array_cursor, value_cursor<Reader>>;

public:
    // Must be positioned on the '['.
    explicit array_cursor(Reader& rd) :
        m_rd(&rd)
    {
        LZJSON_ASSERT(!rd.in().end() && rd.in().peek() == U'[');
        rd.in().take();
        m_level = rd.m_depth + 1;
        m_empty = rd.open_container(U']');
    }

    array_cursor(array_cursor&& rhs) noexcept :
        m_rd(rhs.m_rd), m_level(rhs.m_level), m_empty(rhs.m_empty), m_front_taken(rhs.m_front_taken)
    {
        rhs.m_rd = nullptr;
    }

    array_cursor(const array_cursor&) = delete;
    array_cursor& operator=(const array_cursor&) = delete;
    array_cursor& operator=(array_cursor&&) = delete;

    // True once the closing ']' was consumed.
    inline bool empty(void) const noexcept { return m_empty; }

    // Current element. Can be taken once per element.
    inline value_cursor<Reader> front(void)
    {
        if (!m_rd)
            throw std::logic_error("array_cursor::front: Cursor was moved from.");
        if (m_empty)
            throw std::logic_error("array_cursor::front: Array is exhausted.");
        if (m_front_taken)
            throw std::logic_error("array_cursor::front: Element was already taken.");

        m_front_taken = true;
        return value_cursor<Reader>(*m_rd);
    }

    inline void advance(void)
    {
        if (!m_rd)
            throw std::logic_error("array_cursor::advance: Cursor was moved from.");
        if (m_empty)
            throw std::logic_error("array_cursor::advance: Array is exhausted.");
        if (!m_front_taken || m_rd->m_pending || m_rd->m_scalar_open || m_rd->m_depth != m_level)
            throw std::logic_error("array_cursor::advance: Element was not consumed.");

        m_front_taken = false;
        m_empty = m_rd->next_or_close(U']', ERROR_token_end_array);
    }

    // Reads the remaining elements.
    inline array whole(void)
    {
        array res;
        while (!m_empty)
        {
            res.push_back(front().whole());
            advance();
        }
        return res;
    }

    inline iterator begin(void) noexcept { return iterator(this); }
    inline iterator end(void) noexcept { return iterator(); }

private:
    Reader* m_rd;
    unsigned m_level;
    bool m_empty = false;
    bool m_front_taken = false;
};

}

#endif
