#ifndef LZJSON_VALUE_HPP
#define LZJSON_VALUE_HPP

#include <cstddef>
#include <utility>
#include <string>
#include <vector>
#include <stdexcept>
#include <initializer_list>
#include <type_traits>
#include <unordered_map>

#include "internal/config.hpp"
#include "internal/core.hpp"

namespace lzjson {

class value;
class object;

using array = std::vector<value>;

// Fully materialized JSON value.
// Owns its children; there are no back-references.
class value final
{
public:
    enum type_t : int
    {
        TYPE_boolean,
        TYPE_number,
        TYPE_text,
        TYPE_array,
        TYPE_object,
        TYPE_null
    };

public:
    value(void) noexcept : m_type(TYPE_null) {}
    value(std::nullptr_t) noexcept : m_type(TYPE_null) {}

    value(bool b) noexcept : m_bool(b), m_type(TYPE_boolean) {}

    template <typename T,
        iutil::enable_if_t<std::is_arithmetic<T>::value && !std::is_same<T, bool>::value> = 0>
    value(T num) noexcept : m_num((double)num), m_type(TYPE_number) 
    {}

    value(std::string s) : m_str(iutil::alloc_new<std::string>(std::move(s))), m_type(TYPE_text) {}
    value(const char* s) : m_str(iutil::alloc_new<std::string>(s)), m_type(TYPE_text) {}

    value(array arr) : m_arr(iutil::alloc_new<array>(std::move(arr))), m_type(TYPE_array) {}
    inline value(object obj);

    inline value(const value& rhs);

    value(value&& rhs) noexcept : m_type(rhs.m_type)
    {
        steal(rhs);
    }

    value& operator=(value rhs) noexcept
    {
        destroy();
        m_type = rhs.m_type;
        steal(rhs);
        return *this;
    }

    ~value() { destroy(); }

    // Get type.
    inline type_t type(void) const noexcept { return m_type; }

    inline bool is_null(void) const noexcept { return m_type == TYPE_null; }
    inline bool is_bool(void) const noexcept { return m_type == TYPE_boolean; }
    inline bool is_number(void) const noexcept { return m_type == TYPE_number; }
    inline bool is_text(void) const noexcept { return m_type == TYPE_text; }
    inline bool is_array(void) const noexcept { return m_type == TYPE_array; }
    inline bool is_object(void) const noexcept { return m_type == TYPE_object; }

    // Get value.
    // Throws if active type is not T.
    template <typename T>
    inline const T& get(void) const;

    // Gets value if active type is T, else returns nullptr.
    template <typename T>
    inline const T* get_if(void) const noexcept;

    // Member of an object.
    // Throws std::logic_error if not an object,
    // std::out_of_range if there is no such key.
    inline const value& at(const std::string& key) const;

    // Element of an array.
    // Throws std::logic_error if not an array,
    // std::out_of_range if i is out of bounds.
    inline const value& at(std::size_t i) const;

    // Number of elements/members. 0 for scalars.
    inline std::size_t size(void) const noexcept;

    friend inline bool operator==(const value& lhs, const value& rhs);

    friend inline bool operator!=(const value& lhs, const value& rhs) { return !(lhs == rhs); }

private:
    inline void destroy(void) noexcept;

    inline void steal(value& rhs) noexcept
    {
        switch (m_type)
        {
        case TYPE_boolean: m_bool = rhs.m_bool; break;
        case TYPE_number: m_num = rhs.m_num; break;
        case TYPE_text: m_str = rhs.m_str; break;
        case TYPE_array: m_arr = rhs.m_arr; break;
        case TYPE_object: m_obj = rhs.m_obj; break;
        default: break;
        }
        rhs.m_type = TYPE_null;
    }

private:
    // Heap payloads are owned by exactly one value and
    // freed only by destroy().
    union
    {
        bool m_bool;
        double m_num;
        std::string* m_str;
        array* m_arr;
        object* m_obj;
    };
    type_t m_type;

    template <typename T>
    struct typehelper 
    {
        static constexpr int typeidx = -1;
    };
};

//
// JSON object.
// ------------------------
// Members keep the order in which their keys first
// appeared. Assigning to an existing key replaces
// its value in place. Keys are indexed, so lookup and
// insertion take constant time on average.
//
// Equality ignores member order.
//
class object final
{
public:
    using value_type = std::pair<std::string, value>;
    using container_type = std::vector<value_type>;
    using const_iterator = container_type::const_iterator;
    using size_type = std::size_t;

public:
    object(void) = default;

    object(std::initializer_list<value_type> init)
    {
        for (auto& kv : init)
            insert_or_assign(kv.first, kv.second);
    }

    inline size_type size(void) const noexcept { return m_items.size(); }
    inline bool empty(void) const noexcept { return m_items.empty(); }

    // Keys are read-only; assign through operator[] or insert_or_assign().
    inline const_iterator begin(void) const noexcept { return m_items.begin(); }
    inline const_iterator end(void) const noexcept { return m_items.end(); }

    inline const_iterator find(const std::string& key) const
    {
        auto it = m_index.find(key);
        return it == m_index.end() ? m_items.end() : m_items.begin() + it->second;
    }

    inline bool contains(const std::string& key) const
    {
        return m_index.find(key) != m_index.end();
    }

    // Throws std::out_of_range if there is no such key.
    inline const value& at(const std::string& key) const
    {
        auto it = m_index.find(key);
        if (it == m_index.end())
            throw std::out_of_range("object::at: No such key: \"" + key + "\".");
        return m_items[it->second].second;
    }

    // Inserts null if there is no such key.
    inline value& operator[](const std::string& key)
    {
        auto it = m_index.find(key);
        if (it != m_index.end())
            return m_items[it->second].second;
        append(key, value());
        return m_items.back().second;
    }

    // Returns true if the key was inserted, false if assigned.
    inline bool insert_or_assign(std::string key, value val)
    {
        auto it = m_index.find(key);
        if (it != m_index.end())
        {
            m_items[it->second].second = std::move(val);
            return false;
        }
        append(std::move(key), std::move(val));
        return true;
    }

    friend inline bool operator==(const object& lhs, const object& rhs)
    {
        if (lhs.size() != rhs.size())
            return false;

        for (const auto& kv : lhs.m_items)
        {
            auto it = rhs.find(kv.first);
            if (it == rhs.end() || it->second != kv.second)
                return false;
        }
        return true;
    }

    friend inline bool operator!=(const object& lhs, const object& rhs) { return !(lhs == rhs); }

private:
    inline void append(std::string key, value val)
    {
        m_items.emplace_back(std::move(key), std::move(val));
        try {
            m_index.emplace(m_items.back().first, m_items.size() - 1);
        }
        catch (...) {
            m_items.pop_back();
            throw;
        }
    }

private:
    container_type m_items;
    // key -> position in m_items
    std::unordered_map<std::string, size_type> m_index;
};


template <> struct value::typehelper<bool> 
{
    static constexpr int typeidx = TYPE_boolean;
    static inline const bool* cptr(const value& v) noexcept { return &v.m_bool; }
};
template <> struct value::typehelper<double> 
{
    static constexpr int typeidx = TYPE_number;
    static inline const double* cptr(const value& v) noexcept { return &v.m_num; }
};
template <> struct value::typehelper<std::string> 
{
    static constexpr int typeidx = TYPE_text;
    static inline const std::string* cptr(const value& v) noexcept { return v.m_str; }
};
template <> struct value::typehelper<array> 
{
    static constexpr int typeidx = TYPE_array;
    static inline const array* cptr(const value& v) noexcept { return v.m_arr; }
};
template <> struct value::typehelper<object> 
{
    static constexpr int typeidx = TYPE_object;
    static inline const object* cptr(const value& v) noexcept { return v.m_obj; }
};


inline value::value(object obj) : m_obj(iutil::alloc_new<object>(std::move(obj))), m_type(TYPE_object) {}

inline value::value(const value& rhs) : m_type(rhs.m_type)
{
    switch (m_type)
    {
    case TYPE_boolean: m_bool = rhs.m_bool; break;
    case TYPE_number: m_num = rhs.m_num; break;
    case TYPE_text: m_str = iutil::alloc_new<std::string>(*rhs.m_str); break;
    case TYPE_array: m_arr = iutil::alloc_new<array>(*rhs.m_arr); break;
    case TYPE_object: m_obj = iutil::alloc_new<object>(*rhs.m_obj); break;
    default: break;
    }
}

inline void value::destroy(void) noexcept
{
    switch (m_type)
    {
    case TYPE_text: iutil::alloc_delete(m_str); break;
    case TYPE_array: iutil::alloc_delete(m_arr); break;
    case TYPE_object: iutil::alloc_delete(m_obj); break;
    default: break;
    }
    m_type = TYPE_null;
}

template <typename T>
inline const T& value::get(void) const
{
    if (typehelper<T>::typeidx != m_type)
        throw std::logic_error(std::string(__func__) + ": Active type is not T.");

    return *typehelper<T>::cptr(*this);
}

template <typename T>
inline const T* value::get_if(void) const noexcept
{
    return typehelper<T>::typeidx == m_type ?
        typehelper<T>::cptr(*this) : nullptr;
}

inline const value& value::at(const std::string& key) const
{
    return get<object>().at(key);
}

inline const value& value::at(std::size_t i) const
{
    return get<array>().at(i);
}

inline std::size_t value::size(void) const noexcept
{
    switch (m_type)
    {
    case TYPE_array: return m_arr->size();
    case TYPE_object: return m_obj->size();
    default: return 0;
    }
}

inline bool operator==(const value& lhs, const value& rhs)
{
    if (lhs.m_type != rhs.m_type)
        return false;

    switch (lhs.m_type)
    {
    case value::TYPE_boolean: return lhs.m_bool == rhs.m_bool;
    case value::TYPE_number: return lhs.m_num == rhs.m_num;
    case value::TYPE_text: return *lhs.m_str == *rhs.m_str;
    case value::TYPE_array: return *lhs.m_arr == *rhs.m_arr;
    case value::TYPE_object: return *lhs.m_obj == *rhs.m_obj;
    default: return true;
    }
}

}

#endif
