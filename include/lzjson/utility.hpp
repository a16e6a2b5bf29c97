
#ifndef LZJSON_UTILITY_HPP
#define LZJSON_UTILITY_HPP

#include <cstddef>
#include <istream>
#include <string>

#include "internal/config.hpp"
#include "internal/core.hpp"

#include "io_string.hpp"
#include "io_wrappers.hpp"
#include "reader.hpp"
#include "value.hpp"

#if LZJSON_HAS_STRING_VIEW
#include <string_view>
#endif


namespace lzjson {

// Read an entire document from any supported input.
// Only whitespace may follow the root value.
template <typename Input>
inline value parse_from(Input& in)
{
    reader<Input> rd(in);
    value res = rd.root().whole();

    if (!rd.at_end())
        throw parse_error(rd.ipos(), ERROR_trailing, rd.in().peek());
    return res;
}

inline value parse(const char* json, std::size_t len)
{
    in_str is(json, len);
    return parse_from(is);
}

inline value parse(const char* json)
{
    in_str is(json);
    return parse_from(is);
}

inline value parse(const std::string& json)
{
    in_str is(json);
    return parse_from(is);
}

#if LZJSON_HAS_STRING_VIEW
inline value parse(std::string_view json)
{
    in_str is(json);
    return parse_from(is);
}
#endif

inline value parse(std::istream& json)
{
    return parse_from(json);
}

}

#endif
