#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "lzjson/io_string.hpp"
#include "lzjson/reader.hpp"
#include "lzjson/utility.hpp"

#include "tests.hpp"

using namespace lzjson;

// Contents of the only string in a one-element array.
static std::string first_string(const std::string& doc)
{
    return parse(doc).at(0).get<std::string>();
}

static void test_escapes(void)
{
    assert(first_string(R"(["\u0041"])") == "A");
    assert(first_string(R"(["\n\t\\\\"])") == "\n\t\\\\");
    assert(first_string(R"(["\u005c"])") == "\\");
    assert(first_string(R"(["\"\/\b\f\r"])") == "\"/\b\f\r");
    assert(first_string(R"(["\u00e9\u20AC"])") == "\xC3\xA9\xE2\x82\xAC");
    assert(first_string(R"(["x\"y\u00E9z"])") == "x\"y\xC3\xA9z");

    // raw non-ASCII passes through
    assert(first_string("[\"\xC3\xA9t\xC3\xA9\"]") == "\xC3\xA9t\xC3\xA9");

    // surrogate pairs are decoded one escape at a time
    assert(first_string(R"(["\uD83D\uDE00"])") == "\xED\xA0\xBD\xED\xB8\x80");

    in_u32str u32(U"[\"\\uD83D\\uDE00\"]");
    reader<in_u32str> rd(u32);
    auto t = rd.root().as_elements().front().as_string().whole();
    assert(!t.is_borrowed());
    assert(t.size() == 2 && t[0] == 0xD83D && t[1] == 0xDE00);
}

static void test_escape_widths(void)
{
    in_str is(R"(["a\n\u0042"])");
    reader<in_str> rd(is);
    auto arr = rd.root().as_elements();
    auto s = arr.front().as_string();

    std::vector<char32_t> cps;
    std::vector<unsigned> widths;
    while (!s.empty())
    {
        cps.push_back(s.front());
        widths.push_back(s.escape_width());
        s.advance();
    }
    assert((cps == std::vector<char32_t>{ U'a', U'\n', U'B' }));
    assert((widths == std::vector<unsigned>{ 0, 1, 5 }));
    assert(throws<std::logic_error>([&] { s.advance(); }));

    arr.advance();
    assert(arr.empty());
}

static void test_zero_copy(void)
{
    std::string doc = R"(["hello world", "", "ab\ncd", "abc"])";
    in_str is(doc);
    reader<in_str> rd(is);
    auto arr = rd.root().as_elements();

    auto t1 = arr.front().as_string().whole();
    assert(t1.is_borrowed());
    assert(t1.data() == doc.data() + 2);
    assert(t1.size() == 11);
    assert(t1 == "hello world");
    arr.advance();

    // empty string borrows the closing quote position
    auto t2 = arr.front().as_string().whole();
    assert(t2.is_borrowed() && t2.empty());
    assert(t2.data() == doc.data() + 17);
    arr.advance();

    // escapes force a copy
    auto t3 = arr.front().as_string().whole();
    assert(!t3.is_borrowed());
    assert(t3 == "ab\ncd");
    arr.advance();

    // whole() returns what is left
    auto s4 = arr.front().as_string();
    assert(s4.front() == U'a');
    s4.advance();
    auto t4 = s4.whole();
    assert(t4.is_borrowed() && t4 == "bc");
    assert(t4.data() == doc.data() + 32);
    arr.advance();
    assert(arr.empty());

    // copies survive the input
    basic_text<char> copy(t3);
    assert(copy == t3 && copy.data() != t3.data());
    basic_text<char> moved(std::move(copy));
    assert(moved == "ab\ncd");
}

static void test_release(void)
{
    std::string doc = R"(["a\tabcdefghijklmnopqrstuvwxyz0123456789", "plain"])";
    in_str is(doc);
    reader<in_str> rd(is);
    auto arr = rd.root().as_elements();

    // an owned buffer is handed over, not copied
    auto t1 = arr.front().as_string().whole();
    assert(!t1.is_borrowed());
    const char* owned = t1.data();
    std::string s1 = std::move(t1).str();
    assert(s1 == "a\tabcdefghijklmnopqrstuvwxyz0123456789");
    // longer than any small-string buffer
    assert(s1.data() == owned);
    assert(t1.empty() && t1.data() == nullptr);
    arr.advance();

    // a view is copied and stays valid
    auto t2 = arr.front().as_string().whole();
    assert(t2.is_borrowed());
    std::string s2 = std::move(t2).str();
    assert(s2 == "plain");
    assert(t2.is_borrowed() && t2 == "plain");
    arr.advance();
    assert(arr.empty());

    // same result through whole()
    assert(parse(doc).at(0).get<std::string>() == "a\tabcdefghijklmnopqrstuvwxyz0123456789");
}

static void test_not_sliceable(void)
{
    std::istringstream ss(R"(["plain"])");
    reader<std::istringstream> rd(ss);
    auto arr = rd.root().as_elements();
    auto t = arr.front().as_string().whole();
    assert(!t.is_borrowed());
    assert(t == "plain");
}

static void test_string_errors(void)
{
    assert(error_of([] { first_string(R"(["\x"])"); }) == ERROR_str_escape);
    assert(error_of([] { first_string(R"(["\u12"])"); }) == ERROR_str_unicode);
    assert(error_of([] { first_string(R"(["\u12G4"])"); }) == ERROR_str_unicode);
    assert(error_of([] { first_string(R"(["\u12)"); }) == ERROR_str_unicode);
    assert(error_of([] { first_string(R"(["abc)"); }) == ERROR_str_delim);
    assert(error_of([] { first_string(R"(["abc\)"); }) == ERROR_str_delim);
    assert(error_of([] { first_string("[\"a\tb\"]"); }) == ERROR_str_ctrl);
    assert(error_of([] { first_string("[\"a\nb\"]"); }) == ERROR_str_ctrl);

    try {
        first_string(R"(["ab\q"])");
        assert(false);
    }
    catch (const parse_error& e) {
        assert(e.code() == ERROR_str_escape);
        assert(e.has_code_point() && e.code_point() == U'q');
        assert(e.offset() == 5);
    }
}

void test_string(void)
{
    test_escapes();
    test_escape_widths();
    test_zero_copy();
    test_release();
    test_not_sliceable();
    test_string_errors();
}
