#include <cassert>
#include <cmath>
#include <sstream>
#include <string>

#include "lzjson/io_string.hpp"
#include "lzjson/reader.hpp"
#include "lzjson/utility.hpp"

#include "tests.hpp"

using namespace lzjson;

// Value of a number literal, read in place.
static double num(const std::string& lit)
{
    return parse("[" + lit + "]").at(0).get<double>();
}

// Value of a number literal, read from a stream.
static double num_stream(const std::string& lit)
{
    std::istringstream ss("[" + lit + "]");
    return parse(ss).at(0).get<double>();
}

// Value of a number literal, read from code points.
static double num_u32(const std::u32string& lit)
{
    std::u32string doc = U"[" + lit + U"]";
    in_u32str is(doc);
    reader<in_u32str> rd(is);
    return rd.root().as_elements().front().as_number().whole();
}

static void test_grammar(void)
{
    assert(num("0") == 0);
    assert(num("7") == 7);
    assert(num("-12") == -12);
    assert(num("3.25") == 3.25);
    assert(num("1.5e+10") == 1.5e+10);
    assert(num("1.5E-10") == 1.5E-10);
    assert(num("1e10") == 1e10);
    assert(num("0.5e3") == 500);
    assert(num("-544.3") == -544.3);

    double nz = num("-0.0");
    assert(nz == 0 && std::signbit(nz));
    nz = num("-0");
    assert(nz == 0 && std::signbit(nz));

    assert(num_stream("-2.5e-3") == -2.5e-3);
    assert(num_stream("0") == 0);
    assert(num_u32(U"6.125E2") == 612.5);

    assert(error_of([] { num("01"); }) == ERROR_num_leading_zero);
    assert(error_of([] { num("-01"); }) == ERROR_num_leading_zero);
    assert(error_of([] { num("-"); }) == ERROR_num_digit);
    assert(error_of([] { num("-a"); }) == ERROR_num_digit);
    assert(error_of([] { num("1."); }) == ERROR_num_digit);
    assert(error_of([] { num("1.e5"); }) == ERROR_num_digit);
    assert(error_of([] { num("1.5e"); }) == ERROR_num_digit);
    assert(error_of([] { num("1e+"); }) == ERROR_num_digit);
    assert(error_of([] { num("1e-x"); }) == ERROR_num_digit);
    assert(error_of([] { num_stream("01"); }) == ERROR_num_leading_zero);
    assert(error_of([] { num_stream("1.5e"); }) == ERROR_num_digit);

    // the literal ends at the first character that cannot continue it
    assert(error_of([] { num("1x"); }) == ERROR_token_end_array);
    assert(error_of([] { num("1.5.2"); }) == ERROR_token_end_array);
    assert(error_of([] { num("+1"); }) == ERROR_value);
    assert(error_of([] { num(".5"); }) == ERROR_value);

    // cut off by end of input
    assert(error_of([] { parse("[1."); }) == ERROR_num_digit);
    assert(error_of([] { parse("[1e"); }) == ERROR_num_digit);
    assert(error_of([] { parse("[12"); }) == ERROR_eof);
}

static void test_stepping(void)
{
    std::string doc = "[-12.50e+3, 9007199254740993]";
    in_str is(doc);
    reader<in_str> rd(is);
    auto arr = rd.root().as_elements();

    auto n = arr.front().as_number();
    std::string chars;
    while (!n.empty())
    {
        chars.push_back((char)n.front());
        n.advance();
    }
    assert(chars == "-12.50e+3");
    assert(throws<std::logic_error>([&] { n.advance(); }));
    assert(throws<std::logic_error>([&] { n.whole(); }));
    arr.advance();

    // exact text survives for callers that need integers
    assert(arr.front().as_number().whole_text() == "9007199254740993");
    arr.advance();
    assert(arr.empty());
}

static void test_range(void)
{
    assert(error_of([] { num("1e400"); }) == ERROR_out_of_range);
    assert(error_of([] { num("-1e400"); }) == ERROR_out_of_range);
    assert(error_of([] { num_stream("1e400"); }) == ERROR_out_of_range);
    assert(num("1.7976931348623157e308") == 1.7976931348623157e308);
    // underflow is not an error
    assert(num("1e-400") == 0);
    assert(num("-1e-400") == 0);

    try {
        parse("[0, 2e999]");
        assert(false);
    }
    catch (const parse_error& e) {
        assert(e.code() == ERROR_out_of_range);
        assert(e.offset() == 4);
    }
}

void test_number(void)
{
    test_grammar();
    test_stepping();
    test_range();
}
