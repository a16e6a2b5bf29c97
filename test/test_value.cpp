#include <cassert>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "lzjson/value.hpp"
#include "lzjson/utility.hpp"

#include "tests.hpp"

using namespace lzjson;

static void test_duplicates(void)
{
    value v = parse(R"({"x":1,"x":2})");
    assert(v.size() == 1);
    assert(v.at("x") == value(2));

    // first position, last value
    value w = parse(R"({"b": 1, "a": 2, "b": 3})");
    const object& obj = w.get<object>();
    std::vector<std::string> keys;
    for (const auto& kv : obj)
        keys.push_back(kv.first);
    assert((keys == std::vector<std::string>{ "b", "a" }));
    assert(obj.at("b") == value(3));
}

static void test_access(void)
{
    value v = parse(R"({"n": 1.5, "s": "str", "b": false, "z": null, "a": [1], "o": {}})");

    assert(v.at("n").is_number() && v.at("n").get<double>() == 1.5);
    assert(v.at("s").is_text() && v.at("s").get<std::string>() == "str");
    assert(v.at("b").is_bool() && !v.at("b").get<bool>());
    assert(v.at("z").is_null() && v.at("z").type() == value::TYPE_null);
    assert(v.at("a").is_array() && v.at("a").get<array>().size() == 1);
    assert(v.at("o").is_object() && v.at("o").get<object>().empty());

    assert(v.at("n").get_if<std::string>() == nullptr);
    assert(*v.at("n").get_if<double>() == 1.5);
    assert(v.at("s").get_if<std::string>()->size() == 3);

    assert(throws<std::logic_error>([&] { v.at("n").get<bool>(); }));
    assert(throws<std::logic_error>([&] { v.at("a").at("key"); }));
    assert(throws<std::logic_error>([&] { v.at(0); }));
    assert(throws<std::out_of_range>([&] { v.at("missing"); }));
    assert(throws<std::out_of_range>([&] { v.at("a").at(1); }));

    assert(v.at("s").size() == 0);
    assert(v.size() == 6);
}

static void test_copy_move(void)
{
    value v = parse(json2);
    value c = v;
    assert(c == v);

    value m = std::move(c);
    assert(m == v);
    assert(c.is_null());

    m = value("replaced");
    assert(m != v);
    assert(m.get<std::string>() == "replaced");

    m = v.at("web-app").at("taglib");
    assert(m.at("taglib-uri") == value("cofax.tld"));
}

static void test_construct(void)
{
    object o{ { "k", 1 }, { "l", "two" } };
    assert(o.size() == 2 && o.contains("l") && !o.contains("m"));
    assert(o.find("m") == o.end());

    o["m"];
    assert(o.at("m").is_null());
    assert(!o.insert_or_assign("k", true));
    assert(o.insert_or_assign("n", array{ 1, 2 }));
    assert(o.at("k") == value(true));

    value v(o);
    assert(v == parse(R"({"k": true, "l": "two", "m": null, "n": [1, 2]})"));
    // member order does not matter, values do
    assert(v == parse(R"({"l": "two", "k": true, "m": null, "n": [1, 2]})"));
    assert(v != parse(R"({"l": "two", "k": true, "m": null, "n": [2, 1]})"));
    assert(v != parse(R"({"k": true, "l": "two", "m": null})"));
    assert(v != parse(R"({"k": true, "l": "two", "m": null, "x": [1, 2]})"));

    assert(value() == value(nullptr));
    assert(value(1) != value(true));
    assert(value(0) != value());

    double nz = parse("[-0]").at(0).get<double>();
    assert(nz == 0 && std::signbit(nz));
}

static void test_large_object(void)
{
    const int n = 50000;

    std::string doc = "{";
    for (int i = 0; i < n; ++i)
    {
        if (i) doc += ", ";
        doc += "\"k" + std::to_string(i) + "\": " + std::to_string(i);
    }
    // repeats keep their first position
    doc += ", \"k0\": -1, \"k" + std::to_string(n - 1) + "\": -2}";

    value v = parse(doc);
    const object& obj = v.get<object>();
    assert(obj.size() == (std::size_t)n);
    assert(obj.begin()->first == "k0");
    assert(obj.at("k0") == value(-1));
    assert(obj.at("k1") == value(1));
    assert(obj.at("k" + std::to_string(n / 2)) == value(n / 2));
    assert(obj.at("k" + std::to_string(n - 1)) == value(-2));
    assert((obj.end() - 1)->first == "k" + std::to_string(n - 1));
    assert(!obj.contains("k" + std::to_string(n)));

    object copy = obj;
    copy["extra"] = value(true);
    assert(copy.size() == obj.size() + 1);
    assert(copy.find("extra") == copy.end() - 1);
    assert(copy != obj);
}

static void test_reassign(void)
{
    value v = parse(R"({"a": "text", "b": [1, {"c": "d"}]})");
    value w;

    // every payload kind replaced by every other
    w = v.at("a");
    w = v.at("b");
    w = v;
    w = value(2.5);
    w = v.at("b").at(1);
    assert(w.at("c") == value("d"));
    const value& self = w;
    w = self;
    assert(w.at("c") == value("d"));
    w = value();
    assert(w.is_null());

    value u(std::move(v));
    assert(v.is_null() && u.size() == 2);
    v = std::move(u);
    assert(u.is_null() && v.at("a") == value("text"));
}

void test_value(void)
{
    test_duplicates();
    test_access();
    test_copy_move();
    test_construct();
    test_large_object();
    test_reassign();
}
