/// @file arguments.cpp
/// @brief Typed decoding of untyped tool arguments

#include "mcplink/exceptions.hpp"
#include "mcplink/tools/arguments.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcplink;
using namespace mcplink::tools;

template <typename Fn>
static std::string validation_message(Fn fn)
{
    try
    {
        fn();
    }
    catch (const ValidationError& e)
    {
        return e.what();
    }
    return "";
}

void test_required_values()
{
    std::cout << "Test 1: required accessors..." << std::endl;

    auto args = Arguments::from_json(
        Json{{"text", "hi"}, {"n", 42}, {"x", 2.5}, {"flag", true}, {"empty", ""}});

    assert(args.require_string("text") == "hi");
    assert(args.require_int("n") == 42);
    assert(args.require_number("x") == 2.5);
    assert(args.require_number("n") == 42.0);
    assert(args.require_bool("flag"));

    // Floats truncate toward zero through the integer accessor
    assert(args.require_int("x") == 2);
    auto neg = Arguments::from_json(Json{{"v", -2.9}});
    assert(neg.require_int("v") == -2);

    assert(validation_message([&] { args.require_string("absent"); }) ==
           "missing required field 'absent'");
    assert(validation_message([&] { args.require_string("empty"); }) ==
           "missing required field 'empty'");
    assert(validation_message([&] { args.require_int("text"); }) ==
           "field 'text' must be a number");
    assert(validation_message([&] { args.require_string("n"); }) ==
           "field 'n' must be a string");
    assert(validation_message([&] { args.require_bool("n"); }) ==
           "field 'n' must be a boolean");

    std::cout << "  [PASS] required values and errors" << std::endl;
}

void test_defaults()
{
    std::cout << "Test 2: default accessors never throw..." << std::endl;

    auto args = Arguments::from_json(Json{{"text", "hi"}, {"n", 42}, {"x", 7.9}});

    assert(args.string_default("text", "d") == "hi");
    assert(args.string_default("absent", "d") == "d");
    assert(args.string_default("n", "d") == "d"); // wrong type
    assert(args.int_default("n", 0) == 42);
    assert(args.int_default("x", 0) == 7);
    assert(args.int_default("text", 5) == 5);
    assert(args.number_default("absent", 1.5) == 1.5);
    assert(args.bool_default("absent", true));
    assert(!args.bool_default("n", false));

    std::cout << "  [PASS] fallbacks" << std::endl;
}

void test_presence()
{
    std::cout << "Test 3: has() tells provided from defaulted..." << std::endl;

    auto args = Arguments::from_json(Json{{"limit", 0}, {"nothing", nullptr}});
    assert(args.has("limit"));
    assert(args.int_default("limit", 10) == 0);
    assert(!args.has("offset"));
    assert(args.int_default("offset", 10) == 10);
    assert(args.has("nothing"));
    assert(args.get("nothing").is_null());
    assert(args.get("offset").is_null());
    assert(args.raw().size() == 2);

    std::cout << "  [PASS] presence" << std::endl;
}

void test_construction()
{
    std::cout << "Test 4: construction from JSON and text..." << std::endl;

    assert(Arguments::from_json(Json()).raw().empty());
    assert(Arguments::parse("").raw().empty());
    assert(Arguments::parse(R"({"a":1})").require_int("a") == 1);

    assert(!validation_message([] { Arguments::from_json(Json::array({1, 2})); }).empty());
    assert(!validation_message([] { Arguments::from_json(Json("text")); }).empty());
    assert(!validation_message([] { Arguments::parse("{oops"); }).empty());

    std::cout << "  [PASS] construction" << std::endl;
}

void test_out_of_range_integers()
{
    std::cout << "Test 5: numbers outside the int64 range are the wrong type..." << std::endl;

    auto args = Arguments::parse(
        R"({"limit":1e20,"floor":-1e300,"huge":18446744073709551615,"edge":9223372036854775807,"low":-9.2e18})");

    assert(args.int_default("limit", 20) == 20);
    assert(args.int_default("floor", 3) == 3);
    assert(args.int_default("huge", 4) == 4);
    assert(args.int_default("edge", 0) == 9223372036854775807LL);
    assert(args.int_default("low", 0) == -9200000000000000000LL);

    assert(validation_message([&] { args.require_int("limit"); }) ==
           "field 'limit' must be an integer within the 64-bit range");
    assert(validation_message([&] { args.require_int("huge"); }) ==
           "field 'huge' must be an integer within the 64-bit range");
    assert(args.require_int("edge") == 9223372036854775807LL);

    // Still an ordinary number for the floating-point accessors
    assert(args.number_default("limit", 0.0) == 1e20);

    std::cout << "  [PASS] out-of-range integers rejected" << std::endl;
}

int main()
{
    std::cout << "Argument decoder tests" << std::endl;
    std::cout << "======================" << std::endl;

    test_required_values();
    test_defaults();
    test_presence();
    test_construction();
    test_out_of_range_integers();

    std::cout << "\nAll argument tests passed!" << std::endl;
    return 0;
}
