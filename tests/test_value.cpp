#include "catch2_custom.hpp"

#include <codegrader/grading/value.hpp>

#include <optional>
#include <string>

using codegrader::Value;

TEST_CASE("Parse JSON scalars") {
    REQUIRE(Value::parse_json("null")->is_null());
    REQUIRE(*Value::parse_json("true")->as_bool());
    REQUIRE(*Value::parse_json("-2.5e1")->as_number() == -25.0);
    REQUIRE(*Value::parse_json(R"("hi\nthere")")->as_string() == "hi\nthere");

    REQUIRE(Value::parse_json("42")->type() == Value::Type::Number);
}

TEST_CASE("Parse JSON containers") {
    auto array = Value::parse_json("[1, [2, 3], {\"a\": null}]");

    REQUIRE(array);
    REQUIRE(array->as_array()->size() == 3);
    REQUIRE(*array == Value{Value::Array{1, Value::Array{2, 3}, Value::Object{{"a", nullptr}}}});

    // Duplicated keys keep their last value
    auto object = Value::parse_json(R"({"a": 1, "a": 2})");

    REQUIRE(object);
    REQUIRE(*object == Value{Value::Object{{"a", 2}}});
}

TEST_CASE("Reject text that is not a single JSON document") {
    REQUIRE_FALSE(Value::parse_json(""));
    REQUIRE_FALSE(Value::parse_json("hello"));
    REQUIRE_FALSE(Value::parse_json("[1, 2"));
    REQUIRE_FALSE(Value::parse_json("1 2"));
    REQUIRE_FALSE(Value::parse_json("{'a': 1}"));
    REQUIRE_FALSE(Value::parse_json("undefined"));
}

TEST_CASE("Parse bare numbers") {
    REQUIRE(Value::parse_number("5") == 5.0);
    REQUIRE(Value::parse_number("5.0") == 5.0);
    REQUIRE(Value::parse_number("+3") == 3.0);
    REQUIRE(Value::parse_number("-0.25") == -0.25);
    REQUIRE(Value::parse_number("1e3") == 1000.0);
    REQUIRE(Value::parse_number(".5") == 0.5);

    REQUIRE_FALSE(Value::parse_number(""));
    REQUIRE_FALSE(Value::parse_number("+"));
    REQUIRE_FALSE(Value::parse_number("++1"));
    REQUIRE_FALSE(Value::parse_number("+-1"));
    REQUIRE_FALSE(Value::parse_number("0x10"));
    REQUIRE_FALSE(Value::parse_number("Infinity"));
    REQUIRE_FALSE(Value::parse_number("NaN"));
    REQUIRE_FALSE(Value::parse_number("12abc"));
    REQUIRE_FALSE(Value::parse_number(" 1"));
}

TEST_CASE("Structural equality") {
    SECTION("Object key order is irrelevant") {
        REQUIRE(*Value::parse_json(R"({"a":1,"b":2})") == *Value::parse_json(R"({"b":2,"a":1})"));
    }

    SECTION("Array order is significant") {
        REQUIRE_FALSE(*Value::parse_json("[1,2]") == *Value::parse_json("[2,1]"));
    }

    SECTION("Types must agree") {
        REQUIRE_FALSE(Value{1} == Value{"1"});
        REQUIRE_FALSE(Value{nullptr} == Value{false});
        REQUIRE_FALSE(Value{Value::Array{}} == Value{Value::Object{}});
    }

    SECTION("Numbers compare within epsilon, recursively") {
        Value lhs = *Value::parse_json(R"({"x": [0.1, 0.2]})");
        Value rhs = *Value::parse_json(R"({"x": [0.1000000001, 0.2]})");

        REQUIRE_FALSE(lhs == rhs);
        REQUIRE(lhs.equals(rhs, 1e-9));
    }

    SECTION("Missing keys") {
        REQUIRE_FALSE(*Value::parse_json(R"({"a":1})") == *Value::parse_json(R"({"a":1,"b":2})"));
    }
}

TEST_CASE("Dump as compact JSON") {
    REQUIRE(Value{Value::Array{1, "two", true, nullptr}}.dump() == R"([1.0,"two",true,null])");
    REQUIRE(Value{Value::Object{{"b", 1}, {"a", Value::Array{}}}}.dump() == R"({"a":[],"b":1.0})");
}
