#include "catch2_custom.hpp"

#include <codegrader/grading/comparator.hpp>

#include <string>
#include <string_view>

using codegrader::compare_outputs;
using codegrader::matches;
using codegrader::MatchTier;
using codegrader::normalize_output;

TEST_CASE("Normalization trims and unifies line endings") {
    REQUIRE(normalize_output("  5 \n") == "5");
    REQUIRE(normalize_output("a\r\nb\rc\n") == "a\nb\nc");
    REQUIRE(normalize_output("\r\n\t ") == "");
    REQUIRE(normalize_output("inner  spaces stay") == "inner  spaces stay");
}

TEST_CASE("Numbers compare by value") {
    REQUIRE(matches("5", "5.0"));
    REQUIRE(matches("0.30000000000000004", "0.3"));
    REQUIRE(matches("+7", "7"));
    REQUIRE_FALSE(matches("5", "6"));
    REQUIRE_FALSE(matches("0.1", "0.2"));
}

TEST_CASE("JSON documents compare structurally") {
    REQUIRE(matches(R"({"a":1,"b":2})", R"({"b":2,"a":1})"));
    REQUIRE(matches("[1, 2, 3]", "[1,2,3]"));
    REQUIRE(matches(R"({"total": 5})", R"({"total": 5.0})"));
    REQUIRE_FALSE(matches("[1,2]", "[2,1]"));
    REQUIRE_FALSE(matches(R"({"a":1})", R"({"a":"1"})"));
    REQUIRE_FALSE(matches("[1,2]", "[1,2,3]"));
}

TEST_CASE("Strings fall back to exact comparison") {
    REQUIRE(matches("hello", "hello"));
    REQUIRE(matches("hello\n", "  hello"));
    REQUIRE(matches("line1\r\nline2", "line1\nline2"));
    REQUIRE_FALSE(matches("Hello", "hello"));
    REQUIRE_FALSE(matches("hello world", "hello  world"));
    REQUIRE(matches("undefined", "undefined"));
    REQUIRE(matches("", "   "));
}

TEST_CASE("The deciding tier is reported") {
    REQUIRE(compare_outputs("[1]", "[1]").tier == MatchTier::Structural);
    REQUIRE(compare_outputs("\"abc\"", "\"abc\"").tier == MatchTier::Structural);
    REQUIRE(compare_outputs("true", "true").tier == MatchTier::Structural);

    // A JSON number on one side and a non-JSON number on the other
    REQUIRE(compare_outputs("5", "+5").tier == MatchTier::Numeric);
    REQUIRE(compare_outputs("5", "+5").equal);

    REQUIRE(compare_outputs("abc", "abc").tier == MatchTier::Exact);
    REQUIRE(compare_outputs("5", "five").tier == MatchTier::Exact);
    REQUIRE_FALSE(compare_outputs("5", "five").equal);
}

TEST_CASE("A quoted string is not the bare string") {
    // '"abc"' parses as JSON but 'abc' does not, so the exact tier decides
    REQUIRE_FALSE(matches("\"abc\"", "abc"));
}

TEST_CASE("Custom epsilon") {
    REQUIRE_FALSE(compare_outputs("1.0", "1.05").equal);
    REQUIRE(compare_outputs("1.0", "1.05", 0.1).equal);
}
