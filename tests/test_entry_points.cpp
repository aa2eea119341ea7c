#include "catch2_custom.hpp"

#include "sandbox/entry_points.hpp"

#include <string>
#include <vector>

using codegrader::find_entry_candidates;
using codegrader::mask_nested_code;

using Names = std::vector<std::string>;

TEST_CASE("Masking keeps only top-level code") {
    REQUIRE(mask_nested_code("a { b } c") == "a       c");
    REQUIRE(mask_nested_code("x // y\nz") == "x     \nz");
    REQUIRE(mask_nested_code("x /* y */ z") == "x         z");
    REQUIRE(mask_nested_code("s = 'a{b' + t") == "s =       + t");
    REQUIRE(mask_nested_code("s = `a ${ {} } b`;") == "s =              ;");

    // Length is always preserved
    const std::string source = "function f() {\n  return `x`;\n}\n";
    REQUIRE(mask_nested_code(source).size() == source.size());
}

TEST_CASE("Find function declarations") {
    REQUIRE(find_entry_candidates("function add(a, b) { return a + b; }") == Names{"add"});
    REQUIRE(find_entry_candidates("async function load() {}") == Names{"load"});
    REQUIRE(find_entry_candidates("function* gen() { yield 1; }") == Names{"gen"});
    REQUIRE(find_entry_candidates("function $helper_2 () {}") == Names{"$helper_2"});
}

TEST_CASE("Find functions bound to variables") {
    REQUIRE(find_entry_candidates("const double = x => x * 2;") == Names{"double"});
    REQUIRE(find_entry_candidates("let add = (a, b) => a + b;") == Names{"add"});
    REQUIRE(find_entry_candidates("var sub = function (a, b) { return a - b; };") == Names{"sub"});
    REQUIRE(find_entry_candidates("const go = async () => 1;") == Names{"go"});

    REQUIRE(find_entry_candidates("const limit = 10;").empty());
    REQUIRE(find_entry_candidates("let obj = { f: () => 1 };").empty());
}

TEST_CASE("Candidates are listed in source order") {
    const std::string source = R"(
function helper(x) { return x + 1; }

const solve = (n) => helper(n) * 2;

function main() {
    function inner() {}
    return solve(1);
}
)";

    REQUIRE(find_entry_candidates(source) == Names{"helper", "solve", "main"});
}

TEST_CASE("Nested, commented and quoted functions are ignored") {
    const std::string source = R"(
// function commented() {}
/* function blocked() {} */
const text = "function quoted() {}";
const tmpl = `function templated() {}`;
function real() {
    const nested = () => 1;
}
)";

    REQUIRE(find_entry_candidates(source) == Names{"real"});
}

TEST_CASE("A redeclared name is listed at its last declaration") {
    const std::string source = R"(
function a() {}
function b() {}
function a() { return 2; }
)";

    REQUIRE(find_entry_candidates(source) == Names{"b", "a"});
}

TEST_CASE("Braces inside regular expression literals do not nest") {
    REQUIRE(mask_nested_code("r = /[{]/; x") == "r = " + std::string(5, ' ') + "; x");

    REQUIRE(find_entry_candidates("const re = /\\{/; function add(a,b){return a+b}") == Names{"add"});
    REQUIRE(find_entry_candidates("const isBrace = (c) => /[{]/.test(c); function add(a, b) { return a + b; }") ==
            Names{"isBrace", "add"});
    REQUIRE(find_entry_candidates("function check(s) { return /}/.test(s); }\nfunction add(a, b) { return a + b; }") ==
            Names{"check", "add"});

    // An escaped slash or a slash inside a class does not end the literal
    REQUIRE(find_entry_candidates("const path = /a\\/{/; const cls = /[/{]/;\nfunction add(a, b) {}") == Names{"add"});
}

TEST_CASE("A slash after an operand is a division") {
    REQUIRE(find_entry_candidates("const half = (total) / 2; function add(a, b) { return a + b; }") == Names{"add"});
    REQUIRE(find_entry_candidates("const r = x / y / z; const f = () => 1;") == Names{"f"});
}

TEST_CASE("Long top-level expressions are scanned without deep recursion") {
    std::string source = "const x = (";
    for (int i = 0; i < 40000; ++i) {
        source += "a+";
    }
    source += "a);\nfunction add(a,b){return a+b}\nconst twice = (" + std::string(20000, ' ') + "n) => n * 2;\n";

    REQUIRE(source.size() >= 60 * 1024);
    REQUIRE(find_entry_candidates(source) == Names{"add", "twice"});
}

TEST_CASE("Parenthesized parameters may nest") {
    REQUIRE(find_entry_candidates("const f = (a = g(1), [b] = []) => a + b;") == Names{"f"});
    REQUIRE(find_entry_candidates("const notFn = (1 + 2) * 3;").empty());
}
