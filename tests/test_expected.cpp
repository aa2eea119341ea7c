#include "catch2_custom.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/common/expected.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>

using namespace std::literals;
using codegrader::ErrorKind;
using codegrader::Expected;
using codegrader::Result;

// Simple types
using Et = Expected<int, std::string>;

namespace {

Result<int> halve(int num) {
    if (num % 2 != 0) {
        return ErrorKind::UnknownError;
    }

    return num / 2;
}

Result<int> quarter(int num) {
    int half = TRY(halve(num));

    return TRY(halve(half));
}

Result<int> quarter_or_syscall_failure(int num) {
    int half = TRYE(halve(num), SyscallFailure);

    return TRYE(halve(half), SyscallFailure);
}

} // namespace

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());

    REQUIRE(Et{"Hello"}.error() == "Hello");
    REQUIRE(*Et{123} == 123);
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});
    REQUIRE(Et{123} != Et{"123"});

    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234");

    REQUIRE(Et{"Unexpected!"} == "Unexpected!");
    REQUIRE(Et{"Unexpected!"} != "Exp!");
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{123}.error_or("E") == "E");

    REQUIRE(Et{"A"}.value_or(123.5) == 123);
    REQUIRE(Et{"A"}.error_or("B") == "A");

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{123}.transform(square) == 123 * 123);
    REQUIRE(Et{"no"}.transform(square) == "no");

    auto shout = [](const std::string& str) { return str + "!"; };

    REQUIRE(Et{"no"}.transform_error(shout) == "no!");
    REQUIRE(Et{7}.transform_error(shout) == 7);
}

TEST_CASE("TRY propagates the first error") {
    REQUIRE(quarter(12) == 3);
    REQUIRE(quarter(6) == ErrorKind::UnknownError);
    REQUIRE(quarter(5) == ErrorKind::UnknownError);
}

TEST_CASE("TRYE replaces the propagated error") {
    REQUIRE(quarter_or_syscall_failure(8) == 2);
    REQUIRE(quarter_or_syscall_failure(2) == ErrorKind::SyscallFailure);
}

TEST_CASE("Formatting of Expected and ErrorKind") {
    REQUIRE(fmt::format("{}", Et{5}) == "Expected(5)");
    REQUIRE(fmt::format("{}", Et{"bad"}) == "Error(bad)");
    REQUIRE(fmt::format("{}", Expected<>{}) == "Expected(void)");
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::ServiceBusy}) == "Error(ServiceBusy)");
}

TEST_CASE("Only transient engine failures are retryable") {
    using enum ErrorKind;

    REQUIRE(codegrader::is_retryable(ServiceBusy));
    REQUIRE(codegrader::is_retryable(SandboxUnavailable));
    REQUIRE_FALSE(codegrader::is_retryable(Cancelled));
}
