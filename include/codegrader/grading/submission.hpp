/// \file
/// Data classes describing one grading request and its results
#pragma once

#include <codegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegrader {

/// Languages that lesson authors can pick. Only JavaScript is a grading target.
enum class Language { JavaScript, Python, Java, CSharp, Cpp, Ruby, Php, Swift };

BOOST_DESCRIBE_ENUM(Language, JavaScript, Python, Java, CSharp, Cpp, Ruby, Php, Swift)

/// Case-insensitive lookup by the identifiers the authoring UI sends ("javascript", "csharp", ...).
/// "js" is accepted as an alias of "javascript".
std::optional<Language> parse_language(std::string_view name);

/// The lowercase identifier of ``lang`` as used on the wire
std::string_view language_id(Language lang);

constexpr bool is_gradable(Language lang) noexcept {
    return lang == Language::JavaScript;
}

struct TestCase
{
    std::string input;
    std::string expected_output;
    std::optional<std::string> description;
};

struct CodeSubmission
{
    std::string code;
    Language language = Language::JavaScript;
    std::vector<TestCase> test_cases;
};

/// How a single sandbox invocation ended
enum class OutcomeKind {
    Returned,           ///< The submission produced a value
    CompileError,       ///< The submission failed to parse
    RuntimeError,       ///< The submission threw
    TimeoutError,       ///< The wall-clock budget was exhausted
    ResourceLimitError, ///< The memory or output ceiling was exceeded
    Cancelled,          ///< The owning request was cancelled
};

BOOST_DESCRIBE_ENUM(OutcomeKind, Returned, CompileError, RuntimeError, TimeoutError, ResourceLimitError, Cancelled)

struct ExecutionOutcome
{
    OutcomeKind kind = OutcomeKind::Returned;

    /// Textual rendering of the returned value; only set when kind == Returned
    std::optional<std::string> value;
    std::optional<std::string> error;

    bool timed_out = false;
    bool resource_exceeded = false;
    std::chrono::milliseconds duration{0};

    static ExecutionOutcome returned(std::string rendered, std::chrono::milliseconds duration) {
        return {.kind = OutcomeKind::Returned, .value = std::move(rendered), .duration = duration};
    }

    static ExecutionOutcome failed(OutcomeKind kind, std::string message, std::chrono::milliseconds duration) {
        return {.kind = kind,
                .error = std::move(message),
                .timed_out = kind == OutcomeKind::TimeoutError,
                .resource_exceeded = kind == OutcomeKind::ResourceLimitError,
                .duration = duration};
    }

    bool ok() const noexcept { return kind == OutcomeKind::Returned; }
};

struct TestResult
{
    bool passed = false;
    std::string expected;
    std::string actual;
    std::optional<std::string> error;
    std::optional<std::string> input;
};

struct GradingSummary
{
    std::vector<TestResult> results;
    int total_tests{};
    int passed_tests{};
    int score{};

    int failed_tests() const noexcept { return total_tests - passed_tests; }

    bool all_passed() const noexcept { return total_tests > 0 && passed_tests == total_tests; }
};

/// Build a summary from ordered results, filling in the counters and score
GradingSummary summarize(std::vector<TestResult> results);

} // namespace codegrader

template <>
struct fmt::formatter<::codegrader::TestResult> : fmt::formatter<std::string_view>
{
    auto format(const ::codegrader::TestResult& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{passed={}, expected={:?}, actual={:?}, error={:?}}}", from.passed,
                              from.expected, from.actual, from.error.value_or("<none>"));
    }
};
