#include "catch2_custom.hpp"

#include "output/json_serializer.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/sink.hpp"
#include "user/program_options.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

using namespace codegrader;
using Catch::Matchers::ContainsSubstring;

namespace {

class StringSink : public Sink
{
public:
    void write(std::string_view str) override { contents += str; }

    void flush() override { ++flushes; }

    std::string contents;
    int flushes = 0;
};

const CodeSubmission SUBMISSION{
    .code = "function add(a, b) { return a + b; }",
    .language = Language::JavaScript,
    .test_cases = {TestCase{.input = "2, 3", .expected_output = "5", .description = "small numbers"},
                   TestCase{.input = "1, 1", .expected_output = "3", .description = {}}},
};

} // namespace

TEST_CASE("Plain text report of a partially passing submission") {
    StringSink sink;
    PlainTextSerializer serializer{sink, ProgramOptions::ColorizeOpt::Never};

    const GradingSummary summary = summarize({
        TestResult{.passed = true, .expected = "5", .actual = "5", .error = {}, .input = "2, 3"},
        TestResult{.passed = false, .expected = "3", .actual = "2", .error = {}, .input = "1, 1"},
    });

    serializer.on_summary(SUBMISSION, summary);
    serializer.finalize();

    const std::string& out = sink.contents;

    REQUIRE_THAT(out, ContainsSubstring("Test Case 1 (small numbers): PASSED"));
    REQUIRE_THAT(out, ContainsSubstring("Test Case 2: FAILED"));
    REQUIRE_THAT(out, ContainsSubstring("  Input    : 1, 1\n"));
    REQUIRE_THAT(out, ContainsSubstring(R"(  Expected : "3")"));
    REQUIRE_THAT(out, ContainsSubstring(R"(  Actual   : "2")"));
    REQUIRE_THAT(out, ContainsSubstring("2 total"));
    REQUIRE_THAT(out, ContainsSubstring("1 passed"));
    REQUIRE_THAT(out, ContainsSubstring("1 failed"));
    REQUIRE_THAT(out, ContainsSubstring("Score: 50%"));

    // Never colorized
    REQUIRE(out.find('\x1b') == std::string::npos);
    REQUIRE(sink.flushes == 1);
}

TEST_CASE("Plain text report of a fully passing submission") {
    StringSink sink;
    PlainTextSerializer serializer{sink, ProgramOptions::ColorizeOpt::Never};

    serializer.on_summary(SUBMISSION, summarize({
                                          TestResult{.passed = true, .expected = "5", .actual = "5"},
                                          TestResult{.passed = true, .expected = "3", .actual = "3"},
                                      }));

    REQUIRE_THAT(sink.contents, ContainsSubstring("All tests passed (2 test cases)"));
    REQUIRE_THAT(sink.contents, ContainsSubstring("Score: 100%"));
}

TEST_CASE("Plain text errors") {
    StringSink sink;
    PlainTextSerializer serializer{sink, ProgramOptions::ColorizeOpt::Always};

    SECTION("Validation errors name the field and code") {
        serializer.on_validation_error(ValidationError{
            .code = ValidationErrorCode::WrongType, .field = "testCases[0].input", .message = "must be a string"});

        REQUIRE_THAT(sink.contents, ContainsSubstring("testCases[0].input"));
        REQUIRE_THAT(sink.contents, ContainsSubstring("must be a string [wrong_type]"));
    }

    SECTION("Engine errors say whether to retry") {
        serializer.on_engine_error(ErrorKind::ServiceBusy);

        REQUIRE_THAT(sink.contents, ContainsSubstring("retry shortly"));
        // Forced color
        REQUIRE(sink.contents.find('\x1b') != std::string::npos);
    }
}

TEST_CASE("JSON output matches the HTTP API") {
    StringSink sink;
    JsonSerializer serializer{sink};

    serializer.on_summary(SUBMISSION,
                          summarize({TestResult{.passed = true, .expected = "5", .actual = "5", .error = {}, .input = {}},
                                     TestResult{.passed = false,
                                                .expected = "3",
                                                .actual = "",
                                                .error = "TypeError: x is not a function",
                                                .input = {}}}));
    serializer.finalize();

    REQUIRE(sink.contents.ends_with("\n"));

    const auto body = nlohmann::json::parse(sink.contents);

    REQUIRE(body["score"] == 50);
    REQUIRE(body["totalTests"] == 2);
    REQUIRE(body["results"][1]["error"] == "TypeError: x is not a function");
    REQUIRE(sink.flushes == 1);
}
