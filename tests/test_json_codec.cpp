#include "catch2_custom.hpp"

#include "server/json_codec.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace codegrader;
using nlohmann::json;

TEST_CASE("Test results omit absent fields") {
    TestResult passed{.passed = true, .expected = "5", .actual = "5", .error = {}, .input = "2,3"};
    TestResult failed{.passed = false, .expected = "5", .actual = "", .error = "ReferenceError: x is not defined"};

    json passed_json = passed;
    json failed_json = failed;

    REQUIRE(passed_json == json{{"passed", true}, {"expected", "5"}, {"actual", "5"}, {"input", "2,3"}});
    REQUIRE_FALSE(passed_json.contains("error"));

    REQUIRE(failed_json["error"] == "ReferenceError: x is not defined");
    REQUIRE_FALSE(failed_json.contains("input"));
}

TEST_CASE("Summaries use the wire names") {
    GradingSummary summary = summarize({
        TestResult{.passed = true, .expected = "1", .actual = "1", .error = {}, .input = "a"},
        TestResult{.passed = false, .expected = "2", .actual = "3", .error = {}, .input = "b"},
    });

    json body = summary;

    REQUIRE(body["score"] == 50);
    REQUIRE(body["totalTests"] == 2);
    REQUIRE(body["passedTests"] == 1);
    REQUIRE(body["results"].size() == 2);
    REQUIRE(body["results"][1]["actual"] == "3");
    REQUIRE(body["results"][0]["input"] == "a");
}

TEST_CASE("Error bodies") {
    SECTION("Validation errors carry the field") {
        json body = validation_error_body(
            ValidationError{.code = ValidationErrorCode::MissingField, .field = "testCases", .message = "required"});

        REQUIRE(body["error"]["code"] == "missing_field");
        REQUIRE(body["error"]["field"] == "testCases");
        REQUIRE(body["error"]["message"] == "required");
    }

    SECTION("Busy is a retryable 503") {
        json body = engine_error_body(ErrorKind::ServiceBusy);

        REQUIRE(body["error"]["code"] == "service_busy");
        REQUIRE(body["error"]["retryable"] == true);
        REQUIRE(engine_error_status(ErrorKind::ServiceBusy) == 503);
    }

    SECTION("Other engine failures are 500s") {
        json body = engine_error_body(ErrorKind::SandboxUnavailable);

        REQUIRE(body["error"]["code"] == "engine_failure");
        REQUIRE(body["error"]["retryable"] == true);
        REQUIRE(engine_error_status(ErrorKind::SandboxUnavailable) == 500);

        REQUIRE(engine_error_body(ErrorKind::Cancelled)["error"]["code"] == "cancelled");
    }

    SECTION("Health") {
        REQUIRE(health_body() == json{{"status", "ok"}});
    }
}

TEST_CASE("Submission bodies are accepted by the validator") {
    CodeSubmission submission{
        .code = "const f = x => x * 2;",
        .language = Language::JavaScript,
        .test_cases = {TestCase{.input = "4", .expected_output = "8", .description = "doubles"},
                       TestCase{.input = "0", .expected_output = "0", .description = {}}},
    };

    auto round_tripped = RequestValidator{}.validate_json(submission_body(submission));

    REQUIRE(round_tripped);
    REQUIRE(round_tripped->code == submission.code);
    REQUIRE(round_tripped->test_cases.size() == 2);
    REQUIRE(round_tripped->test_cases[0].description == "doubles");
    REQUIRE_FALSE(round_tripped->test_cases[1].description);
}
