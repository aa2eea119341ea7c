#include "server/json_codec.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace codegrader {

void to_json(nlohmann::json& json, const TestResult& result) {
    json = {
        {"passed", result.passed},
        {"expected", result.expected},
        {"actual", result.actual},
    };

    if (result.error) {
        json["error"] = *result.error;
    }

    if (result.input) {
        json["input"] = *result.input;
    }
}

void to_json(nlohmann::json& json, const GradingSummary& summary) {
    json = {
        {"results", summary.results},
        {"score", summary.score},
        {"totalTests", summary.total_tests},
        {"passedTests", summary.passed_tests},
    };
}

nlohmann::json validation_error_body(const ValidationError& error) {
    return {
        {"error",
         {
             {"code", std::string{error_code_id(error.code)}},
             {"field", error.field},
             {"message", error.message},
         }},
    };
}

nlohmann::json engine_error_body(ErrorKind kind) {
    using enum ErrorKind;

    std::string code = "engine_failure";
    std::string message = fmt::format("The grading engine failed ({}); this is not a problem with the submission", kind);

    if (kind == ServiceBusy) {
        code = "service_busy";
        message = "The grading engine is at capacity; retry shortly";
    } else if (kind == Cancelled) {
        code = "cancelled";
        message = "The grading request was cancelled";
    }

    return {
        {"error",
         {
             {"code", code},
             {"retryable", is_retryable(kind)},
             {"message", message},
         }},
    };
}

int engine_error_status(ErrorKind kind) {
    constexpr int SERVICE_UNAVAILABLE = 503;
    constexpr int INTERNAL_SERVER_ERROR = 500;

    return kind == ErrorKind::ServiceBusy ? SERVICE_UNAVAILABLE : INTERNAL_SERVER_ERROR;
}

nlohmann::json health_body() {
    return {{"status", "ok"}};
}

nlohmann::json submission_body(const CodeSubmission& submission) {
    nlohmann::json test_cases = nlohmann::json::array();

    for (const TestCase& test_case : submission.test_cases) {
        nlohmann::json entry = {{"input", test_case.input}, {"expectedOutput", test_case.expected_output}};
        if (test_case.description) {
            entry["description"] = *test_case.description;
        }
        test_cases.push_back(std::move(entry));
    }

    return {
        {"code", submission.code},
        {"language", std::string{language_id(submission.language)}},
        {"testCases", std::move(test_cases)},
    };
}

} // namespace codegrader
