/// \file
/// Wire format of the grading API
#pragma once

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace codegrader {

// Found by nlohmann::json through ADL

/// {"passed", "expected", "actual", "error"?, "input"?}; absent optionals are omitted
void to_json(nlohmann::json& json, const TestResult& result);

/// {"results", "score", "totalTests", "passedTests"}
void to_json(nlohmann::json& json, const GradingSummary& summary);

/// {"error": {"code", "field", "message"}}
nlohmann::json validation_error_body(const ValidationError& error);

/// {"error": {"code": "service_busy" | "cancelled" | "engine_failure", "retryable", "message"}}
nlohmann::json engine_error_body(ErrorKind kind);

/// HTTP status to answer an engine failure with
int engine_error_status(ErrorKind kind);

/// {"status": "ok"}
nlohmann::json health_body();

/// Request body for a submission, as accepted by RequestValidator
nlohmann::json submission_body(const CodeSubmission& submission);

} // namespace codegrader
