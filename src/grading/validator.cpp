#include <codegrader/grading/validator.hpp>

#include <codegrader/grading/submission.hpp>
#include <codegrader/logging.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace codegrader {

namespace {

using enum ValidationErrorCode;

ValidationError make_error(ValidationErrorCode code, std::string field, std::string message) {
    return {.code = code, .field = std::move(field), .message = std::move(message)};
}

/// Fetch a required string member, or describe why it's unusable
Expected<std::string, ValidationError> require_string(const nlohmann::json& object, std::string_view key,
                                                      const std::string& field_path) {
    auto iter = object.find(key);

    if (iter == object.end()) {
        return make_error(MissingField, field_path, fmt::format("{} is required", field_path));
    }

    if (!iter->is_string()) {
        return make_error(WrongType, field_path,
                          fmt::format("{} must be a string, not {}", field_path, iter->type_name()));
    }

    return iter->get<std::string>();
}

Expected<TestCase, ValidationError> validate_test_case(const nlohmann::json& raw, std::size_t index) {
    const std::string path = fmt::format("testCases[{}]", index);

    if (!raw.is_object()) {
        return make_error(WrongType, path, fmt::format("{} must be an object, not {}", path, raw.type_name()));
    }

    auto input = require_string(raw, "input", path + ".input");
    if (!input) {
        return input.error();
    }

    auto expected = require_string(raw, "expectedOutput", path + ".expectedOutput");
    if (!expected) {
        return expected.error();
    }

    TestCase test_case{.input = std::move(input).value(), .expected_output = std::move(expected).value()};

    // description is optional, but must be a string when present (null is treated as absent)
    if (auto iter = raw.find("description"); iter != raw.end() && !iter->is_null()) {
        if (!iter->is_string()) {
            return make_error(WrongType, path + ".description",
                              fmt::format("{}.description must be a string", path));
        }
        test_case.description = iter->get<std::string>();
    }

    return test_case;
}

} // namespace

std::string_view error_code_id(ValidationErrorCode code) {
    switch (code) {
    case MalformedJson:
        return "malformed_json";
    case MissingField:
        return "missing_field";
    case WrongType:
        return "wrong_type";
    case EmptyCode:
        return "empty_code";
    case UnknownLanguage:
        return "unknown_language";
    case UnsupportedLanguage:
        return "unsupported_language";
    case CodeTooLarge:
        return "code_too_large";
    case TooManyTestCases:
        return "too_many_test_cases";
    }

    return "invalid_request";
}

Expected<CodeSubmission, ValidationError> RequestValidator::validate(std::string_view raw_body) const {
    auto json = nlohmann::json::parse(raw_body, /*cb=*/nullptr, /*allow_exceptions=*/false);

    if (json.is_discarded()) {
        return make_error(MalformedJson, "", "Request body is not valid JSON");
    }

    return validate_json(json);
}

Expected<CodeSubmission, ValidationError> RequestValidator::validate_json(const nlohmann::json& raw) const {
    if (!raw.is_object()) {
        return make_error(WrongType, "", fmt::format("Request must be a JSON object, not {}", raw.type_name()));
    }

    CodeSubmission submission;

    // ###### code
    auto code = require_string(raw, "code", "code");
    if (!code) {
        return code.error();
    }

    if (code->find_first_not_of(" \t\n\r") == std::string::npos) {
        return make_error(EmptyCode, "code", "code must not be empty");
    }

    if (code->size() > limits_.max_code_bytes) {
        return make_error(CodeTooLarge, "code",
                          fmt::format("code is {} bytes; the limit is {}", code->size(), limits_.max_code_bytes));
    }

    submission.code = std::move(code).value();

    // ###### language
    auto language_name = require_string(raw, "language", "language");
    if (!language_name) {
        return language_name.error();
    }

    std::optional<Language> language = parse_language(*language_name);

    if (!language) {
        return make_error(UnknownLanguage, "language", fmt::format("Unknown language {:?}", *language_name));
    }

    if (!is_gradable(*language)) {
        return make_error(UnsupportedLanguage, "language",
                          fmt::format("Language {:?} is not supported for grading; only JavaScript is",
                                      language_id(*language)));
    }

    submission.language = *language;

    // ###### testCases
    auto test_cases = raw.find("testCases");

    if (test_cases == raw.end()) {
        return make_error(MissingField, "testCases", "testCases is required");
    }

    if (!test_cases->is_array()) {
        return make_error(WrongType, "testCases",
                          fmt::format("testCases must be an array, not {}", test_cases->type_name()));
    }

    if (test_cases->size() > limits_.max_test_cases) {
        return make_error(TooManyTestCases, "testCases",
                          fmt::format("{} test cases given; the limit is {}", test_cases->size(),
                                      limits_.max_test_cases));
    }

    submission.test_cases.reserve(test_cases->size());

    for (std::size_t i = 0; i < test_cases->size(); ++i) {
        auto test_case = validate_test_case((*test_cases)[i], i);
        if (!test_case) {
            return test_case.error();
        }
        submission.test_cases.push_back(std::move(test_case).value());
    }

    LOG_TRACE("Validated submission: {} bytes of {}, {} test cases", submission.code.size(),
              submission.language, submission.test_cases.size());

    return submission;
}

} // namespace codegrader
