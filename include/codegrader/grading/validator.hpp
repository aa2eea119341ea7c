#pragma once

#include <codegrader/common/expected.hpp>
#include <codegrader/common/formatters/enum.hpp>
#include <codegrader/grading/submission.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>
#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace codegrader {

enum class ValidationErrorCode {
    MalformedJson,
    MissingField,
    WrongType,
    EmptyCode,
    UnknownLanguage,
    UnsupportedLanguage,
    CodeTooLarge,
    TooManyTestCases,
};

BOOST_DESCRIBE_ENUM(ValidationErrorCode, MalformedJson, MissingField, WrongType, EmptyCode, UnknownLanguage,
                    UnsupportedLanguage, CodeTooLarge, TooManyTestCases)

/// snake_case identifier sent to clients, e.g. "unsupported_language"
std::string_view error_code_id(ValidationErrorCode code);

struct ValidationError
{
    ValidationErrorCode code;
    /// Path of the offending field, e.g. "testCases[2].input". Empty for whole-document errors.
    std::string field;
    std::string message;
};

struct ValidationLimits
{
    std::size_t max_code_bytes = DEFAULT_MAX_CODE_BYTES;
    std::size_t max_test_cases = DEFAULT_MAX_TEST_CASES;

    static constexpr std::size_t DEFAULT_MAX_CODE_BYTES = 64 * 1024;
    static constexpr std::size_t DEFAULT_MAX_TEST_CASES = 100;
};

/// Shape checks on an inbound grading request. Runs before anything is executed and has no side effects.
/// Reports the first problem found; never throws.
class RequestValidator
{
public:
    explicit RequestValidator(ValidationLimits limits = {})
        : limits_{limits} {}

    Expected<CodeSubmission, ValidationError> validate(std::string_view raw_body) const;
    /// Same checks on an already parsed document
    Expected<CodeSubmission, ValidationError> validate_json(const nlohmann::json& raw) const;

    const ValidationLimits& get_limits() const noexcept { return limits_; }

private:
    ValidationLimits limits_;
};

} // namespace codegrader

template <>
struct fmt::formatter<::codegrader::ValidationError> : fmt::formatter<std::string_view>
{
    auto format(const ::codegrader::ValidationError& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} ({:?}): {}", ::codegrader::error_code_id(from.code), from.field,
                              from.message);
    }
};
