#include <codegrader/grading/comparator.hpp>

#include <codegrader/grading/value.hpp>
#include <codegrader/logging.hpp>

#include <cmath>
#include <string>
#include <string_view>

namespace codegrader {

namespace {

constexpr std::string_view WHITESPACE = " \t\n\v\f\r";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(WHITESPACE);

    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(WHITESPACE);

    return text.substr(first, last - first + 1);
}

} // namespace

std::string normalize_output(std::string_view text) {
    text = trim(text);

    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\r') {
            result.push_back(text[i]);
            continue;
        }

        result.push_back('\n');

        // Collapse "\r\n" into a single newline
        if (i + 1 < text.size() && text[i + 1] == '\n') {
            ++i;
        }
    }

    return result;
}

MatchDecision compare_outputs(std::string_view actual, std::string_view expected, double epsilon) {
    const std::string norm_actual = normalize_output(actual);
    const std::string norm_expected = normalize_output(expected);

    if (auto actual_json = Value::parse_json(norm_actual)) {
        if (auto expected_json = Value::parse_json(norm_expected)) {
            bool equal = actual_json->equals(*expected_json, epsilon);
            LOG_TRACE("Structural comparison of {} and {}: {}", *actual_json, *expected_json, equal);
            return {.equal = equal, .tier = MatchTier::Structural};
        }
    }

    auto actual_num = Value::parse_number(norm_actual);
    auto expected_num = Value::parse_number(norm_expected);

    if (actual_num && expected_num) {
        bool equal = std::fabs(*actual_num - *expected_num) <= epsilon;
        LOG_TRACE("Numeric comparison of {} and {}: {}", *actual_num, *expected_num, equal);
        return {.equal = equal, .tier = MatchTier::Numeric};
    }

    return {.equal = norm_actual == norm_expected, .tier = MatchTier::Exact};
}

} // namespace codegrader
