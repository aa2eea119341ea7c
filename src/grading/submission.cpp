#include <codegrader/grading/submission.hpp>

#include <codegrader/grading/scorer.hpp>

#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codegrader {

namespace {

struct LanguageName
{
    std::string_view id;
    Language lang;
};

// Identifiers used by the lesson authoring UI
constexpr std::array LANGUAGE_NAMES = {
    LanguageName{"javascript", Language::JavaScript}, LanguageName{"python", Language::Python},
    LanguageName{"java", Language::Java},             LanguageName{"csharp", Language::CSharp},
    LanguageName{"cpp", Language::Cpp},               LanguageName{"ruby", Language::Ruby},
    LanguageName{"php", Language::Php},               LanguageName{"swift", Language::Swift},
};

std::string to_lower_trimmed(std::string_view name) {
    const auto first = name.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) {
        return {};
    }
    name = name.substr(first, name.find_last_not_of(" \t\n\r") - first + 1);

    std::string result{name};
    for (char& chr : result) {
        chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
    }

    return result;
}

} // namespace

std::optional<Language> parse_language(std::string_view name) {
    const std::string lowered = to_lower_trimmed(name);

    if (lowered == "js") {
        return Language::JavaScript;
    }

    const auto found = ranges::find_if(LANGUAGE_NAMES, [&](const LanguageName& entry) { return entry.id == lowered; });

    if (found == LANGUAGE_NAMES.end()) {
        return std::nullopt;
    }

    return found->lang;
}

std::string_view language_id(Language lang) {
    const auto found = ranges::find_if(LANGUAGE_NAMES, [lang](const LanguageName& entry) { return entry.lang == lang; });

    return found == LANGUAGE_NAMES.end() ? "unknown" : found->id;
}

GradingSummary summarize(std::vector<TestResult> results) {
    GradingSummary summary;

    summary.total_tests = gsl::narrow_cast<int>(results.size());
    summary.passed_tests = gsl::narrow_cast<int>(ranges::count_if(results, &TestResult::passed));
    summary.score = compute_score(summary.passed_tests, summary.total_tests);
    summary.results = std::move(results);

    return summary;
}

} // namespace codegrader
