#include "catch2_custom.hpp"

#include <codegrader/grading/scorer.hpp>
#include <codegrader/grading/submission.hpp>

#include <string>
#include <vector>

using codegrader::compute_score;
using codegrader::GradingSummary;
using codegrader::summarize;
using codegrader::TestResult;

TEST_CASE("Score is a rounded percentage") {
    STATIC_REQUIRE(compute_score(0, 0) == 0);
    STATIC_REQUIRE(compute_score(0, 5) == 0);
    STATIC_REQUIRE(compute_score(5, 5) == 100);
    STATIC_REQUIRE(compute_score(1, 2) == 50);
    STATIC_REQUIRE(compute_score(2, 3) == 67);
    STATIC_REQUIRE(compute_score(1, 3) == 33);

    // Exact halves round up
    STATIC_REQUIRE(compute_score(1, 8) == 13);
    STATIC_REQUIRE(compute_score(1, 40) == 3);
    STATIC_REQUIRE(compute_score(1, 200) == 1);
    STATIC_REQUIRE(compute_score(199, 200) == 100);
}

TEST_CASE("Score always lies in [0, 100]") {
    for (int total = 1; total <= 100; ++total) {
        for (int passed = 0; passed <= total; ++passed) {
            const int score = compute_score(passed, total);

            REQUIRE(score >= 0);
            REQUIRE(score <= 100);
            REQUIRE((score == 100) == (passed == total));
            REQUIRE((score == 0) == (passed == 0));
        }
    }
}

TEST_CASE("Summaries count the passed results") {
    std::vector<TestResult> results(3);
    results[0].passed = true;
    results[2].passed = true;

    GradingSummary summary = summarize(results);

    REQUIRE(summary.total_tests == 3);
    REQUIRE(summary.passed_tests == 2);
    REQUIRE(summary.failed_tests() == 1);
    REQUIRE(summary.score == 67);
    REQUIRE(summary.results.size() == 3);
    REQUIRE_FALSE(summary.all_passed());
}

TEST_CASE("An empty summary scores zero") {
    GradingSummary summary = summarize({});

    REQUIRE(summary.total_tests == 0);
    REQUIRE(summary.passed_tests == 0);
    REQUIRE(summary.score == 0);
    REQUIRE_FALSE(summary.all_passed());
}
