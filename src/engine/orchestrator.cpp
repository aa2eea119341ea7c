#include <codegrader/engine/orchestrator.hpp>

#include <codegrader/common/error_types.hpp>
#include <codegrader/engine/worker_pool.hpp>
#include <codegrader/grading/comparator.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/logging.hpp>
#include <codegrader/sandbox/sandbox.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace codegrader {

namespace {

/// How often a waiting request checks whether its client is still there
constexpr std::chrono::milliseconds ABANDON_POLL_INTERVAL{50};

} // namespace

Orchestrator::Orchestrator(Sandbox& sandbox, WorkerPool& pool, SandboxLimits limits)
    : sandbox_{&sandbox}
    , pool_{&pool}
    , limits_{limits} {}

TestResult Orchestrator::make_result(const TestCase& test_case, const ExecutionOutcome& outcome) {
    TestResult result{
        .passed = false,
        .expected = test_case.expected_output,
        .actual = {},
        .error = std::nullopt,
        .input = test_case.input,
    };

    if (!outcome.ok()) {
        result.error = outcome.error.value_or("Execution failed");
        return result;
    }

    result.actual = outcome.value.value_or("");
    result.passed = compare_outputs(result.actual, test_case.expected_output).equal;

    return result;
}

Result<GradingSummary> Orchestrator::grade(const CodeSubmission& submission, const GradeOptions& options) {
    using enum GradingState;

    const auto& request_id = options.request_id;
    const auto& test_cases = submission.test_cases;

    const auto transition = [&request_id](GradingState from, GradingState to) {
        LOG_DEBUG("[{}] {} -> {}", request_id, from, to);
    };

    if (test_cases.empty()) {
        transition(Validating, Completed);
        return summarize({});
    }

    // Fired by the caller's token, by a departed client, or by a sandbox failure
    std::stop_source stop_source;
    std::stop_callback forward_stop{options.stop, [&stop_source] { stop_source.request_stop(); }};
    const std::stop_token stop = stop_source.get_token();

    transition(Validating, Compiling);

    CompileOutcome compiled = TRY(sandbox_->compile(submission.code, limits_, stop));

    if (!compiled) {
        transition(Compiling, Aborted);

        const ExecutionOutcome& failure = compiled.error();

        if (failure.kind == OutcomeKind::Cancelled) {
            return ErrorKind::Cancelled;
        }

        std::vector<TestResult> results;
        results.reserve(test_cases.size());

        for (const TestCase& test_case : test_cases) {
            results.push_back(make_result(test_case, failure));
        }

        return summarize(std::move(results));
    }

    transition(Compiling, Executing);

    const CompiledSubmission& program = compiled.value();

    std::vector<std::future<Result<ExecutionOutcome>>> pending;
    pending.reserve(test_cases.size());

    for (const TestCase& test_case : test_cases) {
        pending.push_back(pool_->submit([this, &program, &test_case, stop]() -> Result<ExecutionOutcome> {
            if (stop.stop_requested()) {
                return ExecutionOutcome::failed(OutcomeKind::Cancelled, "Grading was cancelled",
                                                std::chrono::milliseconds{0});
            }
            return sandbox_->execute(program, test_case.input, limits_, stop);
        }));
    }

    std::vector<TestResult> results;
    results.reserve(test_cases.size());

    std::optional<ErrorKind> failure;

    // Every future is waited on, even after a failure: the tasks reference this frame
    for (std::size_t i = 0; i < pending.size(); ++i) {
        auto& future = pending[i];

        while (future.wait_for(ABANDON_POLL_INTERVAL) != std::future_status::ready) {
            if (!stop.stop_requested() && options.abandoned && options.abandoned()) {
                LOG_INFO("[{}] Client went away; cancelling its remaining test cases", request_id);
                stop_source.request_stop();
            }
        }

        Result<ExecutionOutcome> outcome = ErrorKind::UnknownError;

        try {
            outcome = future.get();
        } catch (const std::exception& ex) {
            LOG_ERROR("[{}] Test case {} threw: {}", request_id, i, ex.what());
        }

        if (!outcome) {
            LOG_WARN("[{}] Sandbox failed on test case {}: {}", request_id, i, outcome.error());
            failure = failure.value_or(outcome.error());
            stop_source.request_stop();
            continue;
        }

        if (outcome->kind == OutcomeKind::Cancelled) {
            failure = failure.value_or(ErrorKind::Cancelled);
            continue;
        }

        results.push_back(make_result(test_cases[i], *outcome));

        LOG_TRACE("[{}] Test case {}: {} in {}", request_id, i, results.back(), outcome->duration);
    }

    if (failure) {
        transition(Executing, Aborted);
        return *failure;
    }

    transition(Executing, Completed);

    GradingSummary summary = summarize(std::move(results));

    LOG_DEBUG("[{}] {}/{} test cases passed, score {}", request_id, summary.passed_tests, summary.total_tests,
              summary.score);

    return summary;
}

} // namespace codegrader
