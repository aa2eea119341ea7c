#pragma once

#include <codegrader/common/error_types.hpp>
#include <codegrader/common/formatters/enum.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/sandbox/sandbox.hpp>

#include <boost/describe/enum.hpp>

#include <chrono>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace codegrader {

class WorkerPool;

/// Lifecycle of one grading request
enum class GradingState { Validating, Compiling, Aborted, Executing, Completed };

BOOST_DESCRIBE_ENUM(GradingState, Validating, Compiling, Aborted, Executing, Completed)

/// Per-request knobs that don't belong to the engine configuration
struct GradeOptions
{
    /// Shown in log lines, so that interleaved requests can be told apart
    std::string request_id = "-";

    /// Cancels the request when stop is requested
    std::stop_token stop;

    /// Polled while test cases run; returning true cancels the request (e.g. the client went away)
    std::function<bool()> abandoned;
};

/// Turns a validated submission into a graded summary.
///
/// The submission is compiled once; on failure every test case fails with that same error and the
/// sandbox is not invoked again. Otherwise each test case runs as an independent task on the shared
/// worker pool, and the results are put back in test case order.
class Orchestrator
{
public:
    Orchestrator(Sandbox& sandbox, WorkerPool& pool, SandboxLimits limits);

    /// Fails with Cancelled if the request was cancelled, or with the sandbox's error if the sandbox
    /// machinery itself broke. Student failures never fail this function.
    Result<GradingSummary> grade(const CodeSubmission& submission, const GradeOptions& options = {});

    const SandboxLimits& get_limits() const { return limits_; }

private:
    /// Judge one outcome against its test case
    static TestResult make_result(const TestCase& test_case, const ExecutionOutcome& outcome);

    Sandbox* sandbox_;
    WorkerPool* pool_;
    SandboxLimits limits_;
};

} // namespace codegrader
