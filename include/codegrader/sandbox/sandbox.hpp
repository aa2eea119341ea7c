#pragma once

#include <codegrader/common/error_types.hpp>
#include <codegrader/common/expected.hpp>
#include <codegrader/grading/submission.hpp>

#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace codegrader {

/// Per-invocation resource budget
struct SandboxLimits
{
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
    std::size_t memory_mb = DEFAULT_MEMORY_MB;

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{3000};
    static constexpr std::size_t DEFAULT_MEMORY_MB = 128;
};

/// A submission that is known to parse, together with what was learned about it while checking
struct CompiledSubmission
{
    std::string code;

    /// Names of top-level functions, in source order. The last one that resolves to a function is
    /// the fallback callable.
    std::vector<std::string> entry_candidates;
};

/// Either the compiled submission, or the (CompileError, TimeoutError, ...) outcome that stopped it
using CompileOutcome = Expected<CompiledSubmission, ExecutionOutcome>;

/// Executes untrusted code in isolation.
///
/// Every call works in a freshly created execution context; nothing is shared between calls.
/// Student failures are reported as ExecutionOutcome values. An ErrorKind is returned only when
/// the sandbox machinery itself failed.
class Sandbox
{
public:
    Sandbox() = default;
    Sandbox(const Sandbox&) = delete;
    Sandbox(Sandbox&&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;
    Sandbox& operator=(Sandbox&&) = delete;
    virtual ~Sandbox() = default;

    /// Check that ``code`` parses, without running any of it
    virtual Result<CompileOutcome> compile(std::string code, const SandboxLimits& limits, std::stop_token stop) = 0;

    /// Run ``compiled`` against a single test case input
    virtual Result<ExecutionOutcome> execute(const CompiledSubmission& compiled, std::string_view input,
                                             const SandboxLimits& limits, std::stop_token stop) = 0;

    virtual std::string_view name() const = 0;
};

} // namespace codegrader
