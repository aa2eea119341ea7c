#pragma once

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/sandbox/sandbox.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace codegrader {

/// Sandbox whose behavior is scripted by the test
class FakeSandbox final : public Sandbox
{
public:
    using ExecuteFn = std::function<Result<ExecutionOutcome>(std::string_view input, std::stop_token stop)>;

    explicit FakeSandbox(ExecuteFn execute_fn)
        : execute_fn_{std::move(execute_fn)} {}

    Result<CompileOutcome> compile(std::string code, const SandboxLimits& /*limits*/,
                                   std::stop_token /*stop*/) override {
        ++compile_calls;

        if (compile_failure) {
            return CompileOutcome{*compile_failure};
        }

        return CompileOutcome{CompiledSubmission{.code = std::move(code), .entry_candidates = {}}};
    }

    Result<ExecutionOutcome> execute(const CompiledSubmission& /*compiled*/, std::string_view input,
                                     const SandboxLimits& /*limits*/, std::stop_token stop) override {
        ++execute_calls;
        return execute_fn_(input, std::move(stop));
    }

    std::string_view name() const override { return "fake"; }

    std::optional<ExecutionOutcome> compile_failure;
    std::atomic<int> compile_calls{0};
    std::atomic<int> execute_calls{0};

private:
    ExecuteFn execute_fn_;
};

/// Returns its input, as the identity function would
inline Result<ExecutionOutcome> echo(std::string_view input, std::stop_token /*stop*/) {
    return ExecutionOutcome::returned(std::string{input}, std::chrono::milliseconds{1});
}

} // namespace codegrader
