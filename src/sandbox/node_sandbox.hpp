#pragma once

#include "subprocess/subprocess.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/engine/engine_config.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/sandbox/sandbox.hpp>
#include <codegrader/subprocess/run_result.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace codegrader {

struct NodeSandboxOptions
{
    std::string node_path = "/usr/bin/node";

    /// Passed to node before the harness, e.g. "--experimental-permission"
    std::vector<std::string> extra_flags;

    /// Resident memory allowed on top of the V8 heap limit, for the interpreter itself
    std::size_t rss_overhead_mb = 96;

    /// Combined stdout + stderr allowance of one run
    std::size_t max_output_bytes = 1024 * 1024;

    /// Best-effort user + network namespace isolation
    bool isolate_namespaces = false;

    static NodeSandboxOptions from_config(const EngineConfig& config);
};

/// Runs JavaScript in a freshly forked ``node`` process per invocation.
/// Inside it, the submission is evaluated in a new ``vm`` context that exposes nothing but
/// ECMAScript built-ins and inert ``console``, ``module`` and ``exports`` objects.
class NodeSandbox final : public Sandbox
{
public:
    explicit NodeSandbox(NodeSandboxOptions options = {});

    Result<CompileOutcome> compile(std::string code, const SandboxLimits& limits, std::stop_token stop) override;

    Result<ExecutionOutcome> execute(const CompiledSubmission& compiled, std::string_view input,
                                     const SandboxLimits& limits, std::stop_token stop) override;

    std::string_view name() const override { return "node"; }

    const NodeSandboxOptions& get_options() const { return options_; }

private:
    /// Run the harness once with ``request`` on its stdin and classify how it went
    Result<ExecutionOutcome> invoke(const nlohmann::json& request, const SandboxLimits& limits, std::stop_token stop);

    std::vector<std::string> node_args(const SandboxLimits& limits) const;

    SpawnOptions spawn_options(const SandboxLimits& limits) const;

    /// Outcome for a run the watchdog had to kill
    ExecutionOutcome limit_outcome(const RunResult& run, const SandboxLimits& limits) const;

    NodeSandboxOptions options_;
};

} // namespace codegrader
