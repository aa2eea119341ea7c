#include "sandbox/node_sandbox.hpp"

#include "sandbox/entry_points.hpp"
#include "sandbox/node_harness.hpp"
#include "subprocess/subprocess.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/engine/engine_config.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/logging.hpp>
#include <codegrader/sandbox/sandbox.hpp>
#include <codegrader/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codegrader {

namespace {

constexpr std::size_t BYTES_PER_MB = 1024 * 1024;

/// What V8 prints right before aborting on an exhausted heap
bool is_heap_exhaustion(std::string_view stderr_text) {
    return stderr_text.find("heap out of memory") != std::string_view::npos ||
           stderr_text.find("Reached heap limit") != std::string_view::npos;
}

std::string_view first_line(std::string_view text) {
    return text.substr(0, text.find('\n'));
}

/// Last bit of stderr, for logs
std::string_view stderr_tail(std::string_view text) {
    constexpr std::size_t MAX_TAIL = 512;
    return text.size() > MAX_TAIL ? text.substr(text.size() - MAX_TAIL) : text;
}

} // namespace

NodeSandboxOptions NodeSandboxOptions::from_config(const EngineConfig& config) {
    return {
        .node_path = config.node_path,
        .extra_flags = config.node_flags,
        .rss_overhead_mb = config.rss_overhead_mb,
        .max_output_bytes = config.max_output_bytes,
        .isolate_namespaces = config.isolate_namespaces,
    };
}

NodeSandbox::NodeSandbox(NodeSandboxOptions options)
    : options_{std::move(options)} {}

Result<CompileOutcome> NodeSandbox::compile(std::string code, const SandboxLimits& limits, std::stop_token stop) {
    const nlohmann::json request = {{"mode", "compile"}, {"code", code}};

    ExecutionOutcome outcome = TRY(invoke(request, limits, std::move(stop)));

    if (!outcome.ok()) {
        LOG_DEBUG("Submission did not compile: {}", outcome.error.value_or("<no message>"));
        return CompileOutcome{std::move(outcome)};
    }

    CompiledSubmission compiled{.code = std::move(code), .entry_candidates = {}};
    compiled.entry_candidates = find_entry_candidates(compiled.code);

    return CompileOutcome{std::move(compiled)};
}

Result<ExecutionOutcome> NodeSandbox::execute(const CompiledSubmission& compiled, std::string_view input,
                                              const SandboxLimits& limits, std::stop_token stop) {
    const nlohmann::json request = {
        {"mode", "execute"},
        {"code", compiled.code},
        {"input", std::string{input}},
        {"candidates", compiled.entry_candidates},
    };

    return invoke(request, limits, std::move(stop));
}

std::vector<std::string> NodeSandbox::node_args(const SandboxLimits& limits) const {
    std::vector<std::string> args{
        fmt::format("--max-old-space-size={}", limits.memory_mb),
        // Rejections the submission leaves unhandled must not take the harness down before it replies
        "--unhandled-rejections=warn",
        "--no-warnings",
    };

    args.insert(args.end(), options_.extra_flags.begin(), options_.extra_flags.end());

    args.emplace_back("-e");
    args.emplace_back(node_harness_script());

    return args;
}

SpawnOptions NodeSandbox::spawn_options(const SandboxLimits& limits) const {
    using std::chrono::ceil;
    using std::chrono::seconds;

    return {
        .env = {},
        .working_dir = "/",
        .new_process_group = true,
        .isolate_namespaces = options_.isolate_namespaces,
        // CPU time backstop in case the wall-clock watchdog is somehow not around to kill the child
        .cpu_seconds = static_cast<rlim_t>(ceil<seconds>(limits.timeout).count() + 1),
        .file_size_bytes = 0,
        .core_bytes = 0,
    };
}

ExecutionOutcome NodeSandbox::limit_outcome(const RunResult& run, const SandboxLimits& limits) const {
    using enum RunResult::Limit;

    switch (run.get_limit()) {
    case Deadline:
        return ExecutionOutcome::failed(OutcomeKind::TimeoutError,
                                        fmt::format("Execution timed out after {} ms", limits.timeout.count()),
                                        run.get_elapsed());
    case Memory:
        return ExecutionOutcome::failed(OutcomeKind::ResourceLimitError,
                                        fmt::format("Memory limit of {} MB exceeded", limits.memory_mb),
                                        run.get_elapsed());
    case Output:
        return ExecutionOutcome::failed(OutcomeKind::ResourceLimitError,
                                        fmt::format("Output limit of {} bytes exceeded", options_.max_output_bytes),
                                        run.get_elapsed());
    case Cancelled:
    case None:
        break;
    }

    return ExecutionOutcome::failed(OutcomeKind::Cancelled, "Grading was cancelled", run.get_elapsed());
}

Result<ExecutionOutcome> NodeSandbox::invoke(const nlohmann::json& request, const SandboxLimits& limits,
                                             std::stop_token stop) {
    Subprocess proc{options_.node_path, node_args(limits), spawn_options(limits)};

    TRY(proc.start());

    const RunLimits run_limits{
        .timeout = limits.timeout,
        .max_rss_bytes = (limits.memory_mb + options_.rss_overhead_mb) * BYTES_PER_MB,
        .max_output_bytes = options_.max_output_bytes,
    };

    RunResult run = TRY(proc.run(request.dump(), run_limits, std::move(stop)));
    const auto elapsed = run.get_elapsed();

    if (run.get_kind() == RunResult::Kind::LimitKilled) {
        return limit_outcome(run, limits);
    }

    if (is_heap_exhaustion(proc.get_stderr())) {
        return ExecutionOutcome::failed(OutcomeKind::ResourceLimitError,
                                        fmt::format("Memory limit of {} MB exceeded", limits.memory_mb), elapsed);
    }

    if (run.get_kind() == RunResult::Kind::Signaled && run.get_code() == SIGXCPU) {
        return ExecutionOutcome::failed(OutcomeKind::TimeoutError,
                                        fmt::format("Execution timed out after {} ms", limits.timeout.count()),
                                        elapsed);
    }

    const auto reply = nlohmann::json::parse(first_line(proc.get_stdout()), /*cb=*/nullptr,
                                             /*allow_exceptions=*/false);

    if (reply.is_discarded() || !reply.is_object() || !reply.contains("status") || !reply["status"].is_string()) {
        LOG_ERROR("Sandbox harness {} without a readable reply. stdout: {:?}, stderr: {:?}", run,
                  first_line(proc.get_stdout()), stderr_tail(proc.get_stderr()));
        return ErrorKind::ProtocolError;
    }

    const auto& status = reply["status"].get_ref<const std::string&>();
    const auto text_of = [&reply](const char* key) {
        auto iter = reply.find(key);
        return iter != reply.end() && iter->is_string() ? iter->get<std::string>() : std::string{};
    };

    LOG_TRACE("Sandbox harness replied {:?} after {}", status, elapsed);

    if (status == "ok") {
        return ExecutionOutcome::returned(text_of("value"), elapsed);
    }

    if (status == "compile_error") {
        return ExecutionOutcome::failed(OutcomeKind::CompileError, text_of("message"), elapsed);
    }

    if (status == "runtime_error") {
        return ExecutionOutcome::failed(OutcomeKind::RuntimeError, text_of("message"), elapsed);
    }

    LOG_ERROR("Sandbox harness failed ({:?}): {}", status, text_of("message"));

    return ErrorKind::ProtocolError;
}

} // namespace codegrader
