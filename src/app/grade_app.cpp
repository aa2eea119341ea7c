#include "app/grade_app.hpp"

#include "output/json_serializer.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "sandbox/node_sandbox.hpp"
#include "user/program_options.hpp"

#include <codegrader/engine/engine_config.hpp>
#include <codegrader/engine/orchestrator.hpp>
#include <codegrader/engine/worker_pool.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>
#include <codegrader/logging.hpp>

#include <algorithm>
#include <csignal>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

namespace codegrader {

int GradeApp::exit_code_for(const GradingSummary& summary) {
    constexpr int MAX_EXIT_CODE = 255;

    return std::min(summary.failed_tests(), MAX_EXIT_CODE);
}

int GradeApp::run_impl() {
    const EngineConfig& engine = OPTS.engine;

    // A submission that exits early closes its stdin under us
    std::signal(SIGPIPE, SIG_IGN);

    StdoutSink output_sink;
    std::unique_ptr<Serializer> serializer;

    if (OPTS.json_output) {
        serializer = std::make_unique<JsonSerializer>(output_sink, /*pretty=*/true);
    } else {
        serializer = std::make_unique<PlainTextSerializer>(output_sink, OPTS.colorize_option);
    }

    std::ifstream request_stream{OPTS.request_file};

    if (!request_stream) {
        LOG_ERROR("Could not open {}: {}", OPTS.request_file.string(), get_err_msg());
        return EXIT_REQUEST_ERROR;
    }

    const std::string request{std::istreambuf_iterator<char>{request_stream}, std::istreambuf_iterator<char>{}};

    auto submission = RequestValidator{engine.validation}.validate(request);

    if (!submission) {
        serializer->on_validation_error(submission.error());
        serializer->finalize();
        return EXIT_REQUEST_ERROR;
    }

    LOG_DEBUG("Grading {} with {} test cases", OPTS.request_file.string(), submission->test_cases.size());

    NodeSandbox sandbox{NodeSandboxOptions::from_config(engine)};
    WorkerPool pool{engine.workers};
    Orchestrator orchestrator{sandbox, pool, engine.limits};

    auto summary = orchestrator.grade(*submission, GradeOptions{.request_id = OPTS.request_file.filename().string()});

    if (!summary) {
        serializer->on_engine_error(summary.error());
        serializer->finalize();
        return EXIT_ENGINE_ERROR;
    }

    serializer->on_summary(*submission, *summary);
    serializer->finalize();

    return exit_code_for(*summary);
}

} // namespace codegrader
