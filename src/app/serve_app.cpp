#include "app/serve_app.hpp"

#include "sandbox/node_sandbox.hpp"
#include "server/http_server.hpp"
#include "user/program_options.hpp"

#include <codegrader/engine/admission_gate.hpp>
#include <codegrader/engine/engine_config.hpp>
#include <codegrader/engine/orchestrator.hpp>
#include <codegrader/engine/worker_pool.hpp>
#include <codegrader/grading/validator.hpp>
#include <codegrader/logging.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <stop_token>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace codegrader {

int ServeApp::run_impl() {
    const EngineConfig& engine = OPTS.engine;

    sigset_t shutdown_signals;
    ::sigemptyset(&shutdown_signals);
    ::sigaddset(&shutdown_signals, SIGINT);
    ::sigaddset(&shutdown_signals, SIGTERM);

    // Must happen before any thread is started, so that every thread inherits the mask and the
    // signals are left to the watcher below
    if (int err = ::pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr); err != 0) {
        LOG_FATAL("Could not block shutdown signals: {}", get_err_msg(err));
        return EXIT_FAILURE;
    }

    // Writes to clients that went away must fail with EPIPE, not kill the server
    std::signal(SIGPIPE, SIG_IGN);

    NodeSandbox sandbox{NodeSandboxOptions::from_config(engine)};
    WorkerPool pool{engine.workers};
    AdmissionGate gate{engine.max_active_requests, engine.max_queued_requests, engine.queue_timeout};
    Orchestrator orchestrator{sandbox, pool, engine.limits};
    HttpServer server{OPTS.server, RequestValidator{engine.validation}, gate, orchestrator};

    auto port = server.bind();

    if (!port) {
        LOG_FATAL("Could not start the HTTP server: {}", port.error());
        return EXIT_FAILURE;
    }

    LOG_INFO("Grading with the {} sandbox ({}) on {} workers; at most {} requests active and {} queued",
             sandbox.name(), engine.node_path, pool.size(), gate.get_max_active(), gate.get_max_queued());
    LOG_INFO("Per test case: {} ms, {} MB", engine.limits.timeout.count(), engine.limits.memory_mb);

    std::jthread signal_watcher{[&server, &shutdown_signals](const std::stop_token& stop) {
        constexpr timespec POLL_INTERVAL{.tv_sec = 0, .tv_nsec = 200'000'000};

        while (!stop.stop_requested()) {
            int sig = ::sigtimedwait(&shutdown_signals, nullptr, &POLL_INTERVAL);

            // EAGAIN on timeout, EINTR on an unrelated signal
            if (sig == -1) {
                continue;
            }

            LOG_INFO("Received {}; shutting down", ::strsignal(sig));

            // A signal can arrive before serve() is listening, and stopping a server that isn't running is a no-op
            while (!server.is_running() && !stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
            server.stop();
            return;
        }
    }};

    auto served = server.serve();

    signal_watcher.request_stop();

    if (!served) {
        return EXIT_FAILURE;
    }

    LOG_INFO("Server stopped");

    return EXIT_SUCCESS;
}

} // namespace codegrader
