#include "server/http_server.hpp"

#include "server/json_codec.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/engine/admission_gate.hpp>
#include <codegrader/engine/engine_config.hpp>
#include <codegrader/engine/orchestrator.hpp>
#include <codegrader/grading/validator.hpp>
#include <codegrader/logging.hpp>

#include <fmt/format.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace codegrader {

namespace {

constexpr const char* JSON_CONTENT_TYPE = "application/json";

/// Threads beyond those that admitted and waiting requests can occupy; keeps /health answerable
constexpr std::size_t SPARE_HTTP_THREADS = 4;

constexpr int HTTP_OK = 200;
constexpr int HTTP_BAD_REQUEST = 400;

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), JSON_CONTENT_TYPE);
}

} // namespace

HttpServer::HttpServer(ServerConfig config, RequestValidator validator, AdmissionGate& gate,
                       Orchestrator& orchestrator)
    : config_{std::move(config)}
    , validator_{validator}
    , gate_{&gate}
    , orchestrator_{&orchestrator}
    , threads_{config_.threads != 0 ? config_.threads
                                    : gate.get_max_active() + gate.get_max_queued() + SPARE_HTTP_THREADS}
    , server_{std::make_unique<httplib::Server>()} {

    server_->new_task_queue = [threads = threads_] { return new httplib::ThreadPool(threads); };
    server_->set_payload_max_length(config_.max_request_bytes);

    // One request per connection: an idle keep-alive connection would hold a pool thread until it times out
    server_->set_keep_alive_max_count(1);

    const auto grade_handler = [this](const httplib::Request& req, httplib::Response& res) { handle_grade(req, res); };

    server_->Post("/test-javascript-code", grade_handler);
    server_->Post("/grade", grade_handler);
    server_->Get("/health",
                 [this](const httplib::Request& req, httplib::Response& res) { handle_health(req, res); });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_INFO("{} {} -> {}", req.method, req.path, res.status);
    });

    // Answers for requests that never reached a handler (unknown route, oversized body, ...)
    server_->set_error_handler([](const httplib::Request& /*req*/, httplib::Response& res) {
        if (res.body.empty()) {
            send_json(res, res.status,
                      {{"error", {{"code", "http_error"}, {"message", fmt::format("HTTP {}", res.status)}}}});
        }
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr eptr) {
        try {
            std::rethrow_exception(std::move(eptr));
        } catch (const std::exception& ex) {
            LOG_ERROR("Unhandled exception while serving {} {}: {}", req.method, req.path, ex.what());
        }

        send_json(res, engine_error_status(ErrorKind::UnknownError), engine_error_body(ErrorKind::UnknownError));
    });
}

HttpServer::~HttpServer() {
    stop();
}

Result<int> HttpServer::bind() {
    int port = config_.port;

    if (port == 0) {
        port = server_->bind_to_any_port(config_.host);
        if (port < 0) {
            LOG_ERROR("Could not bind to any port on {}", config_.host);
            return ErrorKind::SyscallFailure;
        }
    } else if (!server_->bind_to_port(config_.host, port)) {
        LOG_ERROR("Could not bind to {}:{}", config_.host, port);
        return ErrorKind::SyscallFailure;
    }

    LOG_INFO("Listening on {}:{} with {} HTTP threads", config_.host, port, threads_);

    return port;
}

Result<void> HttpServer::serve() {
    if (!server_->listen_after_bind()) {
        LOG_ERROR("HTTP server stopped unexpectedly");
        return ErrorKind::SyscallFailure;
    }

    return {};
}

void HttpServer::stop() {
    if (server_->is_running()) {
        LOG_INFO("Stopping HTTP server");
        server_->stop();
    }
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    send_json(res, HTTP_OK, health_body());
}

void HttpServer::handle_grade(const httplib::Request& req, httplib::Response& res) {
    const std::string request_id = fmt::format("req-{}", next_request_id_++);

    auto submission = validator_.validate(req.body);

    if (!submission) {
        LOG_INFO("[{}] Rejected: {}", request_id, submission.error());
        send_json(res, HTTP_BAD_REQUEST, validation_error_body(submission.error()));
        return;
    }

    auto ticket = gate_->acquire();

    if (!ticket) {
        LOG_WARN("[{}] Engine saturated ({} active, {} waiting); refusing", request_id, gate_->active(),
                 gate_->waiting());
        res.set_header("Retry-After", "1");
        send_json(res, engine_error_status(ticket.error()), engine_error_body(ticket.error()));
        return;
    }

    const GradeOptions options{
        .request_id = request_id,
        .stop = {},
        .abandoned = [&req] { return req.is_connection_closed(); },
    };

    auto summary = orchestrator_->grade(*submission, options);

    if (!summary) {
        LOG_ERROR("[{}] Grading failed: {}", request_id, summary.error());
        send_json(res, engine_error_status(summary.error()), engine_error_body(summary.error()));
        return;
    }

    LOG_INFO("[{}] {}/{} test cases passed, score {}", request_id, summary->passed_tests, summary->total_tests,
             summary->score);

    send_json(res, HTTP_OK, *summary);
}

} // namespace codegrader
