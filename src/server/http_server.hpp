#pragma once

#include <codegrader/common/class_traits.hpp>
#include <codegrader/common/error_types.hpp>
#include <codegrader/engine/admission_gate.hpp>
#include <codegrader/engine/engine_config.hpp>
#include <codegrader/engine/orchestrator.hpp>
#include <codegrader/grading/validator.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace codegrader {

/// HTTP front end of the grading engine
///
/// Routes:
///   POST /test-javascript-code, POST /grade   grade a submission
///   GET  /health                             liveness probe; never touches the engine
class HttpServer : NonMovable
{
public:
    HttpServer(ServerConfig config, RequestValidator validator, AdmissionGate& gate, Orchestrator& orchestrator);
    ~HttpServer();

    /// Binds the listening socket. A configured port of 0 picks a free port.
    /// Returns the port actually bound.
    Result<int> bind();

    /// Serves requests until stop() is called. bind() must have succeeded first.
    Result<void> serve();

    /// Thread-safe; makes serve() return once in-flight requests are answered
    void stop();

    bool is_running() const;

    /// Number of HTTP worker threads serve() uses
    std::size_t thread_count() const { return threads_; }

private:
    void handle_grade(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    ServerConfig config_;
    RequestValidator validator_;
    AdmissionGate* gate_;
    Orchestrator* orchestrator_;

    std::size_t threads_;
    std::atomic<std::uint64_t> next_request_id_{1};

    std::unique_ptr<httplib::Server> server_;
};

} // namespace codegrader
