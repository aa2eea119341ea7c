#pragma once

#include <codegrader/grading/validator.hpp>
#include <codegrader/sandbox/sandbox.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace codegrader {

/// Everything that bounds how the engine spends resources
struct EngineConfig
{
    /// Per test case budget
    SandboxLimits limits;

    ValidationLimits validation;

    // ###### Node sandbox
    std::string node_path = "/usr/bin/node";
    std::vector<std::string> node_flags;
    std::size_t rss_overhead_mb = 96;
    std::size_t max_output_bytes = 1024 * 1024;
    bool isolate_namespaces = false;

    // ###### Concurrency
    /// Sandbox worker threads; 0 means one per hardware thread
    std::size_t workers = 0;
    std::size_t max_active_requests = 4;
    std::size_t max_queued_requests = 16;
    std::chrono::milliseconds queue_timeout{2000};
};

/// Settings of the HTTP front end
struct ServerConfig
{
    std::string host = "0.0.0.0";
    int port = 8080;

    /// HTTP worker threads; 0 picks enough to keep the health probe answerable while the engine is saturated
    std::size_t threads = 0;

    std::size_t max_request_bytes = 1024 * 1024;
};

} // namespace codegrader
