#pragma once

#include <codegrader/common/error_types.hpp>
#include <codegrader/common/expected.hpp>
#include <codegrader/engine/engine_config.hpp>

#include <fmt/base.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <spdlog/common.h>

#include <filesystem>
#include <string>

#include <unistd.h>

namespace codegrader {

struct ProgramOptions
{

    // ###### Argument fields

    enum class Command { Serve, Grade } command = Command::Serve;

    /// Lowered by each -v, raised by each -q
    spdlog::level::level_enum log_level = DEFAULT_LOG_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    EngineConfig engine;
    ServerConfig server;

    // `grade` only
    std::filesystem::path request_file;
    bool json_output = false;

    // ###### Argument defaults

    static constexpr auto DEFAULT_LOG_LEVEL = spdlog::level::info;

    static constexpr int MAX_PORT = 65535;

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_executable(const std::filesystem::path& path,
                                                            fmt::format_string<std::string> fmt) {
        TRY(ensure_is_regular_file(path, fmt));

        if (::access(path.c_str(), X_OK) != 0) {
            return (fmt::format(fmt, path.string()) + " is not executable");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (engine.limits.timeout.count() <= 0) {
            return std::string{"Timeout must be positive"};
        }

        if (engine.limits.memory_mb == 0) {
            return std::string{"Memory limit must be positive"};
        }

        if (engine.validation.max_code_bytes == 0) {
            return std::string{"Maximum code size must be positive"};
        }

        if (engine.max_output_bytes == 0) {
            return std::string{"Maximum output size must be positive"};
        }

        TRY(ensure_is_executable(engine.node_path, "Node.js interpreter {:?}"));

        if (command == Command::Grade) {
            return ensure_is_regular_file(request_file, "Request file {:?}");
        }

        if (engine.max_active_requests == 0) {
            return std::string{"At least one request must be allowed to run at a time"};
        }

        if (server.port < 0 || server.port > MAX_PORT) {
            return fmt::format("Port {} is out of range [0, {}]", server.port, MAX_PORT);
        }

        if (server.host.empty()) {
            return std::string{"Host must not be empty"};
        }

        return {};
    }
};

} // namespace codegrader

template <>
struct fmt::formatter<::codegrader::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::codegrader::ProgramOptions& from, fmt::format_context& ctx) const {
        const auto& engine = from.engine;

        ctx.advance_to(fmt::format_to(
            ctx.out(),
            "{{command={}, log_level={}, color_opt={}, timeout={}, memory_mb={}, node={}, node_flags={}, workers={}",
            fmt::underlying(from.command), spdlog::level::to_string_view(from.log_level),
            fmt::underlying(from.colorize_option), engine.limits.timeout, engine.limits.memory_mb, engine.node_path,
            engine.node_flags, engine.workers));

        if (from.command == ::codegrader::ProgramOptions::Command::Grade) {
            return fmt::format_to(ctx.out(), ", request_file={}, json={}}}", from.request_file, from.json_output);
        }

        return fmt::format_to(ctx.out(), ", max_active={}, max_queued={}, queue_timeout={}, host={}, port={}}}",
                              engine.max_active_requests, engine.max_queued_requests, engine.queue_timeout,
                              from.server.host, from.server.port);
    }
};
