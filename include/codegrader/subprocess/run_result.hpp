#pragma once

#include <codegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>

namespace codegrader {

/// How a supervised child process ended
class RunResult
{
public:
    enum class Kind {
        Exited,      ///< The process exited on its own; see get_code()
        Signaled,    ///< The process was terminated by a signal it did not handle; see get_code()
        LimitKilled, ///< We killed the process because a limit was hit; see get_limit()
    };

    /// Why the supervisor killed the process, if it did
    enum class Limit { None, Deadline, Memory, Output, Cancelled };

    BOOST_DESCRIBE_NESTED_ENUM(Kind, Exited, Signaled, LimitKilled)
    BOOST_DESCRIBE_NESTED_ENUM(Limit, None, Deadline, Memory, Output, Cancelled)

    static RunResult make_exited(int code, std::chrono::milliseconds elapsed);
    static RunResult make_signaled(int signal, std::chrono::milliseconds elapsed);
    static RunResult make_limit_killed(Limit limit, std::chrono::milliseconds elapsed);

    Kind get_kind() const;

    /// Exit code for Kind::Exited, signal number for Kind::Signaled, SIGKILL for Kind::LimitKilled
    int get_code() const;

    Limit get_limit() const;

    std::chrono::milliseconds get_elapsed() const;

private:
    RunResult(Kind kind, int code, Limit limit, std::chrono::milliseconds elapsed);

    Kind kind_;
    int code_;
    Limit limit_;
    std::chrono::milliseconds elapsed_;
};

} // namespace codegrader

template <>
struct fmt::formatter<::codegrader::RunResult> : fmt::formatter<std::string_view>
{
    auto format(const ::codegrader::RunResult& from, fmt::format_context& ctx) const {
        using enum ::codegrader::RunResult::Kind;

        switch (from.get_kind()) {
        case Exited:
            return fmt::format_to(ctx.out(), "exited with code {} after {}", from.get_code(), from.get_elapsed());
        case Signaled:
            return fmt::format_to(ctx.out(), "terminated by signal {} after {}", from.get_code(), from.get_elapsed());
        case LimitKilled:
            break;
        }

        return fmt::format_to(ctx.out(), "killed ({} limit) after {}", from.get_limit(), from.get_elapsed());
    }
};
