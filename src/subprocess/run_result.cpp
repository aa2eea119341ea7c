#include <codegrader/subprocess/run_result.hpp>

#include <chrono>

#include <csignal>

namespace codegrader {

RunResult::RunResult(Kind kind, int code, Limit limit, std::chrono::milliseconds elapsed)
    : kind_{kind}
    , code_{code}
    , limit_{limit}
    , elapsed_{elapsed} {}

RunResult RunResult::make_exited(int code, std::chrono::milliseconds elapsed) {
    return {Kind::Exited, code, Limit::None, elapsed};
}

RunResult RunResult::make_signaled(int signal, std::chrono::milliseconds elapsed) {
    return {Kind::Signaled, signal, Limit::None, elapsed};
}

RunResult RunResult::make_limit_killed(Limit limit, std::chrono::milliseconds elapsed) {
    return {Kind::LimitKilled, SIGKILL, limit, elapsed};
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

RunResult::Limit RunResult::get_limit() const {
    return limit_;
}

std::chrono::milliseconds RunResult::get_elapsed() const {
    return elapsed_;
}

} // namespace codegrader
