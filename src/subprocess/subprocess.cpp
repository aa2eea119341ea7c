#include "subprocess/subprocess.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/common/expected.hpp>
#include <codegrader/common/linux.hpp>
#include <codegrader/logging.hpp>
#include <codegrader/subprocess/run_result.hpp>

#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codegrader {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// Upper bound on reads per drain() call, so that a child flooding its pipes cannot starve the watchdog
constexpr int MAX_CHUNKS_PER_DRAIN = 16;

bool would_block(const std::error_code& err) {
    return err == std::errc::resource_unavailable_try_again || err == std::errc::operation_would_block;
}

/// argv/envp style array pointing into ``strs``. ``strs`` must outlive the result.
std::vector<char*> to_c_strings(std::vector<std::string>& strs) {
    std::vector<char*> result;
    result.reserve(strs.size() + 1);

    for (std::string& str : strs) {
        result.push_back(str.data());
    }
    result.push_back(nullptr);

    return result;
}

/// Child side: send errno to the parent through the exec error pipe and exit
[[noreturn]] void report_exec_failure(int exec_error_fd) {
    const int err = errno;
    std::ignore = ::write(exec_error_fd, &err, sizeof(err));
    ::_exit(127);
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, SpawnOptions options)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , options_{std::move(options)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the process was never started, or the object was moved from
    if (child_pid_ != 0 && is_running()) {
        if (auto res = kill(); !res) {
            LOG_WARN("Failed to kill subprocess {} on destruction: {}", child_pid_, res);
        }
    }

    close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , options_{std::move(other.options_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, {})}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {})}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stderr_buffer_{std::exchange(other.stderr_buffer_, {})}
    , exit_status_{std::exchange(other.exit_status_, std::nullopt)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (child_pid_ != 0 && is_running()) {
        std::ignore = kill();
    }
    close_pipes();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    options_ = std::move(rhs.options_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    stdin_pipe_ = std::exchange(rhs.stdin_pipe_, {});
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {});
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, {});
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stderr_buffer_ = std::exchange(rhs.stderr_buffer_, {});
    exit_status_ = std::exchange(rhs.exit_status_, std::nullopt);

    return *this;
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess::start() called twice");

    stdin_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stdout_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(), SyscallFailure);

    // Closed automatically by a successful execve. Receives errno otherwise.
    linux::Pipe exec_error_pipe = TRYE(linux::pipe2(), SyscallFailure);
    auto close_exec_error_pipe = gsl::finally([&exec_error_pipe] {
        for (int fd : {exec_error_pipe.read_fd, exec_error_pipe.write_fd}) {
            if (fd != -1) {
                std::ignore = linux::close(fd);
            }
        }
    });

    // Everything the child needs is allocated before forking; the child may not allocate
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args_.size() + 1);
    argv_storage.push_back(exec_);
    argv_storage.insert(argv_storage.end(), args_.begin(), args_.end());
    std::vector<std::string> envp_storage = options_.env;

    const std::vector<char*> argv = to_c_strings(argv_storage);
    const std::vector<char*> envp = to_c_strings(envp_storage);

    LOG_TRACE("Starting {:?} with args {::?}", exec_, args_);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        exec_child(exec_error_pipe.write_fd, argv, envp);
    }

    // Parent process
    child_pid_ = fork_res.pid;

    // Also done by the child; doing it here too means kill() can target the group as soon as we return
    if (options_.new_process_group) {
        std::ignore = linux::setpgid(child_pid_, child_pid_);
    }

    // Close the pipe ends being used in the child proc
    //  - read end for stdin
    //  - write ends for stdout and stderr
    for (int* fd : {&exec_error_pipe.write_fd, &stdin_pipe_.read_fd, &stdout_pipe_.write_fd, &stderr_pipe_.write_fd}) {
        TRYE(linux::close(*fd), SyscallFailure);
        *fd = -1;
    }

    if (auto exec_res = await_exec(exec_error_pipe.read_fd); !exec_res) {
        auto status = linux::waitpid(child_pid_);
        exit_status_ = status ? status->status : 0;
        return exec_res.error();
    }

    TRYE(linux::set_nonblocking(stdin_pipe_.write_fd), SyscallFailure);
    TRYE(linux::set_nonblocking(stdout_pipe_.read_fd), SyscallFailure);
    TRYE(linux::set_nonblocking(stderr_pipe_.read_fd), SyscallFailure);

    LOG_TRACE("Started subprocess {}", child_pid_);

    return {};
}

void Subprocess::exec_child(int exec_error_fd, const std::vector<char*>& argv, const std::vector<char*>& envp) {
    // NOLINTBEGIN(cppcoreguidelines-pro-type-vararg)

    // Don't outlive the thread that started us
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);

    // The server ignores SIGPIPE; the child gets the default disposition back
    ::signal(SIGPIPE, SIG_DFL);

    // Nor does it inherit the signals the server blocks for its signal-handling thread
    sigset_t no_signals;
    ::sigemptyset(&no_signals);
    ::sigprocmask(SIG_SETMASK, &no_signals, nullptr);

    if (options_.new_process_group && ::setpgid(0, 0) == -1) {
        report_exec_failure(exec_error_fd);
    }

    if (options_.isolate_namespaces) {
        // Unprivileged user namespaces may be disabled; the remaining isolation still applies
        std::ignore = ::unshare(CLONE_NEWUSER | CLONE_NEWNET);
    }

    if (::dup2(stdin_pipe_.read_fd, STDIN_FILENO) == -1 || ::dup2(stdout_pipe_.write_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_pipe_.write_fd, STDERR_FILENO) == -1) {
        report_exec_failure(exec_error_fd);
    }

    const auto set_limit = [exec_error_fd](int resource, std::optional<rlim_t> value) {
        if (!value) {
            return;
        }

        const rlimit limit{.rlim_cur = *value, .rlim_max = *value};

        if (::setrlimit(resource, &limit) == -1) {
            report_exec_failure(exec_error_fd);
        }
    };

    set_limit(RLIMIT_CORE, options_.core_bytes);
    set_limit(RLIMIT_FSIZE, options_.file_size_bytes);
    set_limit(RLIMIT_CPU, options_.cpu_seconds);

    if (::chdir(options_.working_dir.c_str()) == -1) {
        report_exec_failure(exec_error_fd);
    }

    // Nothing but stdin, stdout and stderr survives the exec (the server's sockets in particular)
    std::ignore = ::close_range(3, ~0U, CLOSE_RANGE_CLOEXEC);

    ::execve(exec_.c_str(), argv.data(), envp.data());

    report_exec_failure(exec_error_fd);

    // NOLINTEND(cppcoreguidelines-pro-type-vararg)
}

Result<void> Subprocess::await_exec(int exec_error_fd) {
    std::string received;

    while (received.size() < sizeof(int)) {
        auto chunk = linux::read(exec_error_fd, sizeof(int) - received.size());

        if (!chunk) {
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        // EOF: the descriptor was closed by a successful execve
        if (chunk->empty()) {
            break;
        }

        received += *chunk;
    }

    if (received.empty()) {
        return {};
    }

    int child_errno = 0;
    std::memcpy(&child_errno, received.data(), std::min(received.size(), sizeof(child_errno)));

    LOG_WARN("Could not start {:?}: {}", exec_, get_err_msg(child_errno));

    return ErrorKind::SandboxUnavailable;
}

Result<RunResult> Subprocess::run(std::string_view input, const RunLimits& limits, std::stop_token stop) {
    using namespace std::chrono_literals;
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::steady_clock;

    ASSERT(is_running(), "Subprocess::run() requires a started child that has not been reaped");

    const auto start_time = steady_clock::now();
    const auto deadline = start_time + limits.timeout;
    const auto elapsed = [start_time] { return duration_cast<milliseconds>(steady_clock::now() - start_time); };

    const auto kill_for = [&](RunResult::Limit limit) -> Result<RunResult> {
        TRY(kill());
        TRY(drain(stdout_pipe_.read_fd, stdout_buffer_));
        TRY(drain(stderr_pipe_.read_fd, stderr_buffer_));
        close_pipes();

        auto result = RunResult::make_limit_killed(limit, elapsed());
        LOG_DEBUG("Subprocess {} {}", child_pid_, result);

        return result;
    };

    std::size_t stdin_written = 0;
    TRY(feed_stdin(input, stdin_written));

    while (true) {
        if (stop.stop_requested()) {
            return kill_for(RunResult::Limit::Cancelled);
        }

        const auto now = steady_clock::now();
        if (now >= deadline) {
            return kill_for(RunResult::Limit::Deadline);
        }

        // poll ignores entries with a negative fd, so closed pipes can stay in the set
        std::array<pollfd, 3> fds{{
            {.fd = stdout_pipe_.read_fd, .events = POLLIN, .revents = 0},
            {.fd = stderr_pipe_.read_fd, .events = POLLIN, .revents = 0},
            {.fd = stdin_pipe_.write_fd, .events = POLLOUT, .revents = 0},
        }};

        const auto wait_time = std::min(limits.poll_interval, duration_cast<milliseconds>(deadline - now) + 1ms);
        TRYE(linux::poll(fds, gsl::narrow_cast<int>(wait_time.count())), SyscallFailure);

        TRY(drain(stdout_pipe_.read_fd, stdout_buffer_));
        TRY(drain(stderr_pipe_.read_fd, stderr_buffer_));
        TRY(feed_stdin(input, stdin_written));

        if (limits.max_output_bytes != 0 && stdout_buffer_.size() + stderr_buffer_.size() > limits.max_output_bytes) {
            return kill_for(RunResult::Limit::Output);
        }

        std::optional<int> status = TRY(poll_exit());

        if (status) {
            // Whatever is left in the pipes was written before exit
            TRY(drain(stdout_pipe_.read_fd, stdout_buffer_));
            TRY(drain(stderr_pipe_.read_fd, stderr_buffer_));
            close_pipes();

            auto result = WIFEXITED(*status) ? RunResult::make_exited(WEXITSTATUS(*status), elapsed())
                                             : RunResult::make_signaled(WTERMSIG(*status), elapsed());
            LOG_TRACE("Subprocess {} {}", child_pid_, result);

            return result;
        }

        if (limits.max_rss_bytes != 0) {
            // Fails only when the process is already gone, which the next poll_exit() will see
            auto rss = linux::resident_set_size(child_pid_);

            if (rss && *rss > limits.max_rss_bytes) {
                LOG_DEBUG("Subprocess {} resident set {} B exceeds {} B", child_pid_, *rss, limits.max_rss_bytes);
                return kill_for(RunResult::Limit::Memory);
            }
        }
    }
}

Result<void> Subprocess::kill() {
    if (!is_running()) {
        return {};
    }

    // The whole group, so that nothing the child spawned survives it
    const pid_t target = options_.new_process_group ? -child_pid_ : child_pid_;

    if (auto res = linux::kill(target, SIGKILL); !res) {
        if (res.error() != std::errc::no_such_process) {
            return ErrorKind::SyscallFailure;
        }
        TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);
    }

    auto status = TRYE(linux::waitpid(child_pid_), SyscallFailure);
    exit_status_ = status.status;

    return {};
}

Result<void> Subprocess::drain(int& fd, std::string& buffer) {
    for (int i = 0; i < MAX_CHUNKS_PER_DRAIN && fd != -1; ++i) {
        auto chunk = linux::read(fd, READ_CHUNK_SIZE);

        if (!chunk) {
            if (would_block(chunk.error()) || chunk.error() == std::errc::interrupted) {
                return {};
            }
            return ErrorKind::SyscallFailure;
        }

        if (chunk->empty()) {
            TRYE(linux::close(fd), SyscallFailure);
            fd = -1;
            return {};
        }

        buffer += *chunk;
    }

    return {};
}

Result<void> Subprocess::feed_stdin(std::string_view input, std::size_t& written) {
    if (stdin_pipe_.write_fd == -1) {
        return {};
    }

    while (written < input.size()) {
        auto res = linux::write(stdin_pipe_.write_fd, input.substr(written));

        if (!res) {
            if (would_block(res.error())) {
                return {};
            }

            // The child stopped reading; whatever it makes of the partial input is its business
            if (res.error() == std::errc::broken_pipe) {
                break;
            }

            return ErrorKind::SyscallFailure;
        }

        written += *res;
    }

    TRYE(linux::close(stdin_pipe_.write_fd), SyscallFailure);
    stdin_pipe_.write_fd = -1;

    return {};
}

Result<std::optional<int>> Subprocess::poll_exit() {
    auto status = TRYE(linux::waitpid(child_pid_, WNOHANG), SyscallFailure);

    if (status.pid == 0) {
        return std::optional<int>{};
    }

    exit_status_ = status.status;

    return exit_status_;
}

void Subprocess::close_pipes() {
    for (linux::Pipe* pipe : {&stdin_pipe_, &stdout_pipe_, &stderr_pipe_}) {
        for (int* fd : {&pipe->read_fd, &pipe->write_fd}) {
            if (*fd != -1) {
                std::ignore = linux::close(*fd);
                *fd = -1;
            }
        }
    }
}

} // namespace codegrader
