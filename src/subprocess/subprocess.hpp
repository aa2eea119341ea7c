#pragma once

#include <codegrader/common/class_traits.hpp>
#include <codegrader/common/error_types.hpp>
#include <codegrader/common/linux.hpp>
#include <codegrader/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace codegrader {

/// How the child process is set up between fork and execve
struct SpawnOptions
{
    /// Complete environment of the child, as "KEY=value" strings. Nothing is inherited.
    std::vector<std::string> env;

    std::string working_dir = "/";

    /// Put the child in its own process group, so that it can be killed along with anything it spawns
    bool new_process_group = true;

    /// Best-effort: move the child into fresh user and network namespaces
    bool isolate_namespaces = false;

    /// RLIMIT_CPU, in seconds. A backstop only; wall-clock deadlines are enforced by run()
    std::optional<rlim_t> cpu_seconds;

    /// RLIMIT_FSIZE; 0 forbids creating non-empty files
    std::optional<rlim_t> file_size_bytes = 0;

    /// RLIMIT_CORE
    std::optional<rlim_t> core_bytes = 0;
};

/// Limits enforced by the parent while it supervises a running child
struct RunLimits
{
    std::chrono::milliseconds timeout{3000};

    /// Kill the child when its resident set grows past this many bytes. 0 disables the check
    std::size_t max_rss_bytes = 0;

    /// Kill the child once stdout and stderr together exceed this many bytes. 0 disables the check
    std::size_t max_output_bytes = 0;

    /// How often the watchdog wakes up when the child is quiet
    std::chrono::milliseconds poll_interval{5};
};

/// A child process connected to the parent by three pipes (stdin, stdout, stderr)
class Subprocess : NonCopyable
{
public:
    /// Prepares (but does not start) a sub (child) process running ``exec`` with ``args``.
    /// ``args`` does not include argv[0]; ``exec`` is used for that.
    Subprocess(std::string exec, std::vector<std::string> args, SpawnOptions options = {});
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    /// Forks the current process and execs the child.
    /// Fails with SandboxUnavailable when the executable could not be exec'd.
    Result<void> start();

    /// Feed ``input`` to the child's stdin, then close it, while collecting stdout and stderr.
    /// Returns when the child exits or is killed for exceeding ``limits`` or because ``stop`` was requested.
    /// The child is always reaped by the time this returns successfully.
    Result<RunResult> run(std::string_view input, const RunLimits& limits, std::stop_token stop = {});

    /// Kill the child's process group with SIGKILL and reap the child
    Result<void> kill();

    bool is_running() const { return child_pid_ != 0 && !exit_status_; }

    pid_t get_pid() const { return child_pid_; }

    const std::string& get_stdout() const { return stdout_buffer_; }

    const std::string& get_stderr() const { return stderr_buffer_; }

private:
    /// Runs in the child between fork and execve. Only async-signal-safe calls are allowed here.
    [[noreturn]] void exec_child(int exec_error_fd, const std::vector<char*>& argv, const std::vector<char*>& envp);

    /// Blocks until the child execs or fails to
    Result<void> await_exec(int exec_error_fd);

    /// Non-blocking read of whatever is available on ``fd`` into ``buffer``.
    /// Closes ``fd`` and sets it to -1 on end-of-file.
    Result<void> drain(int& fd, std::string& buffer);

    /// Writes as much of the remaining stdin as the pipe accepts. Closes stdin when everything was written.
    Result<void> feed_stdin(std::string_view input, std::size_t& written);

    /// Non-blocking check for child exit
    Result<std::optional<int>> poll_exit();

    void close_pipes();

    std::string exec_;
    std::vector<std::string> args_;
    SpawnOptions options_;

    pid_t child_pid_{};

    /// The parent only uses the write end of stdin_pipe_ and the read ends of the others
    linux::Pipe stdin_pipe_{};
    linux::Pipe stdout_pipe_{};
    linux::Pipe stderr_pipe_{};

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    /// Raw wait status, once the child has been reaped
    std::optional<int> exit_status_;
};

} // namespace codegrader
