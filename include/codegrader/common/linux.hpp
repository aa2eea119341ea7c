#pragma once

#include <codegrader/common/expected.hpp>
#include <codegrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers around the syscalls used by the sandbox.
/// Every wrapper logs failures at debug level and returns the errno as a std::error_code.
///
/// None of these may be used in a forked child before execve: logging is not async-signal-safe.
namespace codegrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns the number of bytes written, which may be less than ``data.size()`` for non-blocking fds
inline Expected<std::size_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return static_cast<std::size_t>(res);
}

/// reads up to ``count`` bytes from a file descriptor. See read(2)
/// an empty result means end-of-file
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// a negative ``pid`` signals the whole process group
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill(pid={}, sig={}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

inline Expected<> set_nonblocking(int fd) {
    auto flags = fcntl(fd, F_GETFL);
    if (!flags) {
        return flags.error();
    }

    auto res = fcntl(fd, F_SETFL, flags.value() | O_NONBLOCK); // NOLINT(hicpp-signed-bitwise)
    if (!res) {
        return res.error();
    }

    return {};
}

/// see poll(2)
/// returns the number of ready descriptors; 0 on timeout. EINTR is reported as 0 ready descriptors.
inline Expected<int> poll(std::span<pollfd> fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct WaitStatus
{
    pid_t pid; ///< 0 if the child has not changed state (only with WNOHANG)
    int status;
};

/// see waitpid(2)
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res{};

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid(pid={}) failed: '{}'", pid, err.message());

        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

/// see ioctl(2)
// NOLINTNEXTLINE(google-runtime-int)
inline Expected<int> ioctl(int fd, unsigned long request, void* argp) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::ioctl(fd, request, argp);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("ioctl failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    if (::setpgid(pid, pgid) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid(pid={}, pgid={}) failed: '{}'", pid, pgid, err.message());

        return err;
    }

    return {};
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = O_CLOEXEC) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// Resident set size of a live process, in bytes, read from /proc/<pid>/statm
inline Expected<std::size_t> resident_set_size(pid_t pid) {
    std::ifstream statm{fmt::format("/proc/{}/statm", pid)};

    std::size_t total_pages = 0;
    std::size_t resident_pages = 0;

    if (!(statm >> total_pages >> resident_pages)) {
        // The process most likely exited between polls
        return std::make_error_code(std::errc::no_such_process);
    }

    static const auto page_size = static_cast<std::size_t>(::sysconf(_SC_PAGESIZE));

    return resident_pages * page_size;
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    std::string to_string() const {
        const char* descr = sigdescr_np(signal_num_);
        return descr != nullptr ? descr : fmt::format("signal {}", signal_num_);
    }

    friend std::string format_as(const Signal& from) { return from.to_string(); }

private:
    int signal_num_;
};

} // namespace codegrader::linux
