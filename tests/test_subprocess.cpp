#include "catch2_custom.hpp"

#include "subprocess/subprocess.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/subprocess/run_result.hpp>

#include <chrono>
#include <csignal>
#include <stop_token>
#include <string>

using namespace std::chrono_literals;
using codegrader::ErrorKind;
using codegrader::RunLimits;
using codegrader::RunResult;
using codegrader::SpawnOptions;
using codegrader::Subprocess;

TEST_CASE("Read /bin/echo stdout") {
    Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    auto run_res = proc.run("", RunLimits{});

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == RunResult::Kind::Exited);
    REQUIRE(run_res->get_code() == 0);
    REQUIRE(proc.get_stdout() == "Hello world!");
    REQUIRE_FALSE(proc.is_running());
}

TEST_CASE("Interact with /bin/cat") {
    Subprocess proc("/bin/cat", {});
    REQUIRE(proc.start());

    auto run_res = proc.run("Goodbye dog...", RunLimits{});

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == RunResult::Kind::Exited);
    REQUIRE(proc.get_stdout() == "Goodbye dog...");
}

TEST_CASE("Input larger than a pipe buffer is fed completely") {
    const std::string input(1024 * 1024, 'x');

    Subprocess proc("/bin/cat", {});
    REQUIRE(proc.start());

    auto run_res = proc.run(input, RunLimits{.timeout = 10s});

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == RunResult::Kind::Exited);
    REQUIRE(proc.get_stdout().size() == input.size());
}

TEST_CASE("Exit codes and signals are reported") {
    SECTION("Exit code") {
        Subprocess proc("/bin/sh", {"-c", "echo oops >&2; exit 3"});
        REQUIRE(proc.start());

        auto run_res = proc.run("", RunLimits{});

        REQUIRE(run_res);
        REQUIRE(run_res->get_kind() == RunResult::Kind::Exited);
        REQUIRE(run_res->get_code() == 3);
        REQUIRE(proc.get_stderr() == "oops\n");
    }

    SECTION("Signal") {
        Subprocess proc("/bin/sh", {"-c", "kill -TERM $$"});
        REQUIRE(proc.start());

        auto run_res = proc.run("", RunLimits{});

        REQUIRE(run_res);
        REQUIRE(run_res->get_kind() == RunResult::Kind::Signaled);
        REQUIRE(run_res->get_code() == SIGTERM);
    }
}

TEST_CASE("The environment is not inherited") {
    Subprocess proc("/usr/bin/env", {}, SpawnOptions{.env = {"ONLY=this"}});
    REQUIRE(proc.start());

    auto run_res = proc.run("", RunLimits{});

    REQUIRE(run_res);
    REQUIRE(proc.get_stdout() == "ONLY=this\n");
}

TEST_CASE("The working directory is set") {
    Subprocess proc("/bin/pwd", {}, SpawnOptions{.working_dir = "/tmp"});
    REQUIRE(proc.start());

    REQUIRE(proc.run("", RunLimits{}));
    REQUIRE(proc.get_stdout() == "/tmp\n");
}

TEST_CASE("A missing executable is reported at start") {
    Subprocess proc("/nonexistent/definitely-not-here", {});

    REQUIRE(proc.start() == ErrorKind::SandboxUnavailable);
    REQUIRE_FALSE(proc.is_running());
}

TEST_CASE("Deadlines kill the process") {
    Subprocess proc("/bin/sleep", {"10"});
    REQUIRE(proc.start());

    auto run_res = proc.run("", RunLimits{.timeout = 100ms});

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == RunResult::Kind::LimitKilled);
    REQUIRE(run_res->get_limit() == RunResult::Limit::Deadline);
    REQUIRE(run_res->get_code() == SIGKILL);
    REQUIRE(run_res->get_elapsed() >= 100ms);
    REQUIRE(run_res->get_elapsed() < 2s);
    REQUIRE_FALSE(proc.is_running());
}

TEST_CASE("Children of the process are killed with it") {
    // The shell waits on sleep, which is in the same process group
    Subprocess proc("/bin/sh", {"-c", "/bin/sleep 10; echo done"});
    REQUIRE(proc.start());

    auto run_res = proc.run("", RunLimits{.timeout = 100ms});

    REQUIRE(run_res);
    REQUIRE(run_res->get_limit() == RunResult::Limit::Deadline);
    REQUIRE(proc.get_stdout().empty());
}

TEST_CASE("Output limits kill the process") {
    Subprocess proc("/bin/cat", {"/dev/zero"});
    REQUIRE(proc.start());

    auto run_res = proc.run("", RunLimits{.timeout = 5s, .max_output_bytes = 4096});

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == RunResult::Kind::LimitKilled);
    REQUIRE(run_res->get_limit() == RunResult::Limit::Output);
}

TEST_CASE("Stop requests kill the process") {
    std::stop_source stop_source;
    stop_source.request_stop();

    Subprocess proc("/bin/sleep", {"10"});
    REQUIRE(proc.start());

    auto run_res = proc.run("", RunLimits{}, stop_source.get_token());

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == RunResult::Kind::LimitKilled);
    REQUIRE(run_res->get_limit() == RunResult::Limit::Cancelled);
}

TEST_CASE("Destroying a running subprocess kills it") {
    pid_t pid = 0;

    {
        Subprocess proc("/bin/sleep", {"10"});
        REQUIRE(proc.start());
        pid = proc.get_pid();
        REQUIRE(pid > 0);
    }

    // Reaped by the destructor, so the pid no longer exists
    REQUIRE(::kill(pid, 0) == -1);
}
