/**
 * @file test_process.cpp
 * @brief Tests for child process execution with captured output
 *
 * Covers:
 * - Exit codes and separate stdout/stderr capture
 * - Output caps, working directory and group kill on timeout
 * - Exec failures reported with the conventional status
 * - Long-lived children: liveness, stderr tail, termination
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/process.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

using namespace quest::bench;
using Catch::Matchers::ContainsSubstring;
using namespace std::chrono_literals;

namespace {

ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.args = {"-c", script};
    return spec;
}

}  // namespace

TEST_CASE("run_process captures both streams and the exit code", "[process]") {
    const auto result = run_process(shell("echo out; echo err 1>&2; exit 3"), 5000ms);

    REQUIRE_FALSE(result.spawn_failed);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.exit_code == 3);
    REQUIRE(result.stdout_text == "out\n");
    REQUIRE(result.stderr_text == "err\n");
    REQUIRE_FALSE(result.exited_cleanly());

    const auto ok = run_process(shell("true"), 5000ms);
    REQUIRE(ok.exited_cleanly());
}

TEST_CASE("run_process honours the working directory and output cap", "[process]") {
    auto spec = shell("pwd; printf 'abcdefghij' 1>&2");
    spec.working_dir = std::filesystem::temp_directory_path();

    const auto result = run_process(spec, 5000ms, 4);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_text == "abcd");
    REQUIRE(result.stdout_text.size() <= 4);
}

TEST_CASE("run_process kills the whole group on timeout", "[process]") {
    const auto started = std::chrono::steady_clock::now();
    const auto result = run_process(shell("echo started; sleep 30 & sleep 30"), 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.timed_out);
    REQUIRE_FALSE(result.exited_cleanly());
    REQUIRE(result.stdout_text == "started\n");
    REQUIRE(elapsed < 10s);
}

TEST_CASE("run_process reports exec failures", "[process]") {
    ProcessSpec spec;
    spec.executable = "/nonexistent/quest-bench-runtime";
    const auto result = run_process(spec, 5000ms);

    REQUIRE(result.exit_code == kExecFailedStatus);
    REQUIRE_THAT(result.stderr_text, ContainsSubstring("exec failed"));

    SECTION("a missing working directory fails the same way") {
        auto cd = shell("true");
        cd.working_dir = "/nonexistent/quest-bench-dir";
        const auto r = run_process(cd, 5000ms);
        REQUIRE(r.exit_code == kExecFailedStatus);
        REQUIRE_THAT(r.stderr_text, ContainsSubstring("chdir failed"));
    }
}

TEST_CASE("ChildProcess keeps the last stderr lines", "[process]") {
    auto child = ChildProcess::spawn(shell("echo one 1>&2; echo two 1>&2; echo three 1>&2; exit 4"), 2);
    REQUIRE(child->pid() > 0);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (child->running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE_FALSE(child->running());
    REQUIRE(child->exit_status().has_value());
    REQUIRE(child->stderr_tail() == "two\nthree\n");
}

TEST_CASE("ChildProcess terminates a running child", "[process]") {
    auto child = ChildProcess::spawn(shell("sleep 30"));
    REQUIRE(child->running());

    child->terminate(1000ms);
    REQUIRE_FALSE(child->running());
    REQUIRE(child->exit_status().has_value());

    child->terminate();
    REQUIRE_FALSE(child->running());
}

TEST_CASE("ChildProcess drains stderr while polling liveness", "[process]") {
    // More than a pipe buffer of output; the child blocks unless the parent keeps reading.
    auto child = ChildProcess::spawn(shell("yes line | head -n 20000 1>&2; echo done 1>&2"), 2);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (child->running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE_FALSE(child->running());
    REQUIRE(child->stderr_tail() == "line\ndone\n");
}
