/**
 * @file test_process_launcher.cpp
 * @brief Unit tests for child process launching, capture, deadlines and cancellation
 *
 * @author WASI conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 WASI conformance contributors

#include <catch2/catch.hpp>

#include "wasi_conformance/errors.hpp"
#include "wasi_conformance/process.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>

using namespace wasi::conformance;
using namespace std::chrono_literals;

namespace {

ProcessOutput sh(const std::string& script, ProcessLauncher::Config config = {}) {
    const ProcessLauncher launcher{config};
    return launcher.run(ProcessSpec{.argv = {"/bin/sh", "-c", script}});
}

}  // namespace

TEST_CASE("Launcher reports the exit status", "[process]") {
    REQUIRE(sh("exit 0").exit_code == 0);
    REQUIRE(sh("exit 7").exit_code == 7);

    const auto out = sh("exit 255");
    REQUIRE(out.exit_code == 255);
    REQUIRE(out.term_signal == 0);
    REQUIRE_FALSE(out.timed_out);
}

TEST_CASE("Launcher keeps stdout and stderr apart", "[process]") {
    const auto out = sh("printf 'to out\\n'; printf 'to err' >&2");
    REQUIRE(out.stdout_bytes == "to out\n");
    REQUIRE(out.stderr_bytes == "to err");
}

TEST_CASE("Launcher captures large outputs", "[process]") {
    const auto out = sh("head -c 1000000 /dev/zero; head -c 300000 /dev/zero >&2");
    REQUIRE(out.exit_code == 0);
    REQUIRE(out.stdout_bytes.size() == 1000000);
    REQUIRE(out.stderr_bytes.size() == 300000);
}

TEST_CASE("Launcher feeds stdin", "[process]") {
    const ProcessLauncher launcher{ProcessLauncher::Config{.timeout = 10s}};

    SECTION("given bytes are delivered then EOF") {
        const auto out = launcher.run(ProcessSpec{.argv = {"cat"}, .stdin_data = std::string{"line one\nline two"}});
        REQUIRE(out.stdout_bytes == "line one\nline two");
        REQUIRE_FALSE(out.timed_out);
    }

    SECTION("absent input reads as immediate EOF") {
        const auto out = launcher.run(ProcessSpec{.argv = {"cat"}});
        REQUIRE(out.stdout_bytes.empty());
        REQUIRE(out.exit_code == 0);
        REQUIRE_FALSE(out.timed_out);
    }

    SECTION("input larger than a pipe buffer") {
        const std::string input(500000, 'x');
        const auto out = launcher.run(ProcessSpec{.argv = {"cat"}, .stdin_data = input});
        REQUIRE(out.stdout_bytes == input);
    }

    SECTION("a child that ignores its input still finishes") {
        const std::string input(500000, 'x');
        const auto out = launcher.run(ProcessSpec{.argv = {"/bin/sh", "-c", "exit 4"}, .stdin_data = input});
        REQUIRE(out.exit_code == 4);
    }
}

TEST_CASE("Launcher runs in the requested working directory", "[process]") {
    testing::TempDir dir;
    const ProcessLauncher launcher{ProcessLauncher::Config{}};
    const auto out = launcher.run(ProcessSpec{.argv = {"/bin/sh", "-c", "pwd -P"}, .working_directory = dir.path()});
    REQUIRE(out.stdout_bytes == dir.path().string() + "\n");
}

TEST_CASE("Launcher reports launch failures", "[process][errors]") {
    const ProcessLauncher launcher{ProcessLauncher::Config{}};

    SECTION("missing executable") {
        try {
            (void)launcher.run(ProcessSpec{.argv = {"/nonexistent/wasi-conformance-runtime"}});
            FAIL("expected ProcessLaunchError");
        } catch (const ProcessLaunchError& ex) {
            REQUIRE(ex.error_number() == ENOENT);
        }
    }

    SECTION("missing working directory") {
        REQUIRE_THROWS_AS(launcher.run(ProcessSpec{.argv = {"true"}, .working_directory = "/nonexistent/dir"}),
                          ProcessLaunchError);
    }

    SECTION("empty command line") {
        REQUIRE_THROWS_AS(launcher.run(ProcessSpec{}), ProcessLaunchError);
    }
}

TEST_CASE("Launcher reports signal termination", "[process]") {
    const auto out = sh("kill -TERM $$");
    REQUIRE(out.term_signal == SIGTERM);
    REQUIRE(out.exit_code == -SIGTERM);
    REQUIRE_FALSE(out.timed_out);
}

TEST_CASE("Launcher kills a child that overruns its deadline", "[process][timeout]") {
    const auto started = std::chrono::steady_clock::now();
    const auto out = sh("printf partial; sleep 5", ProcessLauncher::Config{.timeout = 300ms});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(out.timed_out);
    REQUIRE(out.term_signal == SIGKILL);
    REQUIRE(out.stdout_bytes == "partial");
    REQUIRE(elapsed < 3s);
}

TEST_CASE("Launcher kills background descendants with the child", "[process][timeout]") {
    const auto started = std::chrono::steady_clock::now();
    const auto out = sh("sleep 5 & wait", ProcessLauncher::Config{.timeout = 300ms});
    REQUIRE(out.timed_out);
    REQUIRE(std::chrono::steady_clock::now() - started < 3s);
}

TEST_CASE("Launcher stops when cancellation is requested", "[process][cancel]") {
    std::atomic<bool> cancel{true};
    const auto started = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(sh("sleep 5", ProcessLauncher::Config{.cancel = &cancel}), RunInterrupted);
    REQUIRE(std::chrono::steady_clock::now() - started < 3s);
}

TEST_CASE("Launcher runs draw on one absolute deadline", "[process][timeout]") {
    const auto started = std::chrono::steady_clock::now();
    const ProcessLauncher launcher{ProcessLauncher::Config{.deadline = started + 800ms}};

    const auto first = launcher.run(ProcessSpec{.argv = {"/bin/sh", "-c", "sleep 0.5"}});
    REQUIRE_FALSE(first.timed_out);

    const auto second = launcher.run(ProcessSpec{.argv = {"/bin/sh", "-c", "sleep 0.5"}});
    REQUIRE(second.timed_out);
    REQUIRE(std::chrono::steady_clock::now() - started < 1500ms);
}
