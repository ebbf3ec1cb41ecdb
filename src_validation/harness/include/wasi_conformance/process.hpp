#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wasi::conformance {

struct ProcessSpec {
    std::vector<std::string> argv;               ///< argv[0] is looked up on PATH
    std::filesystem::path working_directory{};   ///< Empty keeps the harness cwd
    std::optional<std::string> stdin_data{};     ///< Absent: the child reads EOF immediately
};

struct ProcessOutput {
    std::string stdout_bytes;
    std::string stderr_bytes;
    int exit_code{0};     ///< Exit status, or minus the signal number when signalled
    int term_signal{0};   ///< Non-zero when the child was terminated by a signal
    bool timed_out{false};
};

/**
 * \brief Runs one child process to completion under a deadline.
 *
 * The child is placed in its own process group. Its stdin/stdout/stderr are pipes serviced
 * with poll(), so large outputs never dead-lock against a full pipe. When the deadline
 * expires (or the cancel flag is raised) the whole group receives SIGKILL.
 *
 * With only \a timeout set, each run() gets its own deadline counted from its start. With
 * \a deadline set, consecutive runs draw on one budget.
 *
 * Throws ProcessLaunchError when the child cannot be started (including exec failure, which
 * is reported back from the child through a close-on-exec pipe), and RunInterrupted when the
 * cancel flag stopped the child.
 */
class ProcessLauncher {
public:
    struct Config {
        std::chrono::milliseconds timeout{0};          ///< 0 = no deadline
        /// Absolute deadline shared by every run() of this launcher; overrides \a timeout.
        std::optional<std::chrono::steady_clock::time_point> deadline{};
        const std::atomic<bool>* cancel{nullptr};      ///< Optional external stop request
    };

    explicit ProcessLauncher(Config config);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] ProcessOutput run(const ProcessSpec& spec) const;

private:
    Config config_;
};

}  // namespace wasi::conformance
