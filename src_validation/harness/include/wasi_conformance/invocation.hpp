#pragma once

#include "expectation.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wasi::conformance {

/**
 * \brief Runtime-agnostic execution request for one adapter run.
 *
 * Built fresh for each adapter from the read-only ExpectationRecord, so adapters can never
 * alter what the next adapter sees.
 */
struct InvocationDescriptor {
    std::filesystem::path artifact;  ///< Absolute path of the module under test
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> preopens;
    std::optional<std::string> stdin_data;
    std::chrono::milliseconds timeout{5000};

    /// Guest argv: the artifact is argv[0], extra arguments follow it.
    [[nodiscard]] std::vector<std::string> guest_argv() const;
};

[[nodiscard]] InvocationDescriptor describe_invocation(const ExpectationRecord& record,
                                                       const std::filesystem::path& artifact);

/// Raw result of one adapter run. The guest's exit status is carried as-is.
struct ExecutionResult {
    std::string stdout_bytes;
    std::string stderr_bytes;
    int exit_code{0};
    bool timed_out{false};
};

}  // namespace wasi::conformance
