#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wasi::conformance {

/**
 * \brief Normalised expectation for one conformance case.
 *
 * Created once at build time from the annotation block of the test source and persisted
 * next to the compiled module. The harness only ever reads it afterwards.
 *
 * JSON keys (persisted form):
 *   - `stdin`    (string, optional): bytes fed to the guest's standard input.
 *   - `env`      (object): guest environment variables.
 *   - `args`     (array): guest arguments following argv[0].
 *   - `preopens` (object): guest path -> host path, relative to the case working directory.
 *   - `stdout`, `stderr` (string): exact expected output.
 *   - `exitCode` (integer): expected exit status.
 *   - `timeout`  (number): seconds before the run is killed, at most kMaxTimeoutSeconds.
 */
/// One day. Keeps every deadline representable as a steady_clock time point.
inline constexpr double kMaxTimeoutSeconds = 24.0 * 60.0 * 60.0;

struct ExpectationRecord {
    std::optional<std::string> stdin_data{};
    std::map<std::string, std::string> env{};
    std::vector<std::string> args{};
    std::map<std::string, std::string> preopens{};
    std::string expected_stdout{};
    std::string expected_stderr{};
    int expected_exit_code{0};
    double timeout_seconds{5.0};

    friend bool operator==(const ExpectationRecord&, const ExpectationRecord&) = default;
};

/**
 * \brief Builds a record from a parsed JSON document, applying defaults.
 *
 * Throws MalformedExpectation when the document is not an object, a known key carries the
 * wrong type, or the timeout is not a positive number. \a origin only decorates messages.
 */
[[nodiscard]] ExpectationRecord expectation_from_json(const nlohmann::json& document,
                                                      const std::string& origin);

/// Full normalised form; `stdin` is omitted when absent.
[[nodiscard]] nlohmann::json expectation_to_json(const ExpectationRecord& record);

/// Canonical text: sorted keys, two-space indent, ASCII only, trailing newline.
[[nodiscard]] std::string canonical_expectation_text(const ExpectationRecord& record);

}  // namespace wasi::conformance
