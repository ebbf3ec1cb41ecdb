#pragma once

#include "expectation.hpp"
#include "invocation.hpp"

#include <string>

namespace wasi::conformance {

/// Pass: runtime agreed. Fail: runtime disagreed or timed out. Error: the harness broke.
enum class Outcome { Pass, Fail, Error };

[[nodiscard]] const char* to_string(Outcome outcome) noexcept;

struct Grade {
    Outcome outcome{Outcome::Fail};
    std::string detail;  ///< Empty on Pass, first mismatch otherwise
};

/**
 * \brief Compares one execution with its expectation.
 *
 * Pure: Pass iff stdout, stderr and exit code match exactly and the run did not time out.
 * Never returns Error; that outcome belongs to adapter exceptions.
 */
[[nodiscard]] Grade grade(const ExecutionResult& result, const ExpectationRecord& expected);

}  // namespace wasi::conformance
