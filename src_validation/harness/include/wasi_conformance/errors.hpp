#pragma once

#include <stdexcept>
#include <string>

namespace wasi::conformance {

/**
 * \brief Root of every failure the harness raises on purpose.
 *
 * Anything that reaches the orchestrator and is *not* a HarnessError is treated as an
 * internal malfunction and reported as such.
 */
class HarnessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// Stable taxonomy name used in reports (e.g. "AdapterLaunchError").
    [[nodiscard]] virtual const char* kind() const noexcept { return "HarnessError"; }
};

/// The annotation block of a source file is not valid structured data.
class MalformedExpectation : public HarnessError {
public:
    using HarnessError::HarnessError;
    [[nodiscard]] const char* kind() const noexcept override { return "MalformedExpectation"; }
};

/// The annotation block never reached its blank-line sentinel.
class TruncatedExpectation : public MalformedExpectation {
public:
    using MalformedExpectation::MalformedExpectation;
    [[nodiscard]] const char* kind() const noexcept override { return "TruncatedExpectation"; }
};

/// No persisted record, or more than one candidate, for an artifact.
class ExpectationNotFound : public HarnessError {
public:
    using HarnessError::HarnessError;
    [[nodiscard]] const char* kind() const noexcept override { return "ExpectationNotFound"; }
};

class WorkspaceError : public HarnessError {
public:
    using HarnessError::HarnessError;
    [[nodiscard]] const char* kind() const noexcept override { return "WorkspaceError"; }
};

/// Fatal to the whole build step: broken fixture, not a runtime discrepancy.
class BuildError : public HarnessError {
public:
    using HarnessError::HarnessError;
    [[nodiscard]] const char* kind() const noexcept override { return "BuildError"; }
};

/// The run was cancelled from outside while a child process was in flight.
class RunInterrupted : public HarnessError {
public:
    using HarnessError::HarnessError;
    [[nodiscard]] const char* kind() const noexcept override { return "RunInterrupted"; }
};

/// A child process could not be started (pipe/fork/chdir/exec failure).
class ProcessLaunchError : public HarnessError {
public:
    ProcessLaunchError(const std::string& message, int error_number)
        : HarnessError(message), error_number_(error_number) {}

    [[nodiscard]] const char* kind() const noexcept override { return "ProcessLaunchError"; }
    [[nodiscard]] int error_number() const noexcept { return error_number_; }

private:
    int error_number_;
};

/**
 * \brief Failures local to one matrix cell.
 *
 * The orchestrator records these as outcome Error and moves on.
 */
class AdapterError : public HarnessError {
public:
    using HarnessError::HarnessError;
    [[nodiscard]] const char* kind() const noexcept override { return "AdapterError"; }
};

class AdapterLaunchError : public AdapterError {
public:
    using AdapterError::AdapterError;
    [[nodiscard]] const char* kind() const noexcept override { return "AdapterLaunchError"; }
};

class AdapterTimeout : public AdapterError {
public:
    using AdapterError::AdapterError;
    [[nodiscard]] const char* kind() const noexcept override { return "AdapterTimeout"; }
};

class AdapterCompileError : public AdapterError {
public:
    using AdapterError::AdapterError;
    [[nodiscard]] const char* kind() const noexcept override { return "AdapterCompileError"; }
};

class AdapterRuntimeError : public AdapterError {
public:
    using AdapterError::AdapterError;
    [[nodiscard]] const char* kind() const noexcept override { return "AdapterRuntimeError"; }
};

}  // namespace wasi::conformance
