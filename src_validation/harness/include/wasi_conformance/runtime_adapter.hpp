#pragma once

#include "invocation.hpp"
#include "process.hpp"

#include <filesystem>
#include <string>

namespace wasi::conformance {

/**
 * \brief One WASI runtime behind the common invocation contract.
 *
 * Implementations translate env/args/preopens into the runtime's native syntax, keep the
 * artifact as the named guest program with extra arguments after it, and hand the result
 * back without touching the captured bytes.
 *
 * Every child process is started through the \a launcher the orchestrator passes in, so the
 * per-cell deadline is enforced by the harness and not by the adapter.
 *
 * Errors: AdapterLaunchError, AdapterTimeout, AdapterCompileError, AdapterRuntimeError.
 * A non-zero guest exit status is a successful ExecutionResult.
 */
class RuntimeAdapter {
public:
    virtual ~RuntimeAdapter() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    [[nodiscard]] virtual ExecutionResult execute(const InvocationDescriptor& invocation,
                                                  const std::filesystem::path& working_directory,
                                                  const ProcessLauncher& launcher) = 0;

protected:
    /// Runs through the launcher and maps launch failures to AdapterLaunchError.
    [[nodiscard]] ProcessOutput launch(const ProcessLauncher& launcher, const ProcessSpec& spec) const;

    /**
     * Converts a runtime run into an ExecutionResult.
     * A runtime killed by a signal the harness did not send raises AdapterRuntimeError.
     */
    [[nodiscard]] ExecutionResult to_result(ProcessOutput output) const;
};

}  // namespace wasi::conformance
