#include "wasi_conformance/runtime_adapter.hpp"
#include "wasi_conformance/errors.hpp"

#include <cstring>
#include <string>
#include <utility>

namespace wasi::conformance {

ProcessOutput RuntimeAdapter::launch(const ProcessLauncher& launcher, const ProcessSpec& spec) const {
    try {
        return launcher.run(spec);
    } catch (const ProcessLaunchError& ex) {
        throw AdapterLaunchError(name() + ": " + ex.what());
    }
}

ExecutionResult RuntimeAdapter::to_result(ProcessOutput output) const {
    if (output.term_signal != 0 && !output.timed_out) {
        throw AdapterRuntimeError(name() + ": runtime terminated by signal " +
                                  std::to_string(output.term_signal) + " (" +
                                  ::strsignal(output.term_signal) + ")");
    }

    ExecutionResult result;
    result.stdout_bytes = std::move(output.stdout_bytes);
    result.stderr_bytes = std::move(output.stderr_bytes);
    result.exit_code = output.exit_code;
    result.timed_out = output.timed_out;
    return result;
}

}  // namespace wasi::conformance
