#include "wasi_conformance/wasmedge_adapter.hpp"
#include "wasi_conformance/errors.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kDiagLimit = 400;

std::string tail(const std::string& text) {
    if (text.size() <= kDiagLimit) {
        return text;
    }
    return "..." + text.substr(text.size() - kDiagLimit);
}

}  // namespace

namespace wasi::conformance::adapters {

WasmEdgeAdapter::WasmEdgeAdapter(Config config)
    : NativeRuntimeAdapter{"wasmedge", std::move(config.executable)}, compiler_{std::move(config.compiler)} {}

fs::path WasmEdgeAdapter::object_path(const InvocationDescriptor& invocation,
                                      const fs::path& working_directory) const {
    auto object = fs::absolute(working_directory / invocation.artifact.filename());
    object.replace_extension(".so");
    return object;
}

std::vector<std::string> WasmEdgeAdapter::compile_command(const InvocationDescriptor& invocation,
                                                          const fs::path& working_directory) const {
    return {compiler_, invocation.artifact.string(), object_path(invocation, working_directory).string()};
}

std::vector<std::string> WasmEdgeAdapter::command_line(const InvocationDescriptor& invocation,
                                                       const fs::path& working_directory) const {
    std::vector<std::string> cmd{executable()};
    append_env(cmd, invocation);
    append_dir_mappings(cmd, invocation, "--dir", kDirSeparator);
    cmd.push_back(object_path(invocation, working_directory).string());
    append_guest_args(cmd, invocation, false);
    return cmd;
}

ExecutionResult WasmEdgeAdapter::execute(const InvocationDescriptor& invocation,
                                         const fs::path& working_directory,
                                         const ProcessLauncher& launcher) {
    ProcessSpec compile;
    compile.argv = compile_command(invocation, working_directory);
    compile.working_directory = working_directory;

    const auto compiled = launch(launcher, compile);
    if (compiled.timed_out) {
        throw AdapterTimeout(name() + ": ahead-of-time compile of " + invocation.artifact.string() +
                             " exceeded the deadline");
    }
    if (compiled.exit_code != 0) {
        throw AdapterCompileError(name() + ": ahead-of-time compile of " + invocation.artifact.string() +
                                  " failed with status " + std::to_string(compiled.exit_code) + ": " +
                                  tail(compiled.stderr_bytes));
    }

    return NativeRuntimeAdapter::execute(invocation, working_directory, launcher);
}

}  // namespace wasi::conformance::adapters
