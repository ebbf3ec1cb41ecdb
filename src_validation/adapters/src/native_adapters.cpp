#include "wasi_conformance/native_adapters.hpp"

#include <string>
#include <utility>
#include <vector>

namespace wasi::conformance::adapters {

NativeRuntimeAdapter::NativeRuntimeAdapter(std::string name, std::string executable)
    : name_{std::move(name)}, executable_{std::move(executable)} {}

ExecutionResult NativeRuntimeAdapter::execute(const InvocationDescriptor& invocation,
                                              const std::filesystem::path& working_directory,
                                              const ProcessLauncher& launcher) {
    ProcessSpec spec;
    spec.argv = command_line(invocation, working_directory);
    spec.working_directory = working_directory;
    spec.stdin_data = invocation.stdin_data;
    return to_result(launch(launcher, spec));
}

void NativeRuntimeAdapter::append_env(std::vector<std::string>& cmd, const InvocationDescriptor& invocation) {
    for (const auto& [key, value] : invocation.env) {
        cmd.emplace_back("--env");
        cmd.push_back(key + "=" + value);
    }
}

void NativeRuntimeAdapter::append_dir_mappings(std::vector<std::string>& cmd,
                                               const InvocationDescriptor& invocation,
                                               const char* flag,
                                               const char* separator) {
    for (const auto& [guest, host] : invocation.preopens) {
        cmd.emplace_back(flag);
        cmd.push_back(guest + separator + host);
    }
}

void NativeRuntimeAdapter::append_guest_args(std::vector<std::string>& cmd,
                                             const InvocationDescriptor& invocation,
                                             bool with_separator) {
    if (invocation.args.empty()) {
        return;
    }
    if (with_separator) {
        cmd.emplace_back("--");
    }
    cmd.insert(cmd.end(), invocation.args.begin(), invocation.args.end());
}

WasmerAdapter::WasmerAdapter(Config config) : NativeRuntimeAdapter{"wasmer", std::move(config.executable)} {}

std::vector<std::string> WasmerAdapter::command_line(const InvocationDescriptor& invocation,
                                                     const std::filesystem::path&) const {
    std::vector<std::string> cmd{executable(), "run", invocation.artifact.string()};
    append_env(cmd, invocation);
    append_dir_mappings(cmd, invocation, "--mapdir", kMapdirSeparator);
    append_guest_args(cmd, invocation, true);
    return cmd;
}

WasmtimeAdapter::WasmtimeAdapter(Config config)
    : NativeRuntimeAdapter{"wasmtime", std::move(config.executable)} {}

std::vector<std::string> WasmtimeAdapter::command_line(const InvocationDescriptor& invocation,
                                                       const std::filesystem::path&) const {
    std::vector<std::string> cmd{executable(), "run"};
    append_env(cmd, invocation);
    append_dir_mappings(cmd, invocation, "--mapdir", kMapdirSeparator);
    cmd.push_back(invocation.artifact.string());
    append_guest_args(cmd, invocation, true);
    return cmd;
}

}  // namespace wasi::conformance::adapters
