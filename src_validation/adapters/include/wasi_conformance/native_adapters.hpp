#pragma once

#include "wasi_conformance/runtime_adapter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wasi::conformance::adapters {

/**
 * \brief Runtimes invoked directly as a native executable.
 *
 * Environment goes through one `--env KEY=VALUE` per key; preopens through one directory
 * mapping flag per guest path. The mapping syntax differs per runtime and is owned by
 * each subclass.
 */
class NativeRuntimeAdapter : public RuntimeAdapter {
public:
    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    [[nodiscard]] ExecutionResult execute(const InvocationDescriptor& invocation,
                                          const std::filesystem::path& working_directory,
                                          const ProcessLauncher& launcher) override;

    [[nodiscard]] virtual std::vector<std::string> command_line(
        const InvocationDescriptor& invocation,
        const std::filesystem::path& working_directory) const = 0;

protected:
    NativeRuntimeAdapter(std::string name, std::string executable);

    [[nodiscard]] const std::string& executable() const noexcept { return executable_; }

    static void append_env(std::vector<std::string>& cmd, const InvocationDescriptor& invocation);

    static void append_dir_mappings(std::vector<std::string>& cmd,
                                    const InvocationDescriptor& invocation,
                                    const char* flag,
                                    const char* separator);

    /// Guest arguments after an optional `--`; nothing is appended when there are none.
    static void append_guest_args(std::vector<std::string>& cmd,
                                  const InvocationDescriptor& invocation,
                                  bool with_separator);

private:
    std::string name_;
    std::string executable_;
};

/// `wasmer run <artifact> --env K=V --mapdir GUEST:HOST -- args...`
class WasmerAdapter final : public NativeRuntimeAdapter {
public:
    static constexpr const char* kMapdirSeparator = ":";

    struct Config {
        std::string executable{"wasmer"};
    };

    explicit WasmerAdapter(Config config);

    [[nodiscard]] std::vector<std::string> command_line(
        const InvocationDescriptor& invocation,
        const std::filesystem::path& working_directory) const override;
};

/// `wasmtime run --env K=V --mapdir GUEST::HOST <artifact> -- args...`
class WasmtimeAdapter final : public NativeRuntimeAdapter {
public:
    static constexpr const char* kMapdirSeparator = "::";

    struct Config {
        std::string executable{"wasmtime"};
    };

    explicit WasmtimeAdapter(Config config);

    [[nodiscard]] std::vector<std::string> command_line(
        const InvocationDescriptor& invocation,
        const std::filesystem::path& working_directory) const override;
};

}  // namespace wasi::conformance::adapters
