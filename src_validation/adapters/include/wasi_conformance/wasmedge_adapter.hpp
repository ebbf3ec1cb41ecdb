#pragma once

#include "native_adapters.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wasi::conformance::adapters {

/**
 * \brief WasmEdge, which runs an ahead-of-time compiled object.
 *
 * execute() first compiles the artifact into `<working_directory>/<stem>.so`:
 *
 *   wasmedgec <artifact> <object>
 *   wasmedge --env K=V --dir GUEST:HOST <object> args...
 *
 * A failing compile raises AdapterCompileError, a compile that overruns the cell deadline
 * raises AdapterTimeout. Both are distinct from anything the guest does at run time.
 */
class WasmEdgeAdapter final : public NativeRuntimeAdapter {
public:
    static constexpr const char* kDirSeparator = ":";

    struct Config {
        std::string executable{"wasmedge"};
        std::string compiler{"wasmedgec"};
    };

    explicit WasmEdgeAdapter(Config config);

    [[nodiscard]] ExecutionResult execute(const InvocationDescriptor& invocation,
                                          const std::filesystem::path& working_directory,
                                          const ProcessLauncher& launcher) override;

    [[nodiscard]] std::filesystem::path object_path(const InvocationDescriptor& invocation,
                                                    const std::filesystem::path& working_directory) const;

    [[nodiscard]] std::vector<std::string> compile_command(
        const InvocationDescriptor& invocation,
        const std::filesystem::path& working_directory) const;

    [[nodiscard]] std::vector<std::string> command_line(
        const InvocationDescriptor& invocation,
        const std::filesystem::path& working_directory) const override;

private:
    std::string compiler_;
};

}  // namespace wasi::conformance::adapters
