#pragma once

#include "wasi_conformance/runtime_adapter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wasi::conformance::adapters {

/**
 * \brief Runtimes reached through a general-purpose JavaScript host.
 *
 * The adapter writes a generated glue program into the case working directory and runs
 *
 *   <interpreter> <flags...> <glue> <config-json> <artifact>
 *
 * The glue builds the WASI object itself: guest argv is `[artifact, ...config.args]`,
 * guest environment is `config.env` and filesystem exposure is `config.preopens`.
 * `config-json` carries only those three keys.
 */
class GlueScriptAdapter : public RuntimeAdapter {
public:
    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    [[nodiscard]] ExecutionResult execute(const InvocationDescriptor& invocation,
                                          const std::filesystem::path& working_directory,
                                          const ProcessLauncher& launcher) override;

    [[nodiscard]] std::vector<std::string> command_line(const InvocationDescriptor& invocation,
                                                        const std::filesystem::path& glue_path) const;

    [[nodiscard]] static std::string config_json(const InvocationDescriptor& invocation);

    [[nodiscard]] virtual std::string glue_source() const = 0;
    [[nodiscard]] virtual const char* glue_filename() const noexcept = 0;

protected:
    GlueScriptAdapter(std::string name, std::string executable);

    [[nodiscard]] virtual std::vector<std::string> interpreter_flags() const = 0;

private:
    std::string name_;
    std::string executable_;
};

class DenoAdapter final : public GlueScriptAdapter {
public:
    struct Config {
        std::string executable{"deno"};
        std::string wasi_module{};  ///< Import URL of the std WASI context; empty = built-in default
    };

    explicit DenoAdapter(Config config);

    [[nodiscard]] std::string glue_source() const override;
    [[nodiscard]] const char* glue_filename() const noexcept override { return ".deno.ts"; }

protected:
    [[nodiscard]] std::vector<std::string> interpreter_flags() const override;

private:
    std::string wasi_module_;
};

class NodeAdapter final : public GlueScriptAdapter {
public:
    struct Config {
        std::string executable{"node"};
    };

    explicit NodeAdapter(Config config);

    [[nodiscard]] std::string glue_source() const override;
    [[nodiscard]] const char* glue_filename() const noexcept override { return ".node.js"; }

protected:
    [[nodiscard]] std::vector<std::string> interpreter_flags() const override;
};

}  // namespace wasi::conformance::adapters
