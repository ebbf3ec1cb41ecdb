#include "wasi_conformance/glue_adapters.hpp"
#include "wasi_conformance/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef WASI_CONFORMANCE_DENO_WASI_MODULE
  #define WASI_CONFORMANCE_DENO_WASI_MODULE "https://deno.land/std@0.205.0/wasi/snapshot_preview1.ts"
#endif

namespace fs = std::filesystem;

namespace wasi::conformance::adapters {

GlueScriptAdapter::GlueScriptAdapter(std::string name, std::string executable)
    : name_{std::move(name)}, executable_{std::move(executable)} {}

std::string GlueScriptAdapter::config_json(const InvocationDescriptor& invocation) {
    const nlohmann::json config = {
        {"args", invocation.args},
        {"env", invocation.env},
        {"preopens", invocation.preopens},
    };
    return config.dump();
}

std::vector<std::string> GlueScriptAdapter::command_line(const InvocationDescriptor& invocation,
                                                         const fs::path& glue_path) const {
    std::vector<std::string> cmd{executable_};
    const auto flags = interpreter_flags();
    cmd.insert(cmd.end(), flags.begin(), flags.end());
    cmd.push_back(glue_path.string());
    cmd.push_back(config_json(invocation));
    cmd.push_back(invocation.artifact.string());
    return cmd;
}

ExecutionResult GlueScriptAdapter::execute(const InvocationDescriptor& invocation,
                                           const fs::path& working_directory,
                                           const ProcessLauncher& launcher) {
    const auto glue_path = fs::absolute(working_directory / glue_filename());
    {
        std::ofstream glue(glue_path, std::ios::binary | std::ios::trunc);
        if (!glue.is_open()) {
            throw AdapterRuntimeError(name() + ": unable to write glue program " + glue_path.string());
        }
        glue << glue_source();
        if (!glue) {
            throw AdapterRuntimeError(name() + ": short write on glue program " + glue_path.string());
        }
    }

    ProcessSpec spec;
    spec.argv = command_line(invocation, glue_path);
    spec.working_directory = working_directory;
    spec.stdin_data = invocation.stdin_data;
    return to_result(launch(launcher, spec));
}

DenoAdapter::DenoAdapter(Config config)
    : GlueScriptAdapter{"deno", std::move(config.executable)},
      wasi_module_{config.wasi_module.empty() ? std::string{WASI_CONFORMANCE_DENO_WASI_MODULE}
                                              : std::move(config.wasi_module)} {}

std::vector<std::string> DenoAdapter::interpreter_flags() const {
    return {"run", "--quiet", "--allow-all", "--unstable"};
}

std::string DenoAdapter::glue_source() const {
    std::string source = "import Context from \"" + wasi_module_ + "\";\n";
    source += R"(
const config = JSON.parse(Deno.args[0]);
const buffer = Deno.readFileSync(Deno.args[1]);

const context = new Context({
  env: config.env ?? {},
  args: [Deno.args[1], ...config.args],
  preopens: config.preopens,
});

const { instance } = await WebAssembly.instantiate(buffer, {
  wasi_snapshot_preview1: context.exports,
});

context.start(instance);
)";
    return source;
}

NodeAdapter::NodeAdapter(Config config) : GlueScriptAdapter{"node", std::move(config.executable)} {}

std::vector<std::string> NodeAdapter::interpreter_flags() const {
    return {"--no-warnings", "--experimental-wasi-unstable-preview1", "--experimental-wasm-bigint"};
}

std::string NodeAdapter::glue_source() const {
    return R"("use strict";
const fs = require("fs");
const { WASI } = require("wasi");

const config = JSON.parse(process.argv[2]);
const buffer = fs.readFileSync(process.argv[3]);

const wasi = new WASI({
  version: "preview1",
  env: config.env ?? {},
  args: [process.argv[3], ...config.args],
  preopens: config.preopens,
  returnOnExit: true,
});

WebAssembly.instantiate(buffer, {
  wasi_snapshot_preview1: wasi.wasiImport,
}).then(function ({ instance }) {
  const code = wasi.start(instance);
  process.exitCode = typeof code === "number" ? code : 0;
});
)";
}

}  // namespace wasi::conformance::adapters
