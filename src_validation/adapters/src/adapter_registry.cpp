#include "wasi_conformance/adapter_registry.hpp"
#include "wasi_conformance/glue_adapters.hpp"
#include "wasi_conformance/native_adapters.hpp"
#include "wasi_conformance/wasmedge_adapter.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kWasmEdgeCompiler = "wasmedgec";

std::string executable_for(const std::map<std::string, std::string>& executables,
                           const std::string& key,
                           const std::string& fallback) {
    const auto it = executables.find(key);
    return it == executables.end() ? fallback : it->second;
}

}  // namespace

namespace wasi::conformance::adapters {

const std::vector<std::string>& adapter_names() {
    static const std::vector<std::string> names{"deno", "node", "wasmer", "wasmtime", "wasmedge"};
    return names;
}

AdapterList make_adapters(const std::vector<std::string>& selection,
                          const std::map<std::string, std::string>& executables) {
    const auto& known = adapter_names();
    for (const auto& wanted : selection) {
        if (std::find(known.begin(), known.end(), wanted) == known.end()) {
            throw std::invalid_argument("Unknown adapter '" + wanted + "'");
        }
    }
    for (const auto& [key, path] : executables) {
        if (key != kWasmEdgeCompiler && std::find(known.begin(), known.end(), key) == known.end()) {
            throw std::invalid_argument("Unknown runtime executable key '" + key + "'");
        }
    }

    auto selected = [&selection](const std::string& adapter) {
        return selection.empty() || std::find(selection.begin(), selection.end(), adapter) != selection.end();
    };

    AdapterList adapters;
    if (selected("deno")) {
        adapters.push_back(std::make_unique<DenoAdapter>(DenoAdapter::Config{
            .executable = executable_for(executables, "deno", "deno"),
        }));
    }
    if (selected("node")) {
        adapters.push_back(std::make_unique<NodeAdapter>(NodeAdapter::Config{
            .executable = executable_for(executables, "node", "node"),
        }));
    }
    if (selected("wasmer")) {
        adapters.push_back(std::make_unique<WasmerAdapter>(WasmerAdapter::Config{
            .executable = executable_for(executables, "wasmer", "wasmer"),
        }));
    }
    if (selected("wasmtime")) {
        adapters.push_back(std::make_unique<WasmtimeAdapter>(WasmtimeAdapter::Config{
            .executable = executable_for(executables, "wasmtime", "wasmtime"),
        }));
    }
    if (selected("wasmedge")) {
        adapters.push_back(std::make_unique<WasmEdgeAdapter>(WasmEdgeAdapter::Config{
            .executable = executable_for(executables, "wasmedge", "wasmedge"),
            .compiler = executable_for(executables, kWasmEdgeCompiler, kWasmEdgeCompiler),
        }));
    }
    return adapters;
}

}  // namespace wasi::conformance::adapters
