#pragma once

#include "wasi_conformance/matrix.hpp"

#include <map>
#include <string>
#include <vector>

namespace wasi::conformance::adapters {

/// Declared matrix order: deno, node, wasmer, wasmtime, wasmedge.
[[nodiscard]] const std::vector<std::string>& adapter_names();

/**
 * \brief Instantiates adapters in declared order.
 *
 * \param selection   Adapter names to include; empty selects all. The declared order is kept
 *                    regardless of the order given. Unknown names throw std::invalid_argument.
 * \param executables Overrides keyed by adapter name, plus `wasmedgec` for the WasmEdge
 *                    compiler. Unknown keys throw std::invalid_argument.
 */
[[nodiscard]] AdapterList make_adapters(const std::vector<std::string>& selection = {},
                                        const std::map<std::string, std::string>& executables = {});

}  // namespace wasi::conformance::adapters
