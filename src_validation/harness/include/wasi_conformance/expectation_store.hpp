#pragma once

#include "expectation.hpp"

#include <filesystem>
#include <vector>

namespace wasi::conformance {

/**
 * \brief Persists expectation records beside compiled artifacts and finds them again.
 *
 * Layout: `<dir>/<stem>.wasm` is paired with `<dir>/<stem>.json`. Lookup only knows the
 * artifact path and searches the artifact's directory subtree, so artifacts that a build
 * tool moved below the record's directory (e.g. `debug/`, `deps/`) are still matched.
 */
class ExpectationStore {
public:
    static constexpr const char* kRecordExtension = ".json";

    ExpectationStore() = default;

    [[nodiscard]] static std::filesystem::path record_path_for(const std::filesystem::path& artifact);

    void write(const std::filesystem::path& record_path, const ExpectationRecord& record) const;

    [[nodiscard]] ExpectationRecord load(const std::filesystem::path& record_path) const;

    /// All `<stem>.json` files below the artifact's directory, sorted.
    [[nodiscard]] std::vector<std::filesystem::path> candidates(const std::filesystem::path& artifact) const;

    /**
     * Exactly one candidate, or ExpectationNotFound.
     * Several candidates are ambiguous and rejected rather than picking the first.
     */
    [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path& artifact) const;

    [[nodiscard]] ExpectationRecord load_for(const std::filesystem::path& artifact) const;
};

}  // namespace wasi::conformance
