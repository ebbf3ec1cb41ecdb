#pragma once

#include "expectation_extractor.hpp"
#include "expectation_store.hpp"

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace wasi::conformance {

/**
 * \brief Compiles test sources to wasm32-wasi modules and persists their expectations.
 *
 * For `integration/<name>.c` or `integration/<name>.rs` it produces
 * `build/integration/<name>.wasm` and `build/integration/<name>.json`.
 *
 * An unrecognised extension or a failed compile throws BuildError and ends the build.
 * A malformed expectation block fails only that source.
 */
class Builder {
public:
    struct Config {
        std::filesystem::path input_dir{"integration"};
        std::filesystem::path output_dir{"build"};
        std::string c_compiler{"clang"};
        std::string rust_compiler{"rustc"};
        std::chrono::milliseconds compile_timeout{0};  ///< 0 = unbounded
    };

    struct Summary {
        std::vector<std::filesystem::path> artifacts;
        std::vector<std::string> failures;  ///< One message per source with a bad expectation
    };

    explicit Builder(Config config);

    /// Files directly inside the input directory whose name has an extension, sorted.
    [[nodiscard]] std::vector<std::filesystem::path> sources() const;

    [[nodiscard]] std::filesystem::path artifact_path(const std::filesystem::path& source) const;

    [[nodiscard]] std::vector<std::string> compile_command(const std::filesystem::path& source,
                                                           const std::filesystem::path& artifact) const;

    /// Builds one source; returns the artifact path.
    std::filesystem::path build(const std::filesystem::path& source) const;

    Summary build_all(std::ostream& log) const;

private:
    Config config_;
    ExpectationExtractor extractor_{};
    ExpectationStore store_{};
};

}  // namespace wasi::conformance
