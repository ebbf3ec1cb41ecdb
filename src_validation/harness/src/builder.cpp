#include "wasi_conformance/builder.hpp"
#include "wasi_conformance/errors.hpp"
#include "wasi_conformance/process.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

// "integration/" and "integration" both name the same directory.
fs::path directory_name(const fs::path& dir) {
    const auto normal = dir.lexically_normal();
    return normal.has_filename() ? normal.filename() : normal.parent_path().filename();
}

}  // namespace

namespace wasi::conformance {

Builder::Builder(Config config) : config_{std::move(config)} {}

std::vector<fs::path> Builder::sources() const {
    std::vector<fs::path> found;
    std::error_code ec;
    if (!fs::is_directory(config_.input_dir, ec)) {
        return found;
    }
    for (auto it = fs::directory_iterator(config_.input_dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().has_extension()) {
            found.push_back(it->path());
        }
    }
    if (ec) {
        throw BuildError("Failed to list " + config_.input_dir.string() + ": " + ec.message());
    }
    std::sort(found.begin(), found.end());
    return found;
}

fs::path Builder::artifact_path(const fs::path& source) const {
    auto artifact = config_.output_dir / directory_name(config_.input_dir) / source.filename();
    artifact.replace_extension(".wasm");
    return artifact;
}

std::vector<std::string> Builder::compile_command(const fs::path& source, const fs::path& artifact) const {
    const auto ext = source.extension().string();
    if (ext == ".c") {
        return {config_.c_compiler, "-target", "wasm32-wasi", "-o", artifact.string(), source.string()};
    }
    if (ext == ".rs") {
        return {config_.rust_compiler, "--target", "wasm32-wasi", "-o", artifact.string(), source.string()};
    }
    throw BuildError("Invalid source format '" + ext + "': " + source.string());
}

fs::path Builder::build(const fs::path& source) const {
    const auto artifact = artifact_path(source);
    const auto command = compile_command(source, artifact);

    const auto record = extractor_.extract(source);

    std::error_code ec;
    fs::create_directories(artifact.parent_path(), ec);
    if (ec) {
        throw BuildError("Failed to create directory " + artifact.parent_path().string() + ": " + ec.message());
    }

    const ProcessLauncher launcher{ProcessLauncher::Config{.timeout = config_.compile_timeout}};
    ProcessOutput compiled;
    try {
        compiled = launcher.run(ProcessSpec{.argv = command});
    } catch (const ProcessLaunchError& ex) {
        throw BuildError("Compiler unavailable for " + source.string() + ": " + ex.what());
    }
    if (compiled.timed_out) {
        throw BuildError("Compiling " + source.string() + " exceeded the compile timeout");
    }
    if (compiled.exit_code != 0) {
        throw BuildError("Compiling " + source.string() + " failed with status " +
                         std::to_string(compiled.exit_code) + ":\n" + compiled.stderr_bytes);
    }

    store_.write(ExpectationStore::record_path_for(artifact), record);
    return artifact;
}

Builder::Summary Builder::build_all(std::ostream& log) const {
    Summary summary;
    for (const auto& source : sources()) {
        log << "build " << source.generic_string() << " ... ";
        log.flush();
        try {
            summary.artifacts.push_back(build(source));
            log << "ok\n";
        } catch (const MalformedExpectation& ex) {
            log << "FAILED\n    [" << ex.kind() << "] " << ex.what() << "\n";
            summary.failures.push_back(ex.what());
        } catch (const BuildError&) {
            log << "FAILED\n";
            throw;
        }
    }
    return summary;
}

}  // namespace wasi::conformance
