#include "wasi_conformance/expectation_store.hpp"
#include "wasi_conformance/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace wasi::conformance {

fs::path ExpectationStore::record_path_for(const fs::path& artifact) {
    fs::path record = artifact;
    record.replace_extension(kRecordExtension);
    return record;
}

void ExpectationStore::write(const fs::path& record_path, const ExpectationRecord& record) const {
    if (const auto parent = record_path.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw BuildError("Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream output(record_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw BuildError("Unable to open expectation record for write: " + record_path.string());
    }
    output << canonical_expectation_text(record);
    if (!output) {
        throw BuildError("Short write: " + record_path.string());
    }
}

ExpectationRecord ExpectationStore::load(const fs::path& record_path) const {
    std::ifstream input(record_path, std::ios::binary);
    if (!input.is_open()) {
        throw ExpectationNotFound("Unable to open expectation record: " + record_path.string());
    }
    std::ostringstream content;
    content << input.rdbuf();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content.str());
    } catch (const nlohmann::json::parse_error& ex) {
        throw MalformedExpectation("Invalid expectation record " + record_path.string() + ": " +
                                   ex.what());
    }
    return expectation_from_json(document, record_path.string());
}

std::vector<fs::path> ExpectationStore::candidates(const fs::path& artifact) const {
    const auto wanted = artifact.stem().string() + kRecordExtension;
    auto root = artifact.parent_path();
    if (root.empty()) {
        root = ".";
    }

    std::vector<fs::path> found;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return found;
    }

    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->path().filename() == wanted && it->is_regular_file(ec)) {
            found.push_back(it->path());
        }
    }
    if (ec) {
        throw ExpectationNotFound("Failed to scan " + root.string() + " for " + wanted + ": " +
                                  ec.message());
    }

    std::sort(found.begin(), found.end());
    return found;
}

fs::path ExpectationStore::resolve(const fs::path& artifact) const {
    const auto found = candidates(artifact);
    if (found.empty()) {
        throw ExpectationNotFound("No expectation record for " + artifact.string());
    }
    if (found.size() > 1) {
        std::ostringstream msg;
        msg << "Ambiguous expectation record for " << artifact.string() << ":";
        for (const auto& path : found) {
            msg << ' ' << path.string();
        }
        throw ExpectationNotFound(msg.str());
    }
    return found.front();
}

ExpectationRecord ExpectationStore::load_for(const fs::path& artifact) const {
    return load(resolve(artifact));
}

}  // namespace wasi::conformance
