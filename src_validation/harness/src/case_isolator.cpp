#include "wasi_conformance/case_isolator.hpp"
#include "wasi_conformance/errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace {

using wasi::conformance::WorkspaceError;

fs::path make_temp_dir(const fs::path& base) {
    std::string pattern = (base / "wasi-conformance-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        const int err = errno;
        throw WorkspaceError("mkdtemp failed under " + base.string() + ": " + std::strerror(err));
    }
    return fs::path{buffer.data()};
}

void make_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw WorkspaceError("Failed to create directory " + path.string() + ": " + ec.message());
    }
}

}  // namespace

namespace wasi::conformance {

CaseWorkspace::CaseWorkspace(fs::path root) : root_{std::move(root)} {}

CaseWorkspace::~CaseWorkspace() {
    remove();
}

CaseWorkspace::CaseWorkspace(CaseWorkspace&& other) noexcept : root_{std::move(other.root_)} {
    other.root_.clear();
}

CaseWorkspace& CaseWorkspace::operator=(CaseWorkspace&& other) noexcept {
    if (this != &other) {
        remove();
        root_ = std::move(other.root_);
        other.root_.clear();
    }
    return *this;
}

fs::path CaseWorkspace::release() noexcept {
    return std::exchange(root_, fs::path{});
}

void CaseWorkspace::remove() noexcept {
    if (root_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(root_, ec);
    root_.clear();
}

CaseIsolator::CaseIsolator(Config config) : config_{std::move(config)} {}

CaseWorkspace CaseIsolator::prepare_case() const {
    fs::path base = config_.temp_root;
    if (base.empty()) {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) {
            throw WorkspaceError("No usable temporary directory: " + ec.message());
        }
    } else {
        make_directory(base);
    }

    CaseWorkspace workspace{make_temp_dir(base)};

    std::error_code ec;
    if (fs::is_directory(config_.fixtures_dir, ec)) {
        // Resolve the root itself; only links *inside* the tree are kept as links.
        const auto source = fs::canonical(config_.fixtures_dir, ec);
        if (ec) {
            throw WorkspaceError("Failed to resolve fixtures " + config_.fixtures_dir.string() + ": " +
                                 ec.message());
        }
        fs::copy(source, workspace.fixtures(),
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (ec) {
            throw WorkspaceError("Failed to snapshot fixtures " + config_.fixtures_dir.string() +
                                 " into " + workspace.fixtures().string() + ": " + ec.message());
        }
    } else {
        make_directory(workspace.fixtures());
    }

    make_directory(workspace.scratch());
    return workspace;
}

void CaseIsolator::reset_scratch(const CaseWorkspace& workspace) const {
    if (workspace.root().empty()) {
        throw WorkspaceError("reset_scratch on a released workspace");
    }
    const auto scratch = workspace.scratch();
    std::error_code ec;
    fs::remove_all(scratch, ec);
    if (ec) {
        throw WorkspaceError("Failed to wipe " + scratch.string() + ": " + ec.message());
    }
    make_directory(scratch);
}

}  // namespace wasi::conformance
