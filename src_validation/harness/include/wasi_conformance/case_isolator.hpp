#pragma once

#include <filesystem>

namespace wasi::conformance {

/**
 * \brief Exclusively-owned working directory for one case.
 *
 * Layout:
 *   - `<root>/`          working directory handed to every runtime
 *   - `<root>/fixtures`  private copy of the canonical fixture tree
 *   - `<root>/scratch`   reset before each adapter run
 *
 * The directory tree is removed when the workspace is destroyed. Move-only.
 */
class CaseWorkspace {
public:
    CaseWorkspace() = default;
    explicit CaseWorkspace(std::filesystem::path root);
    ~CaseWorkspace();

    CaseWorkspace(const CaseWorkspace&) = delete;
    CaseWorkspace& operator=(const CaseWorkspace&) = delete;
    CaseWorkspace(CaseWorkspace&& other) noexcept;
    CaseWorkspace& operator=(CaseWorkspace&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path fixtures() const { return root_ / "fixtures"; }
    [[nodiscard]] std::filesystem::path scratch() const { return root_ / "scratch"; }

    /// Stop owning the directory; it survives destruction.
    std::filesystem::path release() noexcept;

private:
    void remove() noexcept;

    std::filesystem::path root_{};
};

class CaseIsolator {
public:
    struct Config {
        std::filesystem::path fixtures_dir{"fixtures"};  ///< Canonical, never written to
        std::filesystem::path temp_root{};               ///< Empty = system temp directory
    };

    explicit CaseIsolator(Config config);

    /// Fresh directory with a fixture snapshot (symlinks copied verbatim) and an empty scratch.
    [[nodiscard]] CaseWorkspace prepare_case() const;

    /// Removes and recreates only the scratch directory.
    void reset_scratch(const CaseWorkspace& workspace) const;

private:
    Config config_;
};

}  // namespace wasi::conformance
