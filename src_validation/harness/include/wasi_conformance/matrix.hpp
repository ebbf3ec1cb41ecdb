#pragma once

#include "case_isolator.hpp"
#include "expectation_store.hpp"
#include "grading.hpp"
#include "runtime_adapter.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace wasi::conformance {

struct MatrixCell {
    std::string artifact_id;
    std::string adapter_name;   ///< "*" for a case-level failure row
    Outcome outcome{Outcome::Error};
    std::string detail;         ///< Mismatch or error message, empty on Pass
    std::string error_kind;     ///< Taxonomy name, "internal" for foreign exceptions, empty otherwise
};

/// Append-only result of one matrix run, in execution order.
struct MatrixReport {
    std::vector<MatrixCell> cells;
    bool interrupted{false};

    [[nodiscard]] std::size_t count(Outcome outcome) const noexcept;
    [[nodiscard]] bool all_passed() const noexcept;
};

/**
 * \brief Progress hooks for a matrix run.
 *
 * Not abstract: every hook defaults to doing nothing so that callers only override what
 * they present. on_report() fires exactly once per run, including interrupted runs.
 */
class MatrixListener {
public:
    virtual ~MatrixListener() = default;

    virtual void on_case_begin(const std::string& artifact_id);
    virtual void on_cell_begin(const std::string& artifact_id, const std::string& adapter_name);
    virtual void on_cell(const MatrixCell& cell);
    virtual void on_case_failed(const MatrixCell& cell);
    virtual void on_report(const MatrixReport& report);
};

using AdapterList = std::vector<std::unique_ptr<RuntimeAdapter>>;

/**
 * \brief Drives every discovered artifact through every adapter.
 *
 * Discover -> for each artifact { resolve expectation -> prepare workspace ->
 * for each adapter { reset scratch -> invoke -> grade -> record } } -> report.
 *
 * A case that cannot be resolved or prepared contributes one Error row and the run
 * continues. Adapter exceptions become Error cells. Cancellation stops between cells;
 * a cell interrupted mid-flight is never recorded.
 */
class Matrix {
public:
    static constexpr const char* kCaseRow = "*";

    struct Config {
        std::filesystem::path artifact_root{"target/wasm32-wasi"};
        std::string artifact_extension{".wasm"};
        CaseIsolator::Config isolation{};
        const std::atomic<bool>* cancel{nullptr};
    };

    explicit Matrix(Config config);

    /// Recursive, lexicographically sorted. A missing root yields no artifacts.
    [[nodiscard]] std::vector<std::filesystem::path> discover() const;

    [[nodiscard]] MatrixReport run(const AdapterList& adapters, MatrixListener& listener) const;

    [[nodiscard]] MatrixReport run(const AdapterList& adapters) const;

private:
    [[nodiscard]] bool cancelled() const noexcept;

    [[nodiscard]] MatrixCell run_cell(RuntimeAdapter& adapter,
                                      const std::filesystem::path& artifact,
                                      const std::string& artifact_id,
                                      const ExpectationRecord& record,
                                      const CaseWorkspace& workspace) const;

    Config config_;
    ExpectationStore store_{};
    CaseIsolator isolator_;
};

}  // namespace wasi::conformance
