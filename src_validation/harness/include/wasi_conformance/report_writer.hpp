#pragma once

#include "matrix.hpp"

#include <filesystem>
#include <ostream>

namespace wasi::conformance {

/**
 * \brief Emits the machine-readable summary of a matrix run.
 *
 * write_summary(): JSON document with aggregate counts, the interrupted flag and one entry
 * per cell in execution order.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_summary(const std::filesystem::path& destination, const MatrixReport& report) const;
};

/**
 * \brief Line-oriented progress output, one status line per cell.
 *
 * \code{.txt}
 * test target/wasm32-wasi/debug/args.wasm ...
 *   deno ... ok
 *   wasmer ... FAILED
 *     stdout mismatch: expected "a\n", got ""
 * \endcode
 *
 * Harness errors print their taxonomy kind; foreign exceptions print as ERROR so a broken
 * harness never looks like a disagreeing runtime.
 */
class ConsoleReporter : public MatrixListener {
public:
    ConsoleReporter(std::ostream& out, bool color);

    void on_case_begin(const std::string& artifact_id) override;
    void on_cell_begin(const std::string& artifact_id, const std::string& adapter_name) override;
    void on_cell(const MatrixCell& cell) override;
    void on_case_failed(const MatrixCell& cell) override;
    void on_report(const MatrixReport& report) override;

private:
    void status(const MatrixCell& cell);
    [[nodiscard]] std::string paint(const char* code, const char* text) const;

    std::ostream& out_;
    bool color_;
};

}  // namespace wasi::conformance
