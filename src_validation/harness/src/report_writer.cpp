#include "wasi_conformance/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using wasi::conformance::MatrixCell;
using wasi::conformance::MatrixReport;
using wasi::conformance::Outcome;

constexpr const char* kGreen = "\033[92m";
constexpr const char* kRed = "\033[91m";
constexpr const char* kMagenta = "\033[95m";
constexpr const char* kReset = "\x1b[0m";

json cell_to_json(const MatrixCell& cell) {
    json entry = {
        {"artifact", cell.artifact_id},
        {"adapter", cell.adapter_name},
        {"outcome", wasi::conformance::to_string(cell.outcome)},
        {"detail", cell.detail},
    };
    if (!cell.error_kind.empty()) {
        entry["error_kind"] = cell.error_kind;
    }
    return entry;
}

json build_summary(const MatrixReport& report) {
    json summary = {
        {"total", report.cells.size()},
        {"interrupted", report.interrupted},
        {"by_outcome", json::object()},
        {"cells", json::array()},
    };

    auto& by_outcome = summary["by_outcome"];
    for (const auto outcome : {Outcome::Pass, Outcome::Fail, Outcome::Error}) {
        by_outcome[wasi::conformance::to_string(outcome)] = report.count(outcome);
    }
    for (const auto& cell : report.cells) {
        summary["cells"].push_back(cell_to_json(cell));
    }
    return summary;
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

}  // namespace

namespace wasi::conformance {

void ReportWriter::write_summary(const std::filesystem::path& destination, const MatrixReport& report) const {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << build_summary(report).dump(2) << '\n';
}

ConsoleReporter::ConsoleReporter(std::ostream& out, bool color) : out_{out}, color_{color} {}

std::string ConsoleReporter::paint(const char* code, const char* text) const {
    if (!color_) {
        return text;
    }
    return std::string{code} + text + kReset;
}

void ConsoleReporter::on_case_begin(const std::string& artifact_id) {
    out_ << "test " << artifact_id << " ... \n";
    out_.flush();
}

void ConsoleReporter::on_cell_begin(const std::string&, const std::string& adapter_name) {
    out_ << "  " << adapter_name << " ... ";
    out_.flush();
}

void ConsoleReporter::on_cell(const MatrixCell& cell) {
    status(cell);
}

void ConsoleReporter::on_case_failed(const MatrixCell& cell) {
    out_ << "  " << cell.adapter_name << " ... ";
    status(cell);
}

void ConsoleReporter::status(const MatrixCell& cell) {
    switch (cell.outcome) {
        case Outcome::Pass:
            out_ << paint(kGreen, "ok") << '\n';
            break;
        case Outcome::Fail:
            out_ << paint(kRed, "FAILED") << '\n';
            out_ << "    " << cell.detail << '\n';
            break;
        case Outcome::Error:
            if (cell.error_kind == "internal") {
                out_ << paint(kMagenta, "ERROR") << '\n';
                out_ << "    internal error: " << cell.detail << '\n';
            } else {
                out_ << paint(kRed, "FAILED") << '\n';
                out_ << "    [" << cell.error_kind << "] " << cell.detail << '\n';
            }
            break;
    }
    out_.flush();
}

void ConsoleReporter::on_report(const MatrixReport& report) {
    const auto passed = report.count(Outcome::Pass);
    const auto failed = report.count(Outcome::Fail);
    const auto errors = report.count(Outcome::Error);

    if (report.interrupted) {
        out_ << '\n' << paint(kRed, "interrupted") << '\n';
    }
    out_ << "\ntest result: " << (report.all_passed() ? paint(kGreen, "ok") : paint(kRed, "FAILED"))
         << ". " << passed << " passed; " << failed << " failed; " << errors << " errors\n";
    out_.flush();
}

}  // namespace wasi::conformance
