#include "wasi_conformance/matrix.hpp"
#include "wasi_conformance/errors.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace wasi::conformance {

std::size_t MatrixReport::count(Outcome outcome) const noexcept {
    return static_cast<std::size_t>(std::count_if(cells.begin(), cells.end(),
                                                  [outcome](const MatrixCell& c) { return c.outcome == outcome; }));
}

bool MatrixReport::all_passed() const noexcept {
    return !interrupted && count(Outcome::Pass) == cells.size();
}

void MatrixListener::on_case_begin(const std::string&) {}
void MatrixListener::on_cell_begin(const std::string&, const std::string&) {}
void MatrixListener::on_cell(const MatrixCell&) {}
void MatrixListener::on_case_failed(const MatrixCell&) {}
void MatrixListener::on_report(const MatrixReport&) {}

Matrix::Matrix(Config config) : config_{std::move(config)}, isolator_{config_.isolation} {}

bool Matrix::cancelled() const noexcept {
    return config_.cancel != nullptr && config_.cancel->load();
}

std::vector<fs::path> Matrix::discover() const {
    std::vector<fs::path> artifacts;
    std::error_code ec;
    if (!fs::is_directory(config_.artifact_root, ec)) {
        return artifacts;
    }

    for (auto it = fs::recursive_directory_iterator(config_.artifact_root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->path().extension() == config_.artifact_extension && it->is_regular_file(ec)) {
            artifacts.push_back(it->path());
        }
    }

    std::sort(artifacts.begin(), artifacts.end());
    return artifacts;
}

MatrixReport Matrix::run(const AdapterList& adapters) const {
    MatrixListener silent;
    return run(adapters, silent);
}

MatrixReport Matrix::run(const AdapterList& adapters, MatrixListener& listener) const {
    MatrixReport report;

    for (const auto& artifact : discover()) {
        if (cancelled()) {
            report.interrupted = true;
            break;
        }

        const auto artifact_id = artifact.generic_string();
        listener.on_case_begin(artifact_id);

        ExpectationRecord record;
        CaseWorkspace workspace;
        try {
            record = store_.load_for(artifact);
            workspace = isolator_.prepare_case();
        } catch (const HarnessError& ex) {
            MatrixCell cell{artifact_id, kCaseRow, Outcome::Error, ex.what(), ex.kind()};
            report.cells.push_back(cell);
            listener.on_case_failed(cell);
            continue;
        }

        for (const auto& adapter : adapters) {
            if (cancelled()) {
                report.interrupted = true;
                break;
            }
            listener.on_cell_begin(artifact_id, adapter->name());
            try {
                auto cell = run_cell(*adapter, artifact, artifact_id, record, workspace);
                report.cells.push_back(cell);
                listener.on_cell(cell);
            } catch (const RunInterrupted&) {
                report.interrupted = true;
                break;
            }
        }

        if (report.interrupted) {
            break;
        }
    }

    listener.on_report(report);
    return report;
}

MatrixCell Matrix::run_cell(RuntimeAdapter& adapter,
                            const fs::path& artifact,
                            const std::string& artifact_id,
                            const ExpectationRecord& record,
                            const CaseWorkspace& workspace) const {
    MatrixCell cell{artifact_id, adapter.name(), Outcome::Error, {}, {}};
    try {
        isolator_.reset_scratch(workspace);

        const auto invocation = describe_invocation(record, artifact);
        // One budget for every process the adapter starts in this cell.
        const ProcessLauncher launcher{ProcessLauncher::Config{
            .timeout = invocation.timeout,
            .deadline = std::chrono::steady_clock::now() + invocation.timeout,
            .cancel = config_.cancel,
        }};

        const auto result = adapter.execute(invocation, workspace.root(), launcher);
        auto verdict = grade(result, record);
        cell.outcome = verdict.outcome;
        cell.detail = std::move(verdict.detail);
    } catch (const RunInterrupted&) {
        throw;
    } catch (const HarnessError& ex) {
        cell.outcome = Outcome::Error;
        cell.error_kind = ex.kind();
        cell.detail = ex.what();
    } catch (const std::exception& ex) {
        cell.outcome = Outcome::Error;
        cell.error_kind = "internal";
        cell.detail = ex.what();
    }
    return cell;
}

}  // namespace wasi::conformance
