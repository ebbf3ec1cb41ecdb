/**
 * @file test_report_writer.cpp
 * @brief Unit tests for the JSON summary and the console progress output
 *
 * @author WASI conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 WASI conformance contributors

#include <catch2/catch.hpp>

#include "wasi_conformance/report_writer.hpp"

#include "test_support.hpp"

#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

using namespace wasi::conformance;

namespace {

MatrixReport sample_report() {
    MatrixReport report;
    report.cells.push_back({"build/args.wasm", "deno", Outcome::Pass, "", ""});
    report.cells.push_back({"build/args.wasm", "wasmer", Outcome::Fail, "exit code mismatch: expected 0, got 1", ""});
    report.cells.push_back({"build/args.wasm", "wasmedge", Outcome::Error, "wasmedge: not found", "AdapterLaunchError"});
    report.cells.push_back({"build/orphan.wasm", "*", Outcome::Error, "No expectation record", "ExpectationNotFound"});
    return report;
}

}  // namespace

TEST_CASE("Summary carries counts and every cell in order", "[report]") {
    testing::TempDir dir;
    const auto destination = dir / "out" / "summary.json";

    ReportWriter{}.write_summary(destination, sample_report());

    const auto text = testing::read_file(destination);
    REQUIRE(text.back() == '\n');

    const auto summary = nlohmann::json::parse(text);
    REQUIRE(summary["total"] == 4);
    REQUIRE(summary["interrupted"] == false);
    REQUIRE(summary["by_outcome"]["PASS"] == 1);
    REQUIRE(summary["by_outcome"]["FAIL"] == 1);
    REQUIRE(summary["by_outcome"]["ERROR"] == 2);

    const auto& cells = summary["cells"];
    REQUIRE(cells.size() == 4);
    REQUIRE(cells[0]["adapter"] == "deno");
    REQUIRE(cells[0]["outcome"] == "PASS");
    REQUIRE_FALSE(cells[0].contains("error_kind"));
    REQUIRE(cells[1]["detail"] == "exit code mismatch: expected 0, got 1");
    REQUIRE(cells[2]["error_kind"] == "AdapterLaunchError");
    REQUIRE(cells[3]["artifact"] == "build/orphan.wasm");
    REQUIRE(cells[3]["adapter"] == "*");
}

TEST_CASE("Console reporter prints one status per cell", "[report]") {
    std::ostringstream out;
    ConsoleReporter console(out, false);
    const auto report = sample_report();

    console.on_case_begin("build/args.wasm");
    console.on_cell_begin("build/args.wasm", "deno");
    console.on_cell(report.cells[0]);
    console.on_cell_begin("build/args.wasm", "wasmer");
    console.on_cell(report.cells[1]);
    console.on_cell_begin("build/args.wasm", "wasmedge");
    console.on_cell(report.cells[2]);
    console.on_case_begin("build/orphan.wasm");
    console.on_case_failed(report.cells[3]);
    console.on_report(report);

    REQUIRE(out.str() ==
            "test build/args.wasm ... \n"
            "  deno ... ok\n"
            "  wasmer ... FAILED\n"
            "    exit code mismatch: expected 0, got 1\n"
            "  wasmedge ... FAILED\n"
            "    [AdapterLaunchError] wasmedge: not found\n"
            "test build/orphan.wasm ... \n"
            "  * ... FAILED\n"
            "    [ExpectationNotFound] No expectation record\n"
            "\n"
            "test result: FAILED. 1 passed; 1 failed; 2 errors\n");
}

TEST_CASE("Console reporter separates harness bugs from runtime errors", "[report]") {
    std::ostringstream out;
    ConsoleReporter console(out, false);
    console.on_cell({"a.wasm", "node", Outcome::Error, "bad_alloc", "internal"});
    REQUIRE(out.str() == "ERROR\n    internal error: bad_alloc\n");
}

TEST_CASE("Console reporter marks interrupted runs", "[report]") {
    std::ostringstream out;
    ConsoleReporter console(out, false);
    MatrixReport report;
    report.interrupted = true;
    console.on_report(report);
    REQUIRE(out.str() == "\ninterrupted\n\ntest result: FAILED. 0 passed; 0 failed; 0 errors\n");
}

TEST_CASE("Console reporter colors only when asked", "[report]") {
    std::ostringstream out;
    ConsoleReporter console(out, true);
    console.on_cell({"a.wasm", "deno", Outcome::Pass, "", ""});
    REQUIRE(out.str() == "\033[92mok\x1b[0m\n");
}
