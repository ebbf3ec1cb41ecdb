#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <signal.h>
#include <unistd.h>

#include "wasi_conformance/adapter_registry.hpp"
#include "wasi_conformance/matrix.hpp"
#include "wasi_conformance/report_writer.hpp"

using wasi::conformance::ConsoleReporter;
using wasi::conformance::Matrix;
using wasi::conformance::MatrixReport;
using wasi::conformance::ReportWriter;

namespace {

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int) {
    g_stop_requested.store(true);
}

struct Args {
    std::filesystem::path artifact_root{"target/wasm32-wasi"};
    std::filesystem::path fixtures_dir{"fixtures"};
    std::filesystem::path summary_path{};
    std::vector<std::string> adapters;
    std::map<std::string, std::string> executables;
    bool color{true};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "WASI Conformance Matrix\n"
        << "Usage:\n"
        << "  " << argv0 << " [--artifacts <dir>] [--fixtures <dir>] [--adapters a,b,...]\n"
        << "                 [--runtime <name>=<executable> ...] [--summary <path>] [--no-color]\n"
        << "\n"
        << "Options:\n"
        << "  --artifacts   Root scanned recursively for *.wasm (default: target/wasm32-wasi).\n"
        << "  --fixtures    Canonical fixture tree copied into every case (default: fixtures).\n"
        << "  --adapters    Comma-separated subset of deno,node,wasmer,wasmtime,wasmedge.\n"
        << "  --runtime     Override an executable, e.g. wasmtime=/opt/wasmtime/bin/wasmtime.\n"
        << "                Keys: deno, node, wasmer, wasmtime, wasmedge, wasmedgec.\n"
        << "  --summary     Also write a JSON summary to this path.\n"
        << "  --no-color    Plain ok/FAILED markers.\n"
        << "  -h, --help    Show this help message.\n"
        << "\n"
        << "Exit status: 0 all cells passed, 1 any cell failed or the run was interrupted,\n"
        << "2 configuration error, 3 internal error.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= raw.size()) {
        const auto comma = raw.find(',', start);
        const auto end = comma == std::string_view::npos ? raw.size() : comma;
        if (end > start) {
            items.emplace_back(raw.substr(start, end - start));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

Args parse_args(int argc, char** argv) {
    Args args;
    args.color = ::isatty(STDOUT_FILENO) != 0;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--artifacts")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--artifacts expects a value");
            }
            args.artifact_root = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--fixtures")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--fixtures expects a value");
            }
            args.fixtures_dir = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--adapters")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--adapters expects a value");
            }
            args.adapters = split_list(argv[++i]);
        } else if (arg_eq(tok, "--runtime")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--runtime expects a value");
            }
            const std::string_view spec = argv[++i];
            const auto eq = spec.find('=');
            if (eq == std::string_view::npos || eq == 0 || eq + 1 == spec.size()) {
                throw std::runtime_error("--runtime expects <name>=<executable>");
            }
            args.executables[std::string{spec.substr(0, eq)}] = std::string{spec.substr(eq + 1)};
        } else if (arg_eq(tok, "--summary")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--summary expects a value");
            }
            args.summary_path = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--no-color")) {
            args.color = false;
        } else {
            throw std::runtime_error("Unknown argument '" + std::string{tok} + "'");
        }
    }
    return args;
}

void install_stop_handlers() {
    struct sigaction action {};
    action.sa_handler = on_stop_signal;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

int aggregate_exit_code(const MatrixReport& report) {
    return report.all_passed() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        const auto adapters = wasi::conformance::adapters::make_adapters(args.adapters, args.executables);

        install_stop_handlers();

        Matrix matrix(Matrix::Config{
            .artifact_root = args.artifact_root,
            .isolation = {.fixtures_dir = args.fixtures_dir},
            .cancel = &g_stop_requested,
        });

        ConsoleReporter console(std::cout, args.color);
        const auto report = matrix.run(adapters, console);

        if (!args.summary_path.empty()) {
            ReportWriter writer;
            writer.write_summary(args.summary_path, report);
            std::cout << "Summary: " << args.summary_path << "\n";
        }

        return aggregate_exit_code(report);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
