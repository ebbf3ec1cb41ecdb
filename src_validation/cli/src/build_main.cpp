#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "wasi_conformance/builder.hpp"
#include "wasi_conformance/errors.hpp"

using wasi::conformance::BuildError;
using wasi::conformance::Builder;

namespace {

struct Args {
    std::filesystem::path input_dir{"integration"};
    std::filesystem::path output_dir{"build"};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "WASI Conformance Build\n"
        << "Usage:\n"
        << "  " << argv0 << " [--input <dir>] [--output <dir>]\n"
        << "\n"
        << "Compiles <input>/*.c with clang and <input>/*.rs with rustc for wasm32-wasi and writes\n"
        << "<output>/<input>/<name>.wasm plus the expectation record <name>.json beside it.\n"
        << "\n"
        << "Options:\n"
        << "  --input       Test source directory (default: integration).\n"
        << "  --output      Build output directory (default: build).\n"
        << "  -h, --help    Show this help message.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--input")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--input expects a value");
            }
            args.input_dir = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--output")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--output expects a value");
            }
            args.output_dir = std::filesystem::path(argv[++i]);
        } else {
            throw std::runtime_error("Unknown argument '" + std::string{tok} + "'");
        }
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        Builder builder(Builder::Config{
            .input_dir = args.input_dir,
            .output_dir = args.output_dir,
        });
        const auto summary = builder.build_all(std::cout);

        std::cout << "\nbuilt " << summary.artifacts.size() << " module(s), " << summary.failures.size()
                  << " malformed expectation(s)\n";
        return summary.failures.empty() ? 0 : 1;
    } catch (const BuildError& ex) {
        std::cerr << "BUILD FAILED: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 3;
    }
}
