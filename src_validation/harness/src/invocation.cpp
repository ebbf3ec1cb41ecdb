#include "wasi_conformance/invocation.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>

namespace wasi::conformance {

std::vector<std::string> InvocationDescriptor::guest_argv() const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(artifact.string());
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

InvocationDescriptor describe_invocation(const ExpectationRecord& record,
                                         const std::filesystem::path& artifact) {
    InvocationDescriptor invocation;
    invocation.artifact = std::filesystem::absolute(artifact).lexically_normal();
    invocation.args = record.args;
    invocation.env = record.env;
    invocation.preopens = record.preopens;
    invocation.stdin_data = record.stdin_data;
    invocation.timeout = std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(std::ceil(record.timeout_seconds * 1000.0))};
    return invocation;
}

}  // namespace wasi::conformance
