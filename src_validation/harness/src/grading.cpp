#include "wasi_conformance/grading.hpp"

#include <cstdio>
#include <sstream>
#include <string>
#include <string_view>

namespace {

constexpr std::size_t kPreviewLimit = 60;

// Quoted, escaped and shortened copy for one-line diagnostics.
std::string preview(std::string_view bytes) {
    std::string out{"\""};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == kPreviewLimit) {
            out += "\"... (" + std::to_string(bytes.size()) + " bytes)";
            return out;
        }
        const auto ch = static_cast<unsigned char>(bytes[i]);
        switch (ch) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            default:
                if (ch < 0x20 || ch >= 0x7f) {
                    char hex[5];
                    std::snprintf(hex, sizeof(hex), "\\x%02x", ch);
                    out += hex;
                } else {
                    out.push_back(static_cast<char>(ch));
                }
        }
    }
    out.push_back('"');
    return out;
}

std::string mismatch(const char* stream, const std::string& expected, const std::string& actual) {
    std::ostringstream msg;
    msg << stream << " mismatch: expected " << preview(expected) << ", got " << preview(actual);
    return msg.str();
}

}  // namespace

namespace wasi::conformance {

const char* to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Pass: return "PASS";
        case Outcome::Fail: return "FAIL";
        case Outcome::Error: return "ERROR";
    }
    return "ERROR";
}

Grade grade(const ExecutionResult& result, const ExpectationRecord& expected) {
    if (result.timed_out) {
        std::ostringstream msg;
        msg << "timed out after " << expected.timeout_seconds << "s";
        return {Outcome::Fail, msg.str()};
    }
    if (result.exit_code != expected.expected_exit_code) {
        return {Outcome::Fail, "exit code mismatch: expected " + std::to_string(expected.expected_exit_code) +
                                   ", got " + std::to_string(result.exit_code)};
    }
    if (result.stdout_bytes != expected.expected_stdout) {
        return {Outcome::Fail, mismatch("stdout", expected.expected_stdout, result.stdout_bytes)};
    }
    if (result.stderr_bytes != expected.expected_stderr) {
        return {Outcome::Fail, mismatch("stderr", expected.expected_stderr, result.stderr_bytes)};
    }
    return {Outcome::Pass, {}};
}

}  // namespace wasi::conformance
