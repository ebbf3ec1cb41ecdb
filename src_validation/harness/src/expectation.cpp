#include "wasi_conformance/expectation.hpp"
#include "wasi_conformance/errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace {

using nlohmann::json;
using wasi::conformance::MalformedExpectation;

[[noreturn]] void type_error(const std::string& origin, const char* key, const std::string& wanted) {
    throw MalformedExpectation("Expectation key '" + std::string{key} + "' must be " + wanted +
                               " in " + origin);
}

// A missing key and an explicit null both mean "use the default".
const json* lookup(const json& document, const char* key) {
    const auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::map<std::string, std::string> string_map(const json& value,
                                              const std::string& origin,
                                              const char* key) {
    if (!value.is_object()) {
        type_error(origin, key, "an object of strings");
    }
    std::map<std::string, std::string> out;
    for (const auto& [name, entry] : value.items()) {
        if (!entry.is_string()) {
            type_error(origin, key, "an object of strings");
        }
        out.emplace(name, entry.get<std::string>());
    }
    return out;
}

}  // namespace

namespace wasi::conformance {

ExpectationRecord expectation_from_json(const json& document, const std::string& origin) {
    if (!document.is_object()) {
        throw MalformedExpectation("Expectation block is not a JSON object in " + origin);
    }

    ExpectationRecord record;

    if (const auto* value = lookup(document, "stdin")) {
        if (!value->is_string()) {
            type_error(origin, "stdin", "a string");
        }
        record.stdin_data = value->get<std::string>();
    }

    if (const auto* value = lookup(document, "env")) {
        record.env = string_map(*value, origin, "env");
    }

    if (const auto* value = lookup(document, "args")) {
        if (!value->is_array()) {
            type_error(origin, "args", "an array of strings");
        }
        for (const auto& arg : *value) {
            if (!arg.is_string()) {
                type_error(origin, "args", "an array of strings");
            }
            record.args.push_back(arg.get<std::string>());
        }
    }

    if (const auto* value = lookup(document, "preopens")) {
        record.preopens = string_map(*value, origin, "preopens");
    }

    if (const auto* value = lookup(document, "stdout")) {
        if (!value->is_string()) {
            type_error(origin, "stdout", "a string");
        }
        record.expected_stdout = value->get<std::string>();
    }

    if (const auto* value = lookup(document, "stderr")) {
        if (!value->is_string()) {
            type_error(origin, "stderr", "a string");
        }
        record.expected_stderr = value->get<std::string>();
    }

    if (const auto* value = lookup(document, "exitCode")) {
        if (!value->is_number_integer()) {
            type_error(origin, "exitCode", "an integer");
        }
        // Unsigned values above INT64_MAX would wrap through get<int64_t>().
        if (value->is_number_unsigned() &&
            value->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            type_error(origin, "exitCode", "a 32-bit integer");
        }
        const auto code = value->get<std::int64_t>();
        if (code < std::numeric_limits<int>::min() || code > std::numeric_limits<int>::max()) {
            type_error(origin, "exitCode", "a 32-bit integer");
        }
        record.expected_exit_code = static_cast<int>(code);
    }

    if (const auto* value = lookup(document, "timeout")) {
        if (!value->is_number()) {
            type_error(origin, "timeout", "a number");
        }
        record.timeout_seconds = value->get<double>();
        if (!std::isfinite(record.timeout_seconds) || record.timeout_seconds <= 0.0) {
            type_error(origin, "timeout", "a positive number of seconds");
        }
        if (record.timeout_seconds > kMaxTimeoutSeconds) {
            type_error(origin, "timeout", "at most " + std::to_string(static_cast<long long>(kMaxTimeoutSeconds)) +
                                              " seconds");
        }
    }

    return record;
}

json expectation_to_json(const ExpectationRecord& record) {
    json document = {
        {"env", record.env},
        {"args", record.args},
        {"preopens", record.preopens},
        {"stdout", record.expected_stdout},
        {"stderr", record.expected_stderr},
        {"exitCode", record.expected_exit_code},
    };

    // Whole seconds stay integers so hand-written records diff cleanly.
    double whole = 0.0;
    if (std::modf(record.timeout_seconds, &whole) == 0.0 &&
        whole < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        document["timeout"] = static_cast<std::int64_t>(whole);
    } else {
        document["timeout"] = record.timeout_seconds;
    }

    if (record.stdin_data) {
        document["stdin"] = *record.stdin_data;
    }
    return document;
}

std::string canonical_expectation_text(const ExpectationRecord& record) {
    // nlohmann::json objects are key-ordered, so dump() is already sorted.
    auto text = expectation_to_json(record).dump(2, ' ', true);
    text.push_back('\n');
    return text;
}

}  // namespace wasi::conformance
