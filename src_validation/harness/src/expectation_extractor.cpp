#include "wasi_conformance/expectation_extractor.hpp"
#include "wasi_conformance/errors.hpp"

#include <cstring>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace wasi::conformance {

ExpectationRecord ExpectationExtractor::extract(const std::filesystem::path& source) const {
    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        throw MalformedExpectation("Unable to open test source: " + source.string());
    }
    return extract(input, source.string());
}

ExpectationRecord ExpectationExtractor::extract(std::istream& input, const std::string& origin) const {
    const auto text = annotation_text(input, origin);

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw MalformedExpectation("Invalid expectation block in " + origin + ": " + ex.what());
    }
    return expectation_from_json(document, origin);
}

std::string ExpectationExtractor::annotation_text(std::istream& input, const std::string& origin) const {
    const std::size_t marker_len = std::strlen(kCommentMarker);

    std::string text;
    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        // getline consumed the newline; an empty line is the header sentinel.
        if (raw_line.empty()) {
            return text;
        }

        if (raw_line.compare(0, marker_len, kCommentMarker) != 0) {
            throw MalformedExpectation("Expected '" + std::string{kCommentMarker} +
                                       "' annotation line at " + origin + ":" +
                                       std::to_string(line_no));
        }

        text.append(raw_line, marker_len, std::string::npos);
        text.push_back('\n');
    }

    throw TruncatedExpectation("No blank line terminating the expectation block in " + origin);
}

}  // namespace wasi::conformance
