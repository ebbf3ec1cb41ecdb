#pragma once

#include "expectation.hpp"

#include <filesystem>
#include <istream>
#include <string>

namespace wasi::conformance {

/**
 * \brief Recovers the expectation embedded at the top of a test source.
 *
 * A test source starts with a block of single-line comments holding a JSON document,
 * terminated by the first empty line:
 *
 * \code{.c}
 * // {
 * //   "args": ["a"],
 * //   "exitCode": 0
 * // }
 *
 * int main(int argc, char** argv) { ... }
 * \endcode
 *
 * Every header line must start with `//`; the marker is stripped and the remainder kept
 * verbatim. Reaching end of file before the empty line raises TruncatedExpectation; any
 * other structural or JSON problem raises MalformedExpectation.
 */
class ExpectationExtractor {
public:
    static constexpr const char* kCommentMarker = "//";

    ExpectationExtractor() = default;

    [[nodiscard]] ExpectationRecord extract(const std::filesystem::path& source) const;

    [[nodiscard]] ExpectationRecord extract(std::istream& input, const std::string& origin) const;

    /// Only the comment-stripped header text, before JSON parsing.
    [[nodiscard]] std::string annotation_text(std::istream& input, const std::string& origin) const;
};

}  // namespace wasi::conformance
