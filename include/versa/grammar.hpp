#pragma once

#include <versa/result.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace versa {

// Fields exactly as they appear in the input text.
//
//   [branch ][label[ ]]major.minor.patch[.hotfix][-prerelease][+build]
struct RawFields {
    std::optional<std::string> branch;
    std::optional<std::string> label;
    std::string major;
    std::string minor;
    std::string patch;
    std::optional<std::string> hotfix;
    std::optional<std::string> prerelease;
    std::optional<std::string> build;
    bool spaced_label = true;  // a single space followed the label
};

// Tokenize the whole of `text`. Fails with GrammarMismatch; never returns a
// partial match.
Result<RawFields> extract_fields(std::string_view text);

// Per-field sub-grammars. Each checks its whole argument.

// "v", "ver" or "version", any case
bool is_label_keyword(std::string_view s);
// one or more ASCII digits
bool is_numeric(std::string_view s);
// [1-9a-zA-Z-][0-9a-zA-Z-]*
bool is_prerelease_token(std::string_view s);
// [0-9a-zA-Z-]+
bool is_build_token(std::string_view s);
// dot-separated prerelease tokens
bool is_prerelease(std::string_view s);
// dot-separated build tokens
bool is_build(std::string_view s);

} // namespace versa
