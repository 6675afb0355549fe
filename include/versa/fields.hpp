#pragma once

#include <versa/grammar.hpp>
#include <versa/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace versa {

// Largest integer a version component may hold (2^53 - 1), so values survive
// a trip through JSON numbers unchanged.
constexpr std::uint64_t kMaxSafeInteger = 9007199254740991ULL;

// Typed, structurally valid version fields
struct VersionFields {
    std::optional<std::string> branch;
    std::optional<std::string> label;
    bool spaced_label = true;
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::optional<std::uint64_t> hotfix;
    std::optional<std::string> prerelease;
    std::optional<std::string> build;

    bool operator==(const VersionFields& o) const;
    bool operator!=(const VersionFields& o) const { return !(*this == o); }
};

// Convert extracted strings into typed fields. Every violated field is
// reported in the returned error's `issues`, not just the first one.
Result<VersionFields> validate_fields(const RawFields& raw);

// Check already-typed fields against the same constraints and normalize them
// (empty label becomes absent, `spaced_label` is reset when there is no label).
Result<VersionFields> validate_fields(const VersionFields& fields);

// Per-field checks shared with the compliance engine
bool is_valid_branch(const std::optional<std::string>& branch);
bool is_valid_label(const std::optional<std::string>& label);
bool is_valid_number(std::uint64_t n);
bool is_valid_hotfix(const std::optional<std::uint64_t>& hotfix);
bool is_valid_prerelease(const std::optional<std::string>& prerelease);
bool is_valid_build(const std::optional<std::string>& build);

} // namespace versa
