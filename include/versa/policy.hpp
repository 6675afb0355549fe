#pragma once

#include <versa/fields.hpp>
#include <versa/result.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace versa {

// ECMAScript regular expression tested with search semantics
class Pattern {
public:
    static Result<Pattern> compile(const std::string& source, bool icase = false);

    const std::string& source() const { return source_; }
    bool icase() const { return icase_; }

    bool test(const std::string& text) const;

    bool operator==(const Pattern& o) const {
        return source_ == o.source_ && icase_ == o.icase_;
    }
    bool operator!=(const Pattern& o) const { return !(*this == o); }

private:
    Pattern(std::string source, bool icase, std::regex re)
        : source_(std::move(source)), icase_(icase), re_(std::move(re)) {}

    std::string source_;
    bool icase_ = false;
    std::regex re_;
};

// Allow-list elements. String-typed fields compare string literals, the
// numeric Hotfix field compares integers. The empty-string literal matches
// an absent field.
using TextRule = std::variant<std::string, Pattern>;
using HotfixRule = std::variant<std::uint64_t, Pattern>;

enum class PolicyMode {
    Optional,
    Required,
    Forbidden,
    AllowList,
};

const char* policy_mode_name(PolicyMode m);

template<typename Rule>
struct PolicySetting {
    PolicyMode mode = PolicyMode::Optional;
    std::vector<Rule> rules;  // AllowList only

    static PolicySetting optional() { return {PolicyMode::Optional, {}}; }
    static PolicySetting required() { return {PolicyMode::Required, {}}; }
    static PolicySetting forbidden() { return {PolicyMode::Forbidden, {}}; }
    static PolicySetting allow(std::vector<Rule> rules) {
        return {PolicyMode::AllowList, std::move(rules)};
    }

    bool operator==(const PolicySetting& o) const {
        return mode == o.mode && rules == o.rules;
    }
    bool operator!=(const PolicySetting& o) const { return !(*this == o); }
};

using TextPolicy = PolicySetting<TextRule>;
using HotfixPolicy = PolicySetting<HotfixRule>;

// Policies named in a [compliance] table. Fields the table leaves out stay
// unset so layered configs can tell them apart from an explicit "optional".
struct PolicyOverrides {
    std::optional<TextPolicy> branch;
    std::optional<TextPolicy> label;
    std::optional<HotfixPolicy> hotfix;
    std::optional<TextPolicy> prerelease;
    std::optional<TextPolicy> build;

    // Each key is "required", "optional", "forbidden" or an array of
    // literals and { pattern = "...", icase = bool }
    static Result<PolicyOverrides> from_table(const toml::table& tbl);
};

// Policies for the five governed fields. Every field defaults to optional.
struct ComplianceSettings {
    TextPolicy branch;
    TextPolicy label;
    HotfixPolicy hotfix;
    TextPolicy prerelease;
    TextPolicy build;

    // Unset entries are optional
    static ComplianceSettings from_overrides(const PolicyOverrides& o);

    static Result<ComplianceSettings> from_table(const toml::table& tbl);
    toml::table to_table() const;

    // Hotfix literals must lie in the safe-integer range; larger values
    // could never match and cannot be written to a snapshot.
    Status validate() const;

    bool operator==(const ComplianceSettings& o) const;
    bool operator!=(const ComplianceSettings& o) const { return !(*this == o); }
};

// Process-wide defaults captured by every Version built without explicit
// settings. Not synchronized: set them before constructing versions from
// several threads. Invalid settings are rejected and the previous defaults
// stay in place.
Status set_default_compliance_settings(ComplianceSettings settings);
const ComplianceSettings& default_compliance_settings();

} // namespace versa
