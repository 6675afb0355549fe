#pragma once

#include <versa/compliance.hpp>
#include <versa/fields.hpp>
#include <versa/policy.hpp>
#include <versa/result.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace versa {

// Immutable extended semantic version:
//
//   [branch ][label[ ]]major.minor.patch[.hotfix][-prerelease][+build]
//
// Every instance has passed structural validation and renders to a string
// that parses back to the same fields. Operations that change a field
// return a new, revalidated Version.
class Version {
public:
    // 0.0.1 with the current default compliance settings
    Version();

    static Result<Version> parse(const std::string& s);
    static Result<Version> parse(const std::string& s, ComplianceSettings settings);

    static Result<Version> from_fields(const VersionFields& fields);
    static Result<Version> from_fields(const VersionFields& fields,
                                       ComplianceSettings settings);

    // Inverse of to_table(). A missing [compliance] table means the
    // current default settings.
    static Result<Version> from_table(const toml::table& tbl);

    const std::optional<std::string>& branch() const { return fields_.branch; }
    const std::optional<std::string>& label() const { return fields_.label; }
    bool spaced_label() const { return fields_.spaced_label; }
    std::uint64_t major() const { return fields_.major; }
    std::uint64_t minor() const { return fields_.minor; }
    std::uint64_t patch() const { return fields_.patch; }
    const std::optional<std::uint64_t>& hotfix() const { return fields_.hotfix; }
    const std::optional<std::string>& prerelease() const { return fields_.prerelease; }
    const std::optional<std::string>& build() const { return fields_.build; }

    const VersionFields& fields() const { return fields_; }
    const ComplianceSettings& settings() const { return settings_; }

    // Replace one field, keep everything else including settings
    Result<Version> change_branch(std::optional<std::string> branch) const;
    Result<Version> change_label(std::optional<std::string> label) const;
    Result<Version> change_major(std::uint64_t major) const;
    Result<Version> change_minor(std::uint64_t minor) const;
    Result<Version> change_patch(std::uint64_t patch) const;
    Result<Version> change_hotfix(std::optional<std::uint64_t> hotfix) const;
    Result<Version> change_prerelease(std::optional<std::string> prerelease) const;
    Result<Version> change_build(std::optional<std::string> build) const;

    // Bumping a tier resets every less significant tier and clears the
    // hotfix/prerelease/build qualifiers. increment_hotfix keeps
    // major.minor.patch and only clears prerelease/build.
    Result<Version> increment_major() const;
    Result<Version> increment_minor() const;
    Result<Version> increment_patch() const;
    Result<Version> increment_hotfix() const;

    ComplianceReport standard_compliance(bool strict = false) const;
    ComplianceReport custom_compliance() const;
    bool is_standard_compliant(bool strict = false) const;
    bool is_custom_compliant() const;

    // Precedence: branch (locale collation, absent == ""), major, minor,
    // patch, hotfix (absent == 0). Prerelease and build do not take part.
    static int compare(const Version& a, const Version& b);
    int compare_precedence(const Version& o) const;

    std::string to_string() const;
    toml::table to_table() const;
    std::string to_json() const;
    std::string to_toml() const;

    // Value equality over all fields and settings
    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    // Precedence order
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;

private:
    Version(VersionFields fields, ComplianceSettings settings)
        : fields_(std::move(fields)), settings_(std::move(settings)) {}

    static Result<Version> make(const VersionFields& fields,
                                ComplianceSettings settings);

    VersionFields fields_;
    ComplianceSettings settings_;
};

} // namespace versa
