#include <versa/version.hpp>
#include <versa/log.hpp>
#include <locale>
#include <sstream>
#include <vector>

namespace versa {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Version::Version() : settings_(default_compliance_settings()) {
    fields_.patch = 1;
}

Result<Version> Version::make(const VersionFields& fields,
                              ComplianceSettings settings) {
    VERSA_TRY(settings.validate());
    auto checked = validate_fields(fields);
    if (checked.is_err()) return std::move(checked).error();

    Version v(std::move(checked).value(), std::move(settings));

    // A branch may swallow what the grammar would read as a label
    // (e.g. branch "v" renders as "v 1.0.0"). Reject values that do not
    // survive their own rendering.
    auto raw = extract_fields(v.to_string());
    auto reparsed = raw.is_ok() ? validate_fields(raw.value())
                                : Result<VersionFields>(raw.error());
    if (reparsed.is_err() || reparsed.value() != v.fields_) {
        return VersaError{VersaError::FieldValidation,
            "invalid version fields: branch",
            std::vector<FieldIssue>{{"branch", "Branch cannot be told apart from "
                                               "the label or version after it"}}};
    }

    return Result<Version>::ok(std::move(v));
}

Result<Version> Version::parse(const std::string& s) {
    return parse(s, default_compliance_settings());
}

Result<Version> Version::parse(const std::string& s, ComplianceSettings settings) {
    VERSA_TRY(settings.validate());
    auto raw = extract_fields(s);
    if (raw.is_err()) {
        log::debug("rejected version '%s': no grammar match", s.c_str());
        return std::move(raw).error();
    }

    auto fields = validate_fields(raw.value());
    if (fields.is_err()) {
        log::debug("rejected version '%s': %s", s.c_str(),
                   fields.error().message.c_str());
        return std::move(fields).error();
    }

    return Result<Version>::ok(Version(std::move(fields).value(), std::move(settings)));
}

Result<Version> Version::from_fields(const VersionFields& fields) {
    return make(fields, default_compliance_settings());
}

Result<Version> Version::from_fields(const VersionFields& fields,
                                     ComplianceSettings settings) {
    return make(fields, std::move(settings));
}

// ---------------------------------------------------------------------------
// Snapshot
// ---------------------------------------------------------------------------

static const char* kSnapshotNumberMessage = "must be a non-negative safe integer";

Result<Version> Version::from_table(const toml::table& tbl) {
    VersionFields f;
    std::vector<FieldIssue> issues;

    auto text = [&](const char* key, std::optional<std::string>& dest) {
        const toml::node* node = tbl.get(key);
        if (!node) return;
        if (auto s = node->as_string()) {
            dest = s->get();
        } else {
            issues.push_back({key, "must be a string"});
        }
    };

    auto number = [&](const char* key, bool required) -> std::optional<std::uint64_t> {
        const toml::node* node = tbl.get(key);
        if (!node) {
            if (required) issues.push_back({key, "is required"});
            return std::nullopt;
        }
        auto i = node->as_integer();
        if (!i || i->get() < 0 ||
            static_cast<std::uint64_t>(i->get()) > kMaxSafeInteger) {
            issues.push_back({key, kSnapshotNumberMessage});
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(i->get());
    };

    text("branch", f.branch);
    text("label", f.label);
    if (const toml::node* node = tbl.get("spaced-label")) {
        if (auto b = node->value<bool>()) {
            f.spaced_label = *b;
        } else {
            issues.push_back({"spaced-label", "must be a boolean"});
        }
    }
    f.major = number("major", true).value_or(0);
    f.minor = number("minor", true).value_or(0);
    f.patch = number("patch", true).value_or(0);
    f.hotfix = number("hotfix", false);
    text("prerelease", f.prerelease);
    text("build", f.build);

    if (!issues.empty()) {
        return VersaError{VersaError::FieldValidation,
            "invalid version snapshot", std::move(issues)};
    }

    if (auto compliance = tbl["compliance"].as_table()) {
        auto settings = ComplianceSettings::from_table(*compliance);
        if (settings.is_err()) return std::move(settings).error();
        return make(f, std::move(settings).value());
    }
    return make(f, default_compliance_settings());
}

toml::table Version::to_table() const {
    toml::table t;
    if (fields_.branch) t.insert_or_assign("branch", *fields_.branch);
    if (fields_.label) {
        t.insert_or_assign("label", *fields_.label);
        t.insert_or_assign("spaced-label", fields_.spaced_label);
    }
    t.insert_or_assign("major", static_cast<std::int64_t>(fields_.major));
    t.insert_or_assign("minor", static_cast<std::int64_t>(fields_.minor));
    t.insert_or_assign("patch", static_cast<std::int64_t>(fields_.patch));
    if (fields_.hotfix) {
        t.insert_or_assign("hotfix", static_cast<std::int64_t>(*fields_.hotfix));
    }
    if (fields_.prerelease) t.insert_or_assign("prerelease", *fields_.prerelease);
    if (fields_.build) t.insert_or_assign("build", *fields_.build);
    t.insert_or_assign("compliance", settings_.to_table());
    return t;
}

std::string Version::to_json() const {
    std::ostringstream ss;
    ss << toml::json_formatter{to_table()};
    return ss.str();
}

std::string Version::to_toml() const {
    std::ostringstream ss;
    ss << to_table();
    return ss.str();
}

// ---------------------------------------------------------------------------
// Field changes
// ---------------------------------------------------------------------------

Result<Version> Version::change_branch(std::optional<std::string> branch) const {
    VersionFields f = fields_;
    f.branch = std::move(branch);
    return make(f, settings_);
}

Result<Version> Version::change_label(std::optional<std::string> label) const {
    VersionFields f = fields_;
    f.label = std::move(label);
    return make(f, settings_);
}

Result<Version> Version::change_major(std::uint64_t major) const {
    VersionFields f = fields_;
    f.major = major;
    return make(f, settings_);
}

Result<Version> Version::change_minor(std::uint64_t minor) const {
    VersionFields f = fields_;
    f.minor = minor;
    return make(f, settings_);
}

Result<Version> Version::change_patch(std::uint64_t patch) const {
    VersionFields f = fields_;
    f.patch = patch;
    return make(f, settings_);
}

Result<Version> Version::change_hotfix(std::optional<std::uint64_t> hotfix) const {
    VersionFields f = fields_;
    f.hotfix = hotfix;
    return make(f, settings_);
}

Result<Version> Version::change_prerelease(std::optional<std::string> prerelease) const {
    VersionFields f = fields_;
    f.prerelease = std::move(prerelease);
    return make(f, settings_);
}

Result<Version> Version::change_build(std::optional<std::string> build) const {
    VersionFields f = fields_;
    f.build = std::move(build);
    return make(f, settings_);
}

Result<Version> Version::increment_major() const {
    VersionFields f = fields_;
    f.major = fields_.major + 1;
    f.minor = 0;
    f.patch = 0;
    f.hotfix.reset();
    f.prerelease.reset();
    f.build.reset();
    return make(f, settings_);
}

Result<Version> Version::increment_minor() const {
    VersionFields f = fields_;
    f.minor = fields_.minor + 1;
    f.patch = 0;
    f.hotfix.reset();
    f.prerelease.reset();
    f.build.reset();
    return make(f, settings_);
}

Result<Version> Version::increment_patch() const {
    VersionFields f = fields_;
    f.patch = fields_.patch + 1;
    f.hotfix.reset();
    f.prerelease.reset();
    f.build.reset();
    return make(f, settings_);
}

Result<Version> Version::increment_hotfix() const {
    VersionFields f = fields_;
    f.hotfix = fields_.hotfix.value_or(0) + 1;
    f.prerelease.reset();
    f.build.reset();
    return make(f, settings_);
}

// ---------------------------------------------------------------------------
// Compliance
// ---------------------------------------------------------------------------

ComplianceReport Version::standard_compliance(bool strict) const {
    return check_standard_compliance(fields_, strict);
}

ComplianceReport Version::custom_compliance() const {
    return check_custom_compliance(fields_, settings_);
}

bool Version::is_standard_compliant(bool strict) const {
    return standard_compliance(strict).success;
}

bool Version::is_custom_compliant() const {
    return custom_compliance().success;
}

// ---------------------------------------------------------------------------
// Precedence
// ---------------------------------------------------------------------------

static int compare_branch(const std::string& a, const std::string& b) {
    std::locale loc;
    const auto& coll = std::use_facet<std::collate<char>>(loc);
    return coll.compare(a.data(), a.data() + a.size(),
                        b.data(), b.data() + b.size());
}

static int compare_number(std::uint64_t a, std::uint64_t b) {
    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

int Version::compare(const Version& a, const Version& b) {
    return a.compare_precedence(b);
}

int Version::compare_precedence(const Version& o) const {
    int c = compare_branch(fields_.branch.value_or(""), o.fields_.branch.value_or(""));
    if (c != 0) return c;
    if ((c = compare_number(fields_.major, o.fields_.major)) != 0) return c;
    if ((c = compare_number(fields_.minor, o.fields_.minor)) != 0) return c;
    if ((c = compare_number(fields_.patch, o.fields_.patch)) != 0) return c;
    return compare_number(fields_.hotfix.value_or(0), o.fields_.hotfix.value_or(0));
}

bool Version::operator==(const Version& o) const {
    return fields_ == o.fields_ && settings_ == o.settings_;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }
bool Version::operator<(const Version& o) const { return compare_precedence(o) < 0; }
bool Version::operator<=(const Version& o) const { return compare_precedence(o) <= 0; }
bool Version::operator>(const Version& o) const { return compare_precedence(o) > 0; }
bool Version::operator>=(const Version& o) const { return compare_precedence(o) >= 0; }

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string Version::to_string() const {
    std::string s;
    if (fields_.branch) {
        s += *fields_.branch;
        s += " ";
    }
    if (fields_.label) {
        s += *fields_.label;
        if (fields_.spaced_label) s += " ";
    }
    s += std::to_string(fields_.major) + "." +
         std::to_string(fields_.minor) + "." +
         std::to_string(fields_.patch);
    if (fields_.hotfix) s += "." + std::to_string(*fields_.hotfix);
    if (fields_.prerelease) s += "-" + *fields_.prerelease;
    if (fields_.build) s += "+" + *fields_.build;
    return s;
}

} // namespace versa
