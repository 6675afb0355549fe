#include <versa/fields.hpp>
#include <vector>

namespace versa {

bool VersionFields::operator==(const VersionFields& o) const {
    return branch == o.branch && label == o.label &&
           spaced_label == o.spaced_label &&
           major == o.major && minor == o.minor && patch == o.patch &&
           hotfix == o.hotfix && prerelease == o.prerelease &&
           build == o.build;
}

// ---------------------------------------------------------------------------
// Field rules
// ---------------------------------------------------------------------------

bool is_valid_branch(const std::optional<std::string>& branch) {
    return !branch || !branch->empty();
}

// An empty label passes and is later treated as absent.
bool is_valid_label(const std::optional<std::string>& label) {
    return !label || label->empty() || is_label_keyword(*label);
}

bool is_valid_number(std::uint64_t n) {
    return n <= kMaxSafeInteger;
}

bool is_valid_hotfix(const std::optional<std::uint64_t>& hotfix) {
    return !hotfix || is_valid_number(*hotfix);
}

bool is_valid_prerelease(const std::optional<std::string>& prerelease) {
    return !prerelease || is_prerelease(*prerelease);
}

bool is_valid_build(const std::optional<std::string>& build) {
    return !build || is_build(*build);
}

static const char* kNumberMessage = "must be a non-negative safe integer";
static const char* kPrereleaseMessage =
    "Prerelease Version does not match required format";
static const char* kBuildMessage =
    "Build Version does not match required format";
static const char* kBranchMessage = "Branch must not be empty";
static const char* kLabelMessage = "Label must be one of v, ver, version";

// Digits only, at most kMaxSafeInteger. Leading zeros are accepted.
static std::optional<std::uint64_t> parse_number(const std::string& s) {
    if (!is_numeric(s)) return std::nullopt;
    std::uint64_t n = 0;
    for (char c : s) {
        n = n * 10 + static_cast<std::uint64_t>(c - '0');
        if (n > kMaxSafeInteger) return std::nullopt;
    }
    return n;
}

static Result<VersionFields> finish(VersionFields fields,
                                    std::vector<FieldIssue> issues) {
    if (!issues.empty()) {
        std::string msg = "invalid version fields:";
        for (const auto& i : issues) {
            msg += " ";
            msg += i.field;
        }
        return VersaError{VersaError::FieldValidation, msg, std::move(issues)};
    }

    if (fields.label && fields.label->empty()) fields.label.reset();
    if (!fields.label) fields.spaced_label = true;
    return Result<VersionFields>::ok(std::move(fields));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

Result<VersionFields> validate_fields(const RawFields& raw) {
    VersionFields fields;
    std::vector<FieldIssue> issues;

    if (!is_valid_branch(raw.branch)) {
        issues.push_back({"branch", kBranchMessage});
    }
    fields.branch = raw.branch;

    if (!is_valid_label(raw.label)) {
        issues.push_back({"label", kLabelMessage});
    }
    fields.label = raw.label;
    fields.spaced_label = raw.spaced_label;

    auto number = [&](const char* name, const std::string& text,
                      std::uint64_t& dest) {
        if (auto n = parse_number(text)) {
            dest = *n;
        } else {
            issues.push_back({name, std::string(kNumberMessage)});
        }
    };
    number("major", raw.major, fields.major);
    number("minor", raw.minor, fields.minor);
    number("patch", raw.patch, fields.patch);

    if (raw.hotfix) {
        std::uint64_t h = 0;
        number("hotfix", *raw.hotfix, h);
        fields.hotfix = h;
    }

    if (!is_valid_prerelease(raw.prerelease)) {
        issues.push_back({"prerelease", kPrereleaseMessage});
    }
    fields.prerelease = raw.prerelease;

    if (!is_valid_build(raw.build)) {
        issues.push_back({"build", kBuildMessage});
    }
    fields.build = raw.build;

    return finish(std::move(fields), std::move(issues));
}

Result<VersionFields> validate_fields(const VersionFields& fields) {
    std::vector<FieldIssue> issues;

    if (!is_valid_branch(fields.branch)) {
        issues.push_back({"branch", kBranchMessage});
    }
    if (!is_valid_label(fields.label)) {
        issues.push_back({"label", kLabelMessage});
    }
    if (!is_valid_number(fields.major)) {
        issues.push_back({"major", kNumberMessage});
    }
    if (!is_valid_number(fields.minor)) {
        issues.push_back({"minor", kNumberMessage});
    }
    if (!is_valid_number(fields.patch)) {
        issues.push_back({"patch", kNumberMessage});
    }
    if (!is_valid_hotfix(fields.hotfix)) {
        issues.push_back({"hotfix", kNumberMessage});
    }
    if (!is_valid_prerelease(fields.prerelease)) {
        issues.push_back({"prerelease", kPrereleaseMessage});
    }
    if (!is_valid_build(fields.build)) {
        issues.push_back({"build", kBuildMessage});
    }

    return finish(fields, std::move(issues));
}

} // namespace versa
