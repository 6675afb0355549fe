#include <versa/compliance.hpp>
#include <versa/version.hpp>
#include <versa/log.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace versa {

const char* field_name(Field f) {
    switch (f) {
        case Field::Branch:     return "Branch";
        case Field::Label:      return "Label";
        case Field::Major:      return "Major";
        case Field::Minor:      return "Minor";
        case Field::Patch:      return "Patch";
        case Field::Hotfix:     return "Hotfix";
        case Field::Prerelease: return "Prerelease";
        case Field::Build:      return "Build";
    }
    return "Unknown";
}

const char* message_kind_name(ComplianceMessage::Kind k) {
    switch (k) {
        case ComplianceMessage::Error:   return "error";
        case ComplianceMessage::Warning: return "warning";
        case ComplianceMessage::Info:    return "info";
    }
    return "unknown";
}

size_t ComplianceReport::count(Field f) const {
    return static_cast<size_t>(std::count_if(messages.begin(), messages.end(),
        [&](const ComplianceMessage& m) { return m.field == f; }));
}

static ComplianceReport make_report(std::vector<ComplianceMessage> messages) {
    ComplianceReport report;
    report.success = std::none_of(messages.begin(), messages.end(),
        [](const ComplianceMessage& m) { return m.kind == ComplianceMessage::Error; });
    report.messages = std::move(messages);
    return report;
}

static ComplianceMessage format_error(Field f) {
    return {f, std::string(field_name(f)) + " does not match required format",
            ComplianceMessage::Error};
}

static ComplianceMessage not_standard(Field f, ComplianceMessage::Kind kind) {
    return {f, std::string(field_name(f)) + " is not a standard notation", kind};
}

// ---------------------------------------------------------------------------
// Standard compliance
// ---------------------------------------------------------------------------

ComplianceReport check_standard_compliance(const VersionFields& fields,
                                           bool strict) {
    std::vector<ComplianceMessage> msgs;

    if (strict) {
        msgs.push_back(not_standard(Field::Branch, ComplianceMessage::Info));
    } else if (!is_valid_branch(fields.branch)) {
        msgs.push_back(format_error(Field::Branch));
    }

    if (strict && fields.label && !fields.label->empty()) {
        msgs.push_back(not_standard(Field::Label, ComplianceMessage::Error));
    } else if (!is_valid_label(fields.label)) {
        msgs.push_back(format_error(Field::Label));
    }

    if (!is_valid_number(fields.major)) msgs.push_back(format_error(Field::Major));
    if (!is_valid_number(fields.minor)) msgs.push_back(format_error(Field::Minor));
    if (!is_valid_number(fields.patch)) msgs.push_back(format_error(Field::Patch));

    if (strict) {
        msgs.push_back(not_standard(Field::Hotfix, fields.hotfix
            ? ComplianceMessage::Error : ComplianceMessage::Info));
    } else if (!is_valid_hotfix(fields.hotfix)) {
        msgs.push_back(format_error(Field::Hotfix));
    }

    if (!is_valid_prerelease(fields.prerelease)) {
        msgs.push_back(format_error(Field::Prerelease));
    }
    if (!is_valid_build(fields.build)) {
        msgs.push_back(format_error(Field::Build));
    }

    auto report = make_report(std::move(msgs));
    if (!report.success) {
        log::debug("standard compliance (%s) failed with %zu message(s)",
                   strict ? "strict" : "lenient", report.messages.size());
    }
    return report;
}

// ---------------------------------------------------------------------------
// Custom compliance
// ---------------------------------------------------------------------------

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

static bool rule_matches(const TextRule& rule,
                         const std::optional<std::string>& value) {
    if (auto lit = std::get_if<std::string>(&rule)) {
        if (lit->empty()) return !value.has_value();
        return value && *value == *lit;
    }
    return std::get<Pattern>(rule).test(value.value_or(""));
}

static bool rule_matches(const HotfixRule& rule,
                         const std::optional<std::uint64_t>& value) {
    if (auto lit = std::get_if<std::uint64_t>(&rule)) {
        return value && *value == *lit;
    }
    return std::get<Pattern>(rule).test(value ? std::to_string(*value) : "");
}

// `has_content` is false for absent values and, for strings, blank ones
template<typename Rule, typename Value>
static std::optional<ComplianceMessage> check_setting(
    Field f, const PolicySetting<Rule>& setting,
    const std::optional<Value>& value, bool has_content)
{
    std::string name = field_name(f);
    switch (setting.mode) {
    case PolicyMode::Optional:
        return std::nullopt;

    case PolicyMode::Required:
        if (!has_content) {
            return ComplianceMessage{f, name + " is required", ComplianceMessage::Error};
        }
        return std::nullopt;

    case PolicyMode::Forbidden:
        if (value.has_value()) {
            return ComplianceMessage{f, name + " is forbidden", ComplianceMessage::Error};
        }
        return std::nullopt;

    case PolicyMode::AllowList: {
        bool any = std::any_of(setting.rules.begin(), setting.rules.end(),
            [&](const Rule& r) { return rule_matches(r, value); });
        if (!any) {
            return ComplianceMessage{f, name + " does not match any allowed value",
                                     ComplianceMessage::Error};
        }
        return std::nullopt;
    }
    }
    return std::nullopt;
}

static bool filled(const std::optional<std::string>& s) {
    return s && !is_blank(*s);
}

ComplianceReport check_custom_compliance(const VersionFields& fields,
                                         const ComplianceSettings& settings) {
    std::vector<ComplianceMessage> msgs;
    auto add = [&](std::optional<ComplianceMessage> m) {
        if (m) {
            log::debug("custom compliance: %s", m->message.c_str());
            msgs.push_back(std::move(*m));
        }
    };

    add(check_setting(Field::Branch, settings.branch, fields.branch,
                      filled(fields.branch)));
    add(check_setting(Field::Label, settings.label, fields.label,
                      filled(fields.label)));
    add(check_setting(Field::Hotfix, settings.hotfix, fields.hotfix,
                      fields.hotfix.has_value()));
    add(check_setting(Field::Prerelease, settings.prerelease, fields.prerelease,
                      filled(fields.prerelease)));
    add(check_setting(Field::Build, settings.build, fields.build,
                      filled(fields.build)));

    return make_report(std::move(msgs));
}

// ---------------------------------------------------------------------------
// Version overloads
// ---------------------------------------------------------------------------

ComplianceReport check_standard_compliance(const Version* version, bool strict) {
    if (!version) {
        throw std::invalid_argument("standard compliance check on a null version");
    }
    return check_standard_compliance(version->fields(), strict);
}

ComplianceReport check_custom_compliance(const Version* version) {
    if (!version) {
        throw std::invalid_argument("custom compliance check on a null version");
    }
    return check_custom_compliance(version->fields(), version->settings());
}

} // namespace versa
