#include <versa/policy.hpp>
#include <versa/log.hpp>

namespace versa {

// ---------------------------------------------------------------------------
// Pattern
// ---------------------------------------------------------------------------

Result<Pattern> Pattern::compile(const std::string& source, bool icase) {
    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;
    try {
        return Result<Pattern>::ok(Pattern(source, icase, std::regex(source, flags)));
    } catch (const std::regex_error& e) {
        return VersaError{VersaError::Config,
            "invalid pattern '" + source + "': " + e.what()};
    }
}

bool Pattern::test(const std::string& text) const {
    return std::regex_search(text, re_);
}

const char* policy_mode_name(PolicyMode m) {
    switch (m) {
        case PolicyMode::Optional:  return "optional";
        case PolicyMode::Required:  return "required";
        case PolicyMode::Forbidden: return "forbidden";
        case PolicyMode::AllowList: return "allow-list";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// TOML codec
// ---------------------------------------------------------------------------

// { pattern = "...", icase = true }
static Result<Pattern> parse_pattern(const std::string& field,
                                     const toml::table& tbl) {
    auto src = tbl["pattern"].value<std::string>();
    if (!src) {
        return VersaError{VersaError::Config,
            "compliance." + field + ": pattern table needs a 'pattern' string"};
    }
    bool icase = false;
    if (const toml::node* flag = tbl.get("icase")) {
        auto b = flag->value<bool>();
        if (!b) {
            return VersaError{VersaError::Config,
                "compliance." + field + ": 'icase' must be a boolean"};
        }
        icase = *b;
    }
    return Pattern::compile(*src, icase);
}

// Shared mode/array handling. `parse_literal` turns a non-table array
// element into a rule.
template<typename Rule, typename LiteralFn>
static Result<PolicySetting<Rule>> parse_policy(const std::string& field,
                                                const toml::node& node,
                                                LiteralFn parse_literal) {
    using Setting = PolicySetting<Rule>;

    if (auto mode = node.value<std::string>()) {
        if (*mode == "required") return Result<Setting>::ok(Setting::required());
        if (*mode == "optional") return Result<Setting>::ok(Setting::optional());
        if (*mode == "forbidden") return Result<Setting>::ok(Setting::forbidden());
        return VersaError{VersaError::Config,
            "compliance." + field + ": unknown mode '" + *mode + "'",
            "expected \"required\", \"optional\", \"forbidden\" or an array"};
    }

    auto arr = node.as_array();
    if (!arr) {
        return VersaError{VersaError::Config,
            "compliance." + field + " must be a string or an array"};
    }

    std::vector<Rule> rules;
    for (const auto& elem : *arr) {
        if (auto tbl = elem.as_table()) {
            auto pat = parse_pattern(field, *tbl);
            if (pat.is_err()) return std::move(pat).error();
            rules.push_back(std::move(pat).value());
            continue;
        }
        auto lit = parse_literal(elem);
        if (lit.is_err()) return std::move(lit).error();
        rules.push_back(std::move(lit).value());
    }
    return Result<Setting>::ok(Setting::allow(std::move(rules)));
}

static Result<TextPolicy> parse_text_policy(const std::string& field,
                                     const toml::node& node) {
    return parse_policy<TextRule>(field, node,
        [&](const toml::node& elem) -> Result<TextRule> {
            if (auto s = elem.as_string()) {
                return Result<TextRule>::ok(TextRule(s->get()));
            }
            return VersaError{VersaError::Config,
                "compliance." + field + ": rules must be strings or pattern tables"};
        });
}

static Result<HotfixPolicy> parse_hotfix_policy(const std::string& field,
                                         const toml::node& node) {
    return parse_policy<HotfixRule>(field, node,
        [&](const toml::node& elem) -> Result<HotfixRule> {
            if (auto i = elem.as_integer()) {
                std::int64_t n = i->get();
                if (n < 0) {
                    return VersaError{VersaError::Config,
                        "compliance." + field + ": negative literal " + std::to_string(n)};
                }
                if (static_cast<std::uint64_t>(n) > kMaxSafeInteger) {
                    return VersaError{VersaError::Config,
                        "compliance." + field + ": literal " + std::to_string(n) +
                        " exceeds the safe-integer range"};
                }
                return Result<HotfixRule>::ok(HotfixRule(static_cast<std::uint64_t>(n)));
            }
            return VersaError{VersaError::Config,
                "compliance." + field + ": rules must be integers or pattern tables"};
        });
}

static toml::table pattern_table(const Pattern& p) {
    toml::table t;
    t.insert_or_assign("pattern", p.source());
    if (p.icase()) t.insert_or_assign("icase", true);
    t.is_inline(true);
    return t;
}

template<typename Rule, typename LiteralFn>
static void insert_policy_impl(toml::table& tbl, const std::string& key,
                               const PolicySetting<Rule>& policy,
                               LiteralFn push_literal) {
    if (policy.mode != PolicyMode::AllowList) {
        tbl.insert_or_assign(key, std::string(policy_mode_name(policy.mode)));
        return;
    }
    toml::array arr;
    for (const auto& rule : policy.rules) {
        if (auto p = std::get_if<Pattern>(&rule)) {
            arr.push_back(pattern_table(*p));
        } else {
            push_literal(arr, rule);
        }
    }
    tbl.insert_or_assign(key, std::move(arr));
}

static void insert_policy(toml::table& tbl, const std::string& key,
                          const TextPolicy& policy) {
    insert_policy_impl(tbl, key, policy, [](toml::array& arr, const TextRule& r) {
        arr.push_back(std::get<std::string>(r));
    });
}

static void insert_policy(toml::table& tbl, const std::string& key,
                          const HotfixPolicy& policy) {
    insert_policy_impl(tbl, key, policy, [](toml::array& arr, const HotfixRule& r) {
        arr.push_back(static_cast<std::int64_t>(std::get<std::uint64_t>(r)));
    });
}

// ---------------------------------------------------------------------------
// PolicyOverrides
// ---------------------------------------------------------------------------

Result<PolicyOverrides> PolicyOverrides::from_table(const toml::table& tbl) {
    PolicyOverrides o;

    for (const auto& [key, val] : tbl) {
        std::string k(key);
        if (k == "hotfix") {
            auto p = parse_hotfix_policy(k, val);
            if (p.is_err()) return std::move(p).error();
            o.hotfix = std::move(p).value();
            continue;
        }

        std::optional<TextPolicy>* dest = nullptr;
        if (k == "branch") dest = &o.branch;
        else if (k == "label") dest = &o.label;
        else if (k == "prerelease") dest = &o.prerelease;
        else if (k == "build") dest = &o.build;
        if (!dest) {
            return VersaError{VersaError::Config,
                "unknown compliance field '" + k + "'",
                "expected one of: branch, label, hotfix, prerelease, build"};
        }

        auto p = parse_text_policy(k, val);
        if (p.is_err()) return std::move(p).error();
        *dest = std::move(p).value();
    }

    return Result<PolicyOverrides>::ok(std::move(o));
}

// ---------------------------------------------------------------------------
// ComplianceSettings
// ---------------------------------------------------------------------------

ComplianceSettings ComplianceSettings::from_overrides(const PolicyOverrides& o) {
    ComplianceSettings s;
    if (o.branch) s.branch = *o.branch;
    if (o.label) s.label = *o.label;
    if (o.hotfix) s.hotfix = *o.hotfix;
    if (o.prerelease) s.prerelease = *o.prerelease;
    if (o.build) s.build = *o.build;
    return s;
}

Result<ComplianceSettings> ComplianceSettings::from_table(const toml::table& tbl) {
    auto o = PolicyOverrides::from_table(tbl);
    if (o.is_err()) return std::move(o).error();
    return Result<ComplianceSettings>::ok(from_overrides(o.value()));
}

Status ComplianceSettings::validate() const {
    for (const auto& rule : hotfix.rules) {
        auto n = std::get_if<std::uint64_t>(&rule);
        if (n && *n > kMaxSafeInteger) {
            return VersaError{VersaError::InvalidArg,
                "compliance.hotfix: literal " + std::to_string(*n) +
                " exceeds the safe-integer range"};
        }
    }
    return ok_status();
}

toml::table ComplianceSettings::to_table() const {
    toml::table t;
    insert_policy(t, "branch", branch);
    insert_policy(t, "label", label);
    insert_policy(t, "hotfix", hotfix);
    insert_policy(t, "prerelease", prerelease);
    insert_policy(t, "build", build);
    return t;
}

bool ComplianceSettings::operator==(const ComplianceSettings& o) const {
    return branch == o.branch && label == o.label && hotfix == o.hotfix &&
           prerelease == o.prerelease && build == o.build;
}

// ---------------------------------------------------------------------------
// Process-wide defaults
// ---------------------------------------------------------------------------

static ComplianceSettings s_default_settings;

Status set_default_compliance_settings(ComplianceSettings settings) {
    VERSA_TRY(settings.validate());
    s_default_settings = std::move(settings);
    log::debug("default compliance settings: branch=%s label=%s hotfix=%s "
               "prerelease=%s build=%s",
               policy_mode_name(s_default_settings.branch.mode),
               policy_mode_name(s_default_settings.label.mode),
               policy_mode_name(s_default_settings.hotfix.mode),
               policy_mode_name(s_default_settings.prerelease.mode),
               policy_mode_name(s_default_settings.build.mode));
    return ok_status();
}

const ComplianceSettings& default_compliance_settings() {
    return s_default_settings;
}

} // namespace versa
