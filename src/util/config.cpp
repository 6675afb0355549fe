#include <versa/config.hpp>
#include <fstream>
#include <sstream>

namespace versa {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return VersaError{VersaError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (const toml::node* node = lg->get("level")) {
            auto name = node->value<std::string>();
            if (!name) {
                return VersaError{VersaError::Config, "log.level must be a string"};
            }
            auto parsed = log::parse_level(*name);
            if (parsed.is_err()) return std::move(parsed).error();
            cfg.log_level = parsed.value();
        }
    }

    // [compliance] section
    if (auto comp = doc["compliance"].as_table()) {
        auto policies = PolicyOverrides::from_table(*comp);
        if (policies.is_err()) return std::move(policies).error();
        cfg.policies = std::move(policies).value();
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VersaError{VersaError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().hint = "in " + path;
    } else {
        log::debug("loaded config %s", path.c_str());
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    const auto& o = other.policies;
    if (o.branch) policies.branch = o.branch;
    if (o.label) policies.label = o.label;
    if (o.hotfix) policies.hotfix = o.hotfix;
    if (o.prerelease) policies.prerelease = o.prerelease;
    if (o.build) policies.build = o.build;
}

Config Config::effective(const std::optional<Config>& base,
                         const std::optional<Config>& project) {
    Config result;
    if (base.has_value()) result.merge(base.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

ComplianceSettings Config::compliance() const {
    return ComplianceSettings::from_overrides(policies);
}

Status Config::apply() const {
    VERSA_TRY(set_default_compliance_settings(compliance()));
    if (log_level) log::set_level(*log_level);
    log::info("default compliance settings updated from config");
    return ok_status();
}

} // namespace versa
