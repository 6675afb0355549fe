#pragma once

#include <versa/log.hpp>
#include <versa/policy.hpp>
#include <versa/result.hpp>
#include <optional>
#include <string>

namespace versa {

// Layered configuration: a base file (e.g. organisation-wide) overridden by
// a project file. Unset entries fall through to the layer below.
//
//   [log]
//   level = "debug"
//
//   [compliance]
//   branch = "forbidden"
//   prerelease = ["alpha", { pattern = "^beta\\..+$" }]
struct Config {
    std::optional<log::Level> log_level;
    PolicyOverrides policies;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set entries override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& base,
                            const std::optional<Config>& project);

    // Unset policies are optional
    ComplianceSettings compliance() const;

    // Install the log level (when set) and the default compliance settings
    Status apply() const;
};

} // namespace versa
