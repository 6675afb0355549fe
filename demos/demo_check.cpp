// demo_check.cpp
//
// A small standalone program that parses version strings given on the
// command line and reports precedence and compliance for each one.
//
//     ./demo_check "v1.2.3" "release 2.0.0.5-beta.1+build.007"
//     ./demo_check --config policy.toml "1.0.0-rc.1"
//     ./demo_check "1.2"                 # grammar mismatch
//
// Watch stderr for log output and formatted error messages.

#include <versa/config.hpp>
#include <versa/log.hpp>
#include <versa/version.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace versa;

struct Args {
    std::string config_path;
    std::vector<std::string> inputs;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") {
            if (i + 1 >= argc) {
                return VersaError{VersaError::InvalidArg,
                    "--config needs a file argument",
                    "usage: demo_check [--config file.toml] <version>..."};
            }
            args.config_path = argv[++i];
        } else {
            args.inputs.push_back(a);
        }
    }
    if (args.inputs.empty()) {
        return VersaError{VersaError::InvalidArg,
            "no version specified",
            "usage: demo_check [--config file.toml] <version>..."};
    }
    return Result<Args>::ok(std::move(args));
}

static void print_report(const char* title, const ComplianceReport& report) {
    std::cout << "  " << title << ": " << (report.success ? "yes" : "no") << "\n";
    for (const auto& m : report.messages) {
        std::cout << "    [" << message_kind_name(m.kind) << "] "
                  << m.message << "\n";
    }
}

Result<std::vector<Version>> check_all(const Args& args) {
    if (!args.config_path.empty()) {
        auto cfg = Config::load(args.config_path);
        VERSA_TRY(cfg);
        VERSA_TRY(cfg.value().apply());
    }

    std::vector<Version> versions;
    for (const auto& input : args.inputs) {
        auto v = Version::parse(input);
        VERSA_TRY(v);

        std::cout << v.value().to_string() << "\n";
        print_report("standard", v.value().standard_compliance());
        print_report("strict", v.value().standard_compliance(true));
        print_report("custom", v.value().custom_compliance());
        versions.push_back(std::move(v).value());
    }
    return Result<std::vector<Version>>::ok(std::move(versions));
}

int main(int argc, char** argv) {
    log::set_level(log::Debug);

    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }

    auto result = check_all(args.value());
    if (result.is_err()) {
        log::error("check failed");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }

    const auto& versions = result.value();
    for (size_t i = 1; i < versions.size(); ++i) {
        int c = Version::compare(versions[i - 1], versions[i]);
        std::cout << versions[i - 1].to_string()
                  << (c < 0 ? " < " : c > 0 ? " > " : " == ")
                  << versions[i].to_string() << "\n";
    }
    return 0;
}
