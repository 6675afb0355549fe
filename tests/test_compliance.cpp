#include <catch2/catch.hpp>
#include <versa/compliance.hpp>
#include <versa/version.hpp>
#include <stdexcept>

using namespace versa;

static Version ver(const std::string& s) {
    auto r = Version::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

static Version ver(const std::string& s, ComplianceSettings settings) {
    auto r = Version::parse(s, std::move(settings));
    REQUIRE(r.is_ok());
    return r.value();
}

static const ComplianceMessage* find_message(const ComplianceReport& r, Field f) {
    for (const auto& m : r.messages) {
        if (m.field == f) return &m;
    }
    return nullptr;
}

// ===== Standard compliance =====

TEST_CASE("lenient mode accepts the extension fields", "[compliance]") {
    auto report = ver("release v 1.2.3.4-beta.1+b.007").standard_compliance();
    REQUIRE(report.success);
    REQUIRE(report.messages.empty());
}

TEST_CASE("strict mode on a plain version", "[compliance]") {
    auto v = ver("1.0.0");
    REQUIRE(v.is_standard_compliant(true));

    // Branch and Hotfix still leave an informational note
    auto report = v.standard_compliance(true);
    REQUIRE(report.messages.size() == 2);
    REQUIRE(find_message(report, Field::Branch)->kind == ComplianceMessage::Info);
    REQUIRE(find_message(report, Field::Hotfix)->kind == ComplianceMessage::Info);
}

TEST_CASE("strict mode rejects a hotfix", "[compliance]") {
    auto v = ver("1.0.0.1");
    REQUIRE_FALSE(v.is_standard_compliant(true));
    REQUIRE(v.is_standard_compliant(false));

    auto report = v.standard_compliance(true);
    auto hotfix = find_message(report, Field::Hotfix);
    REQUIRE(hotfix != nullptr);
    REQUIRE(hotfix->kind == ComplianceMessage::Error);
    REQUIRE(hotfix->message == "Hotfix is not a standard notation");
}

TEST_CASE("strict mode rejects a label", "[compliance]") {
    auto report = ver("v1.0.0").standard_compliance(true);
    REQUIRE_FALSE(report.success);
    REQUIRE(find_message(report, Field::Label)->kind == ComplianceMessage::Error);
}

// A branch under strict mode is only informational while label and hotfix
// are errors. This asymmetry is intentional.
TEST_CASE("strict mode only notes a branch", "[compliance]") {
    auto report = ver("main 1.0.0").standard_compliance(true);
    REQUIRE(report.success);
    REQUIRE(report.count(Field::Branch) == 1);
    REQUIRE(find_message(report, Field::Branch)->kind == ComplianceMessage::Info);
}

TEST_CASE("standard check on raw typed fields", "[compliance]") {
    VersionFields f;
    f.major = kMaxSafeInteger + 1;
    f.label = "release";
    f.prerelease = "01";
    f.build = "";
    f.branch = "";

    auto report = check_standard_compliance(f);
    REQUIRE_FALSE(report.success);
    REQUIRE(report.count(Field::Major) == 1);
    REQUIRE(report.count(Field::Minor) == 0);
    REQUIRE(report.count(Field::Label) == 1);
    REQUIRE(report.count(Field::Prerelease) == 1);
    REQUIRE(report.count(Field::Build) == 1);
    REQUIRE(report.count(Field::Branch) == 1);
    REQUIRE(find_message(report, Field::Prerelease)->message ==
            "Prerelease does not match required format");
}

// ===== Custom compliance =====

TEST_CASE("default settings are always compliant", "[compliance]") {
    REQUIRE(ver("x v1.0.0.3-a+b").is_custom_compliant());
    REQUIRE(ver("1.0.0").is_custom_compliant());
}

TEST_CASE("required field", "[compliance]") {
    ComplianceSettings s;
    s.branch = TextPolicy::required();
    s.hotfix = HotfixPolicy::required();

    auto missing = ver("1.0.0", s).custom_compliance();
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.messages.size() == 2);
    REQUIRE(missing.messages[0].field == Field::Branch);
    REQUIRE(missing.messages[0].message == "Branch is required");
    REQUIRE(missing.messages[1].field == Field::Hotfix);

    // Hotfix 0 is present
    REQUIRE(ver("main 1.0.0.0", s).is_custom_compliant());
}

TEST_CASE("required string field rejects blank values", "[compliance]") {
    ComplianceSettings s;
    s.branch = TextPolicy::required();
    VersionFields f;
    f.branch = "   ";
    f.major = 1;
    auto v = Version::from_fields(f, s);
    REQUIRE(v.is_ok());
    REQUIRE_FALSE(v.value().is_custom_compliant());
}

TEST_CASE("forbidden field", "[compliance]") {
    ComplianceSettings s;
    s.build = TextPolicy::forbidden();
    s.hotfix = HotfixPolicy::forbidden();

    REQUIRE(ver("1.0.0-rc.1", s).is_custom_compliant());

    auto report = ver("1.0.0.2+exp", s).custom_compliance();
    REQUIRE_FALSE(report.success);
    REQUIRE(report.messages.size() == 2);
    REQUIRE(report.count(Field::Hotfix) == 1);
    REQUIRE(report.count(Field::Build) == 1);
    REQUIRE(report.messages[1].message == "Build is forbidden");
}

TEST_CASE("required and forbidden complement each other", "[compliance]") {
    ComplianceSettings required;
    required.label = TextPolicy::required();
    ComplianceSettings forbidden;
    forbidden.label = TextPolicy::forbidden();

    REQUIRE(ver("v1.0.0", required).is_custom_compliant());
    REQUIRE_FALSE(ver("v1.0.0", forbidden).is_custom_compliant());
    REQUIRE_FALSE(ver("1.0.0", required).is_custom_compliant());
    REQUIRE(ver("1.0.0", forbidden).is_custom_compliant());
}

TEST_CASE("prerelease allow-list with literal and pattern", "[compliance]") {
    ComplianceSettings s;
    s.prerelease = TextPolicy::allow({std::string("alpha"),
                                      Pattern::compile("^beta\\..+$").value()});

    REQUIRE(ver("1.0.0-beta.1", s).is_custom_compliant());
    REQUIRE(ver("1.0.0-alpha", s).is_custom_compliant());

    auto report = ver("1.0.0-rc.1", s).custom_compliance();
    REQUIRE_FALSE(report.success);
    REQUIRE(report.messages.size() == 1);
    REQUIRE(report.messages[0].field == Field::Prerelease);
    REQUIRE(report.messages[0].kind == ComplianceMessage::Error);

    // No prerelease: neither the literal nor the pattern match ""
    REQUIRE_FALSE(ver("1.0.0", s).is_custom_compliant());
}

TEST_CASE("empty literal in an allow-list matches an absent field", "[compliance]") {
    ComplianceSettings s;
    s.branch = TextPolicy::allow({std::string(""), std::string("main")});

    REQUIRE(ver("1.0.0", s).is_custom_compliant());
    REQUIRE(ver("main 1.0.0", s).is_custom_compliant());
    REQUIRE_FALSE(ver("dev 1.0.0", s).is_custom_compliant());
}

TEST_CASE("hotfix allow-list with numbers and patterns", "[compliance]") {
    ComplianceSettings s;
    s.hotfix = HotfixPolicy::allow({std::uint64_t{1},
                                    Pattern::compile("^[5-9]$").value()});

    REQUIRE(ver("1.0.0.1", s).is_custom_compliant());
    REQUIRE(ver("1.0.0.7", s).is_custom_compliant());
    REQUIRE_FALSE(ver("1.0.0.2", s).is_custom_compliant());
    REQUIRE_FALSE(ver("1.0.0", s).is_custom_compliant());
}

TEST_CASE("pattern tested against empty string for an absent field", "[compliance]") {
    ComplianceSettings s;
    s.build = TextPolicy::allow({Pattern::compile("^$").value()});
    REQUIRE(ver("1.0.0", s).is_custom_compliant());
    REQUIRE_FALSE(ver("1.0.0+x", s).is_custom_compliant());
}

TEST_CASE("empty allow-list never matches", "[compliance]") {
    ComplianceSettings s;
    s.label = TextPolicy::allow({});
    REQUIRE_FALSE(ver("1.0.0", s).is_custom_compliant());
}

TEST_CASE("each failing field yields one message", "[compliance]") {
    ComplianceSettings s;
    s.branch = TextPolicy::required();
    s.label = TextPolicy::required();
    s.hotfix = HotfixPolicy::required();
    s.prerelease = TextPolicy::required();
    s.build = TextPolicy::required();

    auto report = ver("1.0.0", s).custom_compliance();
    REQUIRE(report.messages.size() == 5);
    for (Field f : {Field::Branch, Field::Label, Field::Hotfix,
                    Field::Prerelease, Field::Build}) {
        REQUIRE(report.count(f) == 1);
    }
}

// ===== Null version =====

TEST_CASE("compliance on a null version throws", "[compliance]") {
    const Version* none = nullptr;
    REQUIRE_THROWS_AS(check_custom_compliance(none), std::invalid_argument);
    REQUIRE_THROWS_AS(check_standard_compliance(none, true), std::invalid_argument);

    auto v = ver("1.0.0");
    REQUIRE(check_custom_compliance(&v).success);
    REQUIRE(check_standard_compliance(&v).success);
}

TEST_CASE("kind names", "[compliance]") {
    REQUIRE(std::string(message_kind_name(ComplianceMessage::Error)) == "error");
    REQUIRE(std::string(message_kind_name(ComplianceMessage::Warning)) == "warning");
    REQUIRE(std::string(message_kind_name(ComplianceMessage::Info)) == "info");
    REQUIRE(std::string(field_name(Field::Prerelease)) == "Prerelease");
}
