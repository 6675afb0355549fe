#include <catch2/catch.hpp>
#include <versa/grammar.hpp>

using namespace versa;

// ===== Sub-grammars =====

TEST_CASE("label keywords match in any case", "[grammar]") {
    REQUIRE(is_label_keyword("v"));
    REQUIRE(is_label_keyword("V"));
    REQUIRE(is_label_keyword("ver"));
    REQUIRE(is_label_keyword("Version"));
    REQUIRE_FALSE(is_label_keyword(""));
    REQUIRE_FALSE(is_label_keyword("vers"));
    REQUIRE_FALSE(is_label_keyword("release"));
}

TEST_CASE("numeric runs", "[grammar]") {
    REQUIRE(is_numeric("0"));
    REQUIRE(is_numeric("007"));
    REQUIRE_FALSE(is_numeric(""));
    REQUIRE_FALSE(is_numeric("1a"));
    REQUIRE_FALSE(is_numeric("-1"));
}

TEST_CASE("prerelease tokens reject a leading zero", "[grammar]") {
    REQUIRE(is_prerelease_token("beta"));
    REQUIRE(is_prerelease_token("1"));
    REQUIRE(is_prerelease_token("-x"));
    REQUIRE(is_prerelease_token("rc-1"));
    REQUIRE_FALSE(is_prerelease_token("0"));
    REQUIRE_FALSE(is_prerelease_token("01"));
    REQUIRE_FALSE(is_prerelease_token(""));
    REQUIRE_FALSE(is_prerelease_token("be_ta"));

    REQUIRE(is_prerelease("beta.1"));
    REQUIRE_FALSE(is_prerelease("beta.01"));
    REQUIRE_FALSE(is_prerelease("beta..1"));
    REQUIRE_FALSE(is_prerelease("beta."));
}

TEST_CASE("build tokens allow leading zeros", "[grammar]") {
    REQUIRE(is_build_token("007"));
    REQUIRE(is_build_token("0"));
    REQUIRE(is_build_token("sha-5114f85"));
    REQUIRE_FALSE(is_build_token(""));
    REQUIRE_FALSE(is_build_token("a+b"));

    REQUIRE(is_build("build.007"));
    REQUIRE_FALSE(is_build(".build"));
}

// ===== Extraction =====

TEST_CASE("extract plain triple", "[grammar]") {
    auto r = extract_fields("1.2.3");
    REQUIRE(r.is_ok());
    auto& f = r.value();
    REQUIRE_FALSE(f.branch.has_value());
    REQUIRE_FALSE(f.label.has_value());
    REQUIRE(f.major == "1");
    REQUIRE(f.minor == "2");
    REQUIRE(f.patch == "3");
    REQUIRE_FALSE(f.hotfix.has_value());
    REQUIRE_FALSE(f.prerelease.has_value());
    REQUIRE_FALSE(f.build.has_value());
}

TEST_CASE("extract label without space", "[grammar]") {
    auto r = extract_fields("v1.2.3");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().label.value() == "v");
    REQUIRE_FALSE(r.value().spaced_label);
    REQUIRE_FALSE(r.value().branch.has_value());
}

TEST_CASE("extract label with space keeps its spelling", "[grammar]") {
    auto r = extract_fields("Version 4.0.0");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().label.value() == "Version");
    REQUIRE(r.value().spaced_label);
    REQUIRE(r.value().major == "4");
}

TEST_CASE("extract every field", "[grammar]") {
    auto r = extract_fields("release 2.0.0.5-beta.1+build.007");
    REQUIRE(r.is_ok());
    auto& f = r.value();
    REQUIRE(f.branch.value() == "release");
    REQUIRE_FALSE(f.label.has_value());
    REQUIRE(f.major == "2");
    REQUIRE(f.minor == "0");
    REQUIRE(f.patch == "0");
    REQUIRE(f.hotfix.value() == "5");
    REQUIRE(f.prerelease.value() == "beta.1");
    REQUIRE(f.build.value() == "build.007");
}

TEST_CASE("branch followed by label", "[grammar]") {
    auto r = extract_fields("main ver 1.0.0");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().branch.value() == "main");
    REQUIRE(r.value().label.value() == "ver");
    REQUIRE(r.value().spaced_label);
}

TEST_CASE("lone keyword before the core is a label, not a branch", "[grammar]") {
    auto r = extract_fields("v 1.0.0");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().branch.has_value());
    REQUIRE(r.value().label.value() == "v");
}

TEST_CASE("branch may contain spaces", "[grammar]") {
    auto r = extract_fields("feature my thing 1.0.0");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().branch.value() == "feature my thing");
}

TEST_CASE("prerelease may contain hyphens", "[grammar]") {
    auto r = extract_fields("1.0.0-rc-1.x+b");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().prerelease.value() == "rc-1.x");
    REQUIRE(r.value().build.value() == "b");
}

TEST_CASE("grammar captures prerelease tokens it does not validate", "[grammar]") {
    auto r = extract_fields("1.0.0-a.01");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().prerelease.value() == "a.01");
}

TEST_CASE("grammar mismatches", "[grammar]") {
    const char* bad[] = {
        "",
        "1.2",
        "1",
        "1.2.3.4.5",
        "1.2.3-",
        "1.2.3-0",
        "1.2.3+",
        "1.2.3+a+b",
        "1.2.3 ",
        " 1.2.3",
        "x1.2.3",
        "vv1.2.3",
        "1.2.a",
        "a.b.c",
    };
    for (const char* s : bad) {
        INFO(s);
        auto r = extract_fields(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == VersaError::GrammarMismatch);
    }
}
