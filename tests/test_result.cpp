#include <catch2/catch.hpp>
#include <versa/result.hpp>
#include <string>
#include <vector>

using namespace versa;

static Result<int> try_double(Result<int> input) {
    VERSA_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 42);
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(VersaError{VersaError::GrammarMismatch, "not a version"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == VersaError::GrammarMismatch);
    REQUIRE(r.error().message == "not a version");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("VERSA_TRY propagates errors and passes Ok through", "[result]") {
    auto failed = try_double(Result<int>::err(VersaError{VersaError::IO, "disk"}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == VersaError::IO);

    auto passed = try_double(Result<int>::ok(7));
    REQUIRE(passed.value() == 14);
}

TEST_CASE("Status", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(VersaError{VersaError::Config, "bad config"});
    REQUIRE(s.error().code == VersaError::Config);
}

TEST_CASE("VersaError format() lists field issues and hint", "[error]") {
    std::vector<FieldIssue> issues = {
        {"major", "must be a non-negative safe integer"},
        {"build", "Build Version does not match required format"},
    };
    VersaError e{VersaError::FieldValidation, "invalid version fields: major build",
                 issues};
    e.hint = "check the input";
    auto formatted = e.format();
    REQUIRE(formatted.find("error[FieldValidation]") != std::string::npos);
    REQUIRE(formatted.find("\n  major: must be") != std::string::npos);
    REQUIRE(formatted.find("\n  build: Build Version") != std::string::npos);
    REQUIRE(formatted.find("hint: check the input") != std::string::npos);
    REQUIRE(e.has_issue("major"));
    REQUIRE_FALSE(e.has_issue("minor"));
}

TEST_CASE("VersaError format() without hint or issues", "[error]") {
    VersaError e{VersaError::GrammarMismatch, "'1.2' is not a version"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[GrammarMismatch]: '1.2' is not a version");
}

TEST_CASE("VersaError code_name() for all codes", "[error]") {
    REQUIRE(std::string(VersaError::code_name(VersaError::GrammarMismatch)) == "GrammarMismatch");
    REQUIRE(std::string(VersaError::code_name(VersaError::FieldValidation)) == "FieldValidation");
    REQUIRE(std::string(VersaError::code_name(VersaError::Config)) == "Config");
    REQUIRE(std::string(VersaError::code_name(VersaError::Parse)) == "Parse");
    REQUIRE(std::string(VersaError::code_name(VersaError::IO)) == "IO");
    REQUIRE(std::string(VersaError::code_name(VersaError::InvalidArg)) == "InvalidArg");
}
