#pragma once

#include <string>
#include <vector>

namespace versa {

// One violated field reported by structural validation
struct FieldIssue {
    std::string field;    // e.g. "prerelease"
    std::string message;

    bool operator==(const FieldIssue& o) const {
        return field == o.field && message == o.message;
    }
};

struct VersaError {
    enum Code {
        GrammarMismatch,
        FieldValidation,
        Config,
        Parse,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::vector<FieldIssue> issues;  // FieldValidation only

    VersaError() = default;
    VersaError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VersaError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    VersaError(Code c, std::string msg, std::vector<FieldIssue> is)
        : code(c), message(std::move(msg)), issues(std::move(is)) {}

    bool has_issue(const std::string& field) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace versa
