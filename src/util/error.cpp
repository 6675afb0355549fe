#include <versa/error.hpp>
#include <algorithm>

namespace versa {

const char* VersaError::code_name(Code c) {
    switch (c) {
        case GrammarMismatch: return "GrammarMismatch";
        case FieldValidation: return "FieldValidation";
        case Config:          return "Config";
        case Parse:           return "Parse";
        case IO:              return "IO";
        case InvalidArg:      return "InvalidArg";
    }
    return "Unknown";
}

bool VersaError::has_issue(const std::string& field) const {
    return std::any_of(issues.begin(), issues.end(),
        [&](const FieldIssue& i) { return i.field == field; });
}

std::string VersaError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    for (const auto& issue : issues) {
        result += "\n  ";
        result += issue.field;
        result += ": ";
        result += issue.message;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace versa
