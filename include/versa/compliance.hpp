#pragma once

#include <versa/fields.hpp>
#include <versa/policy.hpp>
#include <string>
#include <vector>

namespace versa {

class Version;

enum class Field {
    Branch,
    Label,
    Major,
    Minor,
    Patch,
    Hotfix,
    Prerelease,
    Build,
};

const char* field_name(Field f);

struct ComplianceMessage {
    enum Kind { Error, Warning, Info };

    Field field;
    std::string message;
    Kind kind = Error;
};

const char* message_kind_name(ComplianceMessage::Kind k);

// Compliance failures are ordinary results, never errors
struct ComplianceReport {
    bool success = true;
    std::vector<ComplianceMessage> messages;

    // Number of messages for `f`
    size_t count(Field f) const;
};

// Canonical SemVer syntax check. In strict mode the extension fields are
// flagged: Branch always yields an info message, a present Label or Hotfix
// is an error, an absent Hotfix yields info.
ComplianceReport check_standard_compliance(const VersionFields& fields,
                                           bool strict = false);

// Evaluate the five governed fields against `settings`. Each failing field
// contributes exactly one error message.
ComplianceReport check_custom_compliance(const VersionFields& fields,
                                         const ComplianceSettings& settings);

// Version overloads. A null version is a programming error and throws
// std::invalid_argument instead of producing a report.
ComplianceReport check_standard_compliance(const Version* version,
                                           bool strict = false);
ComplianceReport check_custom_compliance(const Version* version);

} // namespace versa
