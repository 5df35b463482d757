#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace spacecheck {

enum class ViolationKind {
    TypeError,
    RangeError,
    LengthError,
    EnumError,
    SizeError,
    BusinessRuleError
};

// machine-readable name: "type_error", "range_error", ...
const char* kind_name(ViolationKind kind);

struct Violation {
    std::string path;  // "crew_size", "crew[2].years_experience", "" for the record root
    ViolationKind kind = ViolationKind::TypeError;
    std::string message;
};

bool operator==(const Violation& a, const Violation& b);

// Non-empty whenever it is returned from a failed validation.
struct ErrorReport {
    std::string record_kind;
    std::vector<Violation> violations;
};

// prefix + "." + path, or prefix + path when path starts with an index
std::string join_path(const std::string& prefix, const std::string& path);
std::string index_path(const std::string& field, size_t index);

class UnknownRecordKind : public std::runtime_error {
public:
    explicit UnknownRecordKind(const std::string& kind)
        : std::runtime_error("unknown record kind: " + kind), m_kind(kind) {}

    const std::string& kind() const { return m_kind; }

private:
    std::string m_kind;
};

class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace spacecheck
