#include "spacecheck/Violation.hpp"

namespace spacecheck {

const char* kind_name(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::TypeError: return "type_error";
        case ViolationKind::RangeError: return "range_error";
        case ViolationKind::LengthError: return "length_error";
        case ViolationKind::EnumError: return "enum_error";
        case ViolationKind::SizeError: return "size_error";
        case ViolationKind::BusinessRuleError: return "business_rule_error";
    }
    return "unknown";
}

bool operator==(const Violation& a, const Violation& b) {
    return a.path == b.path && a.kind == b.kind && a.message == b.message;
}

std::string join_path(const std::string& prefix, const std::string& path) {
    if (prefix.empty()) return path;
    if (path.empty()) return prefix;
    if (path[0] == '[') return prefix + path;
    return prefix + "." + path;
}

std::string index_path(const std::string& field, size_t index) {
    return field + "[" + std::to_string(index) + "]";
}

}  // namespace spacecheck
