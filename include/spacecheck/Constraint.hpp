#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "spacecheck/Record.hpp"
#include "spacecheck/Violation.hpp"

namespace spacecheck {

enum class ConstraintKind {
    NumericRange,
    StringLength,
    SetMembership,
    CollectionSize
};

const char* constraint_name(ConstraintKind kind);

// A predicate tag and the parameters it needs. Bounds are inclusive.
struct Constraint {
    ConstraintKind kind = ConstraintKind::NumericRange;

    double min_value = 0.0;  // numeric-range
    double max_value = 0.0;

    size_t min_count = 0;    // string-length (code points) / collection-size (elements)
    size_t max_count = 0;

    std::vector<std::string> allowed;  // set-membership
};

Constraint numeric_range(double min_value, double max_value);
Constraint string_length(size_t min_count, size_t max_count);
Constraint max_length(size_t max_count);
Constraint set_membership(std::vector<std::string> allowed);
Constraint collection_size(size_t min_count, size_t max_count);

// whether the constraint inspects values of this semantic type
bool applies_to(const Constraint& c, SemanticType type);

// Pure check of an already coerced value. Empty when satisfied; the violation carries `path`.
std::optional<Violation> check_constraint(const Constraint& c, const FieldValue& value, const std::string& path);

// The "required" primitive: fails only for an absent value on a field that is
// neither optional nor defaulted. A missing value is reported as a type_error.
std::optional<Violation> check_required(bool present, bool optional, const std::string& path);

// number of code points in UTF-8 text; continuation bytes are not counted
size_t utf8_length(const std::string& s);

// shortest readable rendering for messages: 20, 85.5, 0.1
std::string format_number(double v);

}  // namespace spacecheck
