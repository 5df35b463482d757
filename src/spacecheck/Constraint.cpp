#include "spacecheck/Constraint.hpp"

#include <algorithm>
#include <utility>
#include <sstream>

namespace spacecheck {

const char* constraint_name(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::NumericRange: return "numeric_range";
        case ConstraintKind::StringLength: return "string_length";
        case ConstraintKind::SetMembership: return "set_membership";
        case ConstraintKind::CollectionSize: return "collection_size";
    }
    return "unknown";
}

Constraint numeric_range(double min_value, double max_value) {
    Constraint c;
    c.kind = ConstraintKind::NumericRange;
    c.min_value = min_value;
    c.max_value = max_value;
    return c;
}

Constraint string_length(size_t min_count, size_t max_count) {
    Constraint c;
    c.kind = ConstraintKind::StringLength;
    c.min_count = min_count;
    c.max_count = max_count;
    return c;
}

Constraint max_length(size_t max_count) {
    return string_length(0, max_count);
}

Constraint set_membership(std::vector<std::string> allowed) {
    Constraint c;
    c.kind = ConstraintKind::SetMembership;
    c.allowed = std::move(allowed);
    return c;
}

Constraint collection_size(size_t min_count, size_t max_count) {
    Constraint c;
    c.kind = ConstraintKind::CollectionSize;
    c.min_count = min_count;
    c.max_count = max_count;
    return c;
}

bool applies_to(const Constraint& c, SemanticType type) {
    switch (c.kind) {
        case ConstraintKind::NumericRange:
            return type == SemanticType::Integer || type == SemanticType::Float;
        case ConstraintKind::StringLength:
            return type == SemanticType::String || type == SemanticType::EnumTag;
        case ConstraintKind::SetMembership:
            return type == SemanticType::EnumTag || type == SemanticType::String;
        case ConstraintKind::CollectionSize:
            return type == SemanticType::RecordList;
    }
    return false;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string format_number(double v) {
    std::ostringstream oss;
    oss.precision(15);
    oss << v;
    return oss.str();
}

static Violation make_violation(ViolationKind kind, const std::string& path, const std::string& msg) {
    Violation v;
    v.path = path;
    v.kind = kind;
    v.message = msg;
    return v;
}

static std::optional<Violation> check_range(const Constraint& c, const FieldValue& value, const std::string& path) {
    double d = 0.0;
    std::string shown;
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        d = static_cast<double>(*i);
        shown = std::to_string(*i);
    } else if (const auto* f = std::get_if<double>(&value)) {
        d = *f;
        shown = format_number(*f);
    } else {
        return std::nullopt;
    }

    if (d < c.min_value) {
        return make_violation(ViolationKind::RangeError, path,
                              "value " + shown + " is less than minimum " + format_number(c.min_value));
    }
    if (d > c.max_value) {
        return make_violation(ViolationKind::RangeError, path,
                              "value " + shown + " is greater than maximum " + format_number(c.max_value));
    }
    return std::nullopt;
}

static std::optional<Violation> check_length(const Constraint& c, const FieldValue& value, const std::string& path) {
    const auto* s = std::get_if<std::string>(&value);
    if (!s) return std::nullopt;

    const size_t len = utf8_length(*s);
    if (len < c.min_count) {
        return make_violation(ViolationKind::LengthError, path,
                              "length " + std::to_string(len) + " is less than minimum " + std::to_string(c.min_count));
    }
    if (len > c.max_count) {
        return make_violation(ViolationKind::LengthError, path,
                              "length " + std::to_string(len) + " is greater than maximum " + std::to_string(c.max_count));
    }
    return std::nullopt;
}

static std::optional<Violation> check_membership(const Constraint& c, const FieldValue& value, const std::string& path) {
    const auto* s = std::get_if<std::string>(&value);
    if (!s) return std::nullopt;

    if (std::find(c.allowed.begin(), c.allowed.end(), *s) != c.allowed.end()) return std::nullopt;

    std::string list;
    for (size_t i = 0; i < c.allowed.size(); ++i) {
        if (i > 0) list += ", ";
        list += c.allowed[i];
    }
    return make_violation(ViolationKind::EnumError, path, "value '" + *s + "' is not one of: " + list);
}

static std::optional<Violation> check_size(const Constraint& c, const FieldValue& value, const std::string& path) {
    const auto* list = std::get_if<RecordList>(&value);
    if (!list) return std::nullopt;

    const size_t n = list->size();
    if (n < c.min_count) {
        return make_violation(ViolationKind::SizeError, path,
                              "collection has " + std::to_string(n) + " elements, expected at least " + std::to_string(c.min_count));
    }
    if (n > c.max_count) {
        return make_violation(ViolationKind::SizeError, path,
                              "collection has " + std::to_string(n) + " elements, expected at most " + std::to_string(c.max_count));
    }
    return std::nullopt;
}

std::optional<Violation> check_constraint(const Constraint& c, const FieldValue& value, const std::string& path) {
    switch (c.kind) {
        case ConstraintKind::NumericRange: return check_range(c, value, path);
        case ConstraintKind::StringLength: return check_length(c, value, path);
        case ConstraintKind::SetMembership: return check_membership(c, value, path);
        case ConstraintKind::CollectionSize: return check_size(c, value, path);
    }
    return std::nullopt;
}

std::optional<Violation> check_required(bool present, bool optional, const std::string& path) {
    if (present || optional) return std::nullopt;
    return make_violation(ViolationKind::TypeError, path, "field required");
}

}  // namespace spacecheck
