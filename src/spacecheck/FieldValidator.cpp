#include "spacecheck/FieldValidator.hpp"

#include "spacecheck/Constraint.hpp"
#include "spacecheck/SchemaRegistry.hpp"
#include "spacecheck/Timestamp.hpp"
#include "spacecheck/Validator.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace spacecheck {

static std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::optional<std::int64_t> parse_int_text(const std::string& text) {
    const std::string s = trim_copy(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size()) return std::nullopt;
    return static_cast<std::int64_t>(v);
}

static std::optional<double> parse_float_text(const std::string& text) {
    const std::string s = trim_copy(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size()) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

static std::optional<FieldValue> coerce_integer(const nlohmann::json& raw) {
    if (raw.is_number_unsigned()) {
        const auto u = raw.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
        return FieldValue(static_cast<std::int64_t>(u));
    }
    if (raw.is_number_integer()) return FieldValue(raw.get<std::int64_t>());

    if (raw.is_number_float()) {
        const double d = raw.get<double>();
        if (!std::isfinite(d) || d != std::trunc(d)) return std::nullopt;
        // 2^63 is exactly representable; anything at or beyond it does not fit
        if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) return std::nullopt;
        return FieldValue(static_cast<std::int64_t>(d));
    }

    if (raw.is_string()) {
        const auto v = parse_int_text(raw.get<std::string>());
        if (!v) return std::nullopt;
        return FieldValue(*v);
    }
    return std::nullopt;
}

static std::optional<FieldValue> coerce_float(const nlohmann::json& raw) {
    if (raw.is_number()) return FieldValue(raw.get<double>());

    if (raw.is_string()) {
        const auto v = parse_float_text(raw.get<std::string>());
        if (!v) return std::nullopt;
        return FieldValue(*v);
    }
    return std::nullopt;
}

static std::optional<FieldValue> coerce_boolean(const nlohmann::json& raw) {
    if (raw.is_boolean()) return FieldValue(raw.get<bool>());

    if (raw.is_number_integer()) {
        const auto i = raw.get<std::int64_t>();
        if (i == 0) return FieldValue(false);
        if (i == 1) return FieldValue(true);
        return std::nullopt;
    }

    if (raw.is_string()) {
        const std::string s = to_lower_copy(trim_copy(raw.get<std::string>()));
        if (s == "true" || s == "yes" || s == "on" || s == "1") return FieldValue(true);
        if (s == "false" || s == "no" || s == "off" || s == "0") return FieldValue(false);
    }
    return std::nullopt;
}

std::optional<FieldValue> coerce_value(SemanticType type, const nlohmann::json& raw) {
    switch (type) {
        case SemanticType::String:
        case SemanticType::EnumTag:
            if (!raw.is_string()) return std::nullopt;
            return FieldValue(raw.get<std::string>());
        case SemanticType::Integer:
            return coerce_integer(raw);
        case SemanticType::Float:
            return coerce_float(raw);
        case SemanticType::Boolean:
            return coerce_boolean(raw);
        case SemanticType::Timestamp: {
            if (!raw.is_string()) return std::nullopt;
            auto ts = parse_iso8601(raw.get<std::string>());
            if (!ts) return std::nullopt;
            return FieldValue(*ts);
        }
        case SemanticType::NestedRecord:
        case SemanticType::RecordList:
            return std::nullopt;
    }
    return std::nullopt;
}

static const char* expected_text(SemanticType type) {
    switch (type) {
        case SemanticType::String: return "expected a string";
        case SemanticType::Integer: return "expected an integer";
        case SemanticType::Float: return "expected a number";
        case SemanticType::Boolean: return "expected a boolean";
        case SemanticType::Timestamp: return "expected an ISO-8601 timestamp";
        case SemanticType::EnumTag: return "expected a string tag";
        case SemanticType::NestedRecord: return "expected an object";
        case SemanticType::RecordList: return "expected an array of objects";
    }
    return "unexpected value";
}

static void add_violation(ErrorReport& rep, ViolationKind kind, const std::string& path, const std::string& msg) {
    Violation v;
    v.path = path;
    v.kind = kind;
    v.message = msg;
    rep.violations.push_back(std::move(v));
}

// Runs the nested record through the whole pipeline. Failures are copied into
// `rep` under `prefix`; the returned pointer is null in that case.
static RecordPtr validate_embedded(const SchemaRegistry& registry,
                                   const std::string& kind,
                                   const nlohmann::json& raw,
                                   const std::string& prefix,
                                   ErrorReport& rep) {
    if (!raw.is_object()) {
        add_violation(rep, ViolationKind::TypeError, prefix, "expected an object");
        return nullptr;
    }

    ValidationResult r = validate(registry, kind, raw);
    if (!r.is_ok()) {
        for (const auto& v : r.error().violations) {
            add_violation(rep, v.kind, join_path(prefix, v.path), v.message);
        }
        return nullptr;
    }
    return std::make_shared<const ValidatedRecord>(std::move(r).take());
}

Result<TypedFields> validate_fields(const SchemaRegistry& registry,
                                    const RecordSchema& schema,
                                    const nlohmann::json& raw) {
    ErrorReport rep;
    rep.record_kind = schema.kind();

    if (!raw.is_object()) {
        add_violation(rep, ViolationKind::TypeError, "", "expected an object");
        return Result<TypedFields>::fail(std::move(rep));
    }

    TypedFields out(schema.kind());

    for (const auto& f : schema.fields()) {
        auto it = raw.find(f.name);
        const bool is_null = it != raw.end() && it->is_null();
        const bool present = it != raw.end() && !is_null;

        // a default covers a missing key, but only optional fields accept null
        if (is_null && !f.optional && f.default_value) {
            add_violation(rep, ViolationKind::TypeError, f.name, expected_text(f.type));
            continue;
        }

        if (auto missing = check_required(present, f.optional || f.default_value.has_value(), f.name)) {
            rep.violations.push_back(std::move(*missing));
            continue;
        }

        if (!present) {
            if (f.default_value) {
                auto dv = coerce_value(f.type, *f.default_value);
                if (dv) out.set(f.name, std::move(*dv));
            }
            continue;
        }

        std::optional<FieldValue> value;

        if (f.type == SemanticType::NestedRecord) {
            RecordPtr rec = validate_embedded(registry, f.record_kind, *it, f.name, rep);
            if (rec) value = FieldValue(std::move(rec));
        } else if (f.type == SemanticType::RecordList) {
            if (!it->is_array()) {
                add_violation(rep, ViolationKind::TypeError, f.name, expected_text(f.type));
            } else {
                // failed elements stay as null entries so collection-size sees the real count
                RecordList list;
                list.reserve(it->size());
                for (size_t i = 0; i < it->size(); ++i) {
                    list.push_back(validate_embedded(registry, f.record_kind, it->at(i), index_path(f.name, i), rep));
                }
                value = FieldValue(std::move(list));
            }
        } else {
            value = coerce_value(f.type, *it);
            if (!value) add_violation(rep, ViolationKind::TypeError, f.name, expected_text(f.type));
        }

        if (!value) continue;

        for (const auto& c : f.constraints) {
            if (auto v = check_constraint(c, *value, f.name)) rep.violations.push_back(std::move(*v));
        }

        out.set(f.name, std::move(*value));
    }

    if (!rep.violations.empty()) return Result<TypedFields>::fail(std::move(rep));
    return Result<TypedFields>::ok(std::move(out));
}

}  // namespace spacecheck
