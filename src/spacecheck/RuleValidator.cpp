#include "spacecheck/RuleValidator.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace spacecheck {

// Absent optional fields read as "no value": a condition on them never triggers,
// and a requirement on them is never met.

static const std::string* read_text(const TypedFields& f, const std::string& name) {
    const FieldValue* v = f.find(name);
    if (!v) return nullptr;
    return std::get_if<std::string>(v);
}

static bool read_number(const TypedFields& f, const std::string& name, double& out) {
    const FieldValue* v = f.find(name);
    if (!v) return false;
    if (const auto* i = std::get_if<std::int64_t>(v)) {
        out = static_cast<double>(*i);
        return true;
    }
    if (const auto* d = std::get_if<double>(v)) {
        out = *d;
        return true;
    }
    return false;
}

static bool read_flag(const TypedFields& f, const std::string& name) {
    const FieldValue* v = f.find(name);
    if (!v) return false;
    const auto* b = std::get_if<bool>(v);
    return b && *b;
}

static const RecordList* read_list(const TypedFields& f, const std::string& name) {
    const FieldValue* v = f.find(name);
    if (!v) return nullptr;
    return std::get_if<RecordList>(v);
}

static bool tag_equals(const TypedFields& f, const std::string& name, const std::string& tag) {
    const std::string* s = read_text(f, name);
    return s && *s == tag;
}

static bool rule_holds(const BusinessRule& r, const TypedFields& f) {
    switch (r.kind) {
        case RuleKind::RequiredPrefix: {
            const std::string* s = read_text(f, r.field);
            if (!s) return true;
            return s->compare(0, r.tag.size(), r.tag) == 0;
        }

        case RuleKind::FlagRequiredForTag:
            if (!tag_equals(f, r.field, r.tag)) return true;
            return read_flag(f, r.subject);

        case RuleKind::MinimumForTag: {
            if (!tag_equals(f, r.field, r.tag)) return true;
            double n = 0.0;
            return read_number(f, r.subject, n) && n >= r.minimum;
        }

        case RuleKind::TextRequiredAbove: {
            double v = 0.0;
            if (!read_number(f, r.field, v) || v <= r.threshold) return true;
            const std::string* s = read_text(f, r.subject);
            return s && !s->empty();
        }

        case RuleKind::AnyElementInTags: {
            const RecordList* list = read_list(f, r.field);
            if (!list) return false;
            return std::any_of(list->begin(), list->end(), [&](const RecordPtr& e) {
                if (!e) return false;
                const std::string* s = read_text(e->fields(), r.subject);
                return s && std::find(r.tags.begin(), r.tags.end(), *s) != r.tags.end();
            });
        }

        case RuleKind::ExperiencedShareAbove: {
            double trigger = 0.0;
            if (!read_number(f, r.trigger, trigger) || trigger <= r.threshold) return true;

            const RecordList* list = read_list(f, r.field);
            if (!list) return true;

            size_t experienced = 0;
            for (const auto& e : *list) {
                double years = 0.0;
                if (e && read_number(e->fields(), r.subject, years) && years >= r.minimum) ++experienced;
            }
            return static_cast<double>(experienced) >= static_cast<double>(list->size()) / 2.0;
        }

        case RuleKind::AllElementsFlag: {
            const RecordList* list = read_list(f, r.field);
            if (!list) return true;
            return std::all_of(list->begin(), list->end(), [&](const RecordPtr& e) {
                return e && read_flag(e->fields(), r.subject);
            });
        }
    }
    return false;
}

std::optional<Violation> evaluate_rule(const BusinessRule& rule, const TypedFields& fields) {
    if (rule_holds(rule, fields)) return std::nullopt;

    Violation v;
    v.path = rule.path;
    v.kind = ViolationKind::BusinessRuleError;
    v.message = rule.message;
    return v;
}

ValidationResult validate_rules(const RecordSchema& schema, TypedFields fields) {
    if (fields.record_kind() != schema.kind()) {
        throw std::logic_error("fields checked as " + fields.record_kind() +
                               " cannot pass the " + schema.kind() + " rules");
    }

    for (const auto& rule : schema.rules()) {
        if (auto v = evaluate_rule(rule, fields)) {
            ErrorReport rep;
            rep.record_kind = schema.kind();
            rep.violations.push_back(std::move(*v));
            return ValidationResult::fail(std::move(rep));
        }
    }
    return ValidationResult::ok(ValidatedRecord(schema.kind(), std::move(fields)));
}

}  // namespace spacecheck
