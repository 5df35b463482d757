#include "spacecheck/Schema.hpp"

#include "spacecheck/FieldValidator.hpp"
#include "spacecheck/Violation.hpp"

#include <unordered_set>
#include <utility>

namespace spacecheck {

const char* rule_kind_name(RuleKind kind) {
    switch (kind) {
        case RuleKind::RequiredPrefix: return "required_prefix";
        case RuleKind::FlagRequiredForTag: return "flag_required_for_tag";
        case RuleKind::MinimumForTag: return "minimum_for_tag";
        case RuleKind::TextRequiredAbove: return "text_required_above";
        case RuleKind::AnyElementInTags: return "any_element_in_tags";
        case RuleKind::ExperiencedShareAbove: return "experienced_share_above";
        case RuleKind::AllElementsFlag: return "all_elements_flag";
    }
    return "unknown";
}

BusinessRule require_prefix(const std::string& name, const std::string& field,
                            const std::string& prefix, const std::string& message) {
    BusinessRule r;
    r.kind = RuleKind::RequiredPrefix;
    r.name = name;
    r.path = field;
    r.field = field;
    r.tag = prefix;
    r.message = message;
    return r;
}

BusinessRule flag_required_for_tag(const std::string& name, const std::string& tag_field, const std::string& tag,
                                   const std::string& flag_field, const std::string& message) {
    BusinessRule r;
    r.kind = RuleKind::FlagRequiredForTag;
    r.name = name;
    r.path = flag_field;
    r.field = tag_field;
    r.subject = flag_field;
    r.tag = tag;
    r.message = message;
    return r;
}

BusinessRule minimum_for_tag(const std::string& name, const std::string& tag_field, const std::string& tag,
                             const std::string& count_field, double minimum, const std::string& message) {
    BusinessRule r;
    r.kind = RuleKind::MinimumForTag;
    r.name = name;
    r.path = count_field;
    r.field = tag_field;
    r.subject = count_field;
    r.tag = tag;
    r.minimum = minimum;
    r.message = message;
    return r;
}

BusinessRule text_required_above(const std::string& name, const std::string& value_field, double threshold,
                                 const std::string& text_field, const std::string& message) {
    BusinessRule r;
    r.kind = RuleKind::TextRequiredAbove;
    r.name = name;
    r.path = text_field;
    r.field = value_field;
    r.subject = text_field;
    r.threshold = threshold;
    r.message = message;
    return r;
}

BusinessRule any_element_in_tags(const std::string& name, const std::string& list_field, const std::string& element_field,
                                 std::vector<std::string> tags, const std::string& message) {
    BusinessRule r;
    r.kind = RuleKind::AnyElementInTags;
    r.name = name;
    r.path = list_field;
    r.field = list_field;
    r.subject = element_field;
    r.tags = std::move(tags);
    r.message = message;
    return r;
}

BusinessRule experienced_share_above(const std::string& name, const std::string& trigger_field, double threshold,
                                     const std::string& list_field, const std::string& element_field,
                                     double minimum, const std::string& message) {
    BusinessRule r;
    r.kind = RuleKind::ExperiencedShareAbove;
    r.name = name;
    r.path = list_field;
    r.field = list_field;
    r.subject = element_field;
    r.trigger = trigger_field;
    r.threshold = threshold;
    r.minimum = minimum;
    r.message = message;
    return r;
}

BusinessRule all_elements_flag(const std::string& name, const std::string& list_field, const std::string& element_field,
                               const std::string& message) {
    BusinessRule r;
    r.kind = RuleKind::AllElementsFlag;
    r.name = name;
    r.path = list_field;
    r.field = list_field;
    r.subject = element_field;
    r.message = message;
    return r;
}

const FieldDeclaration* RecordSchema::find(const std::string& name) const {
    for (const auto& f : m_fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

SchemaBuilder::SchemaBuilder(std::string kind) : m_kind(std::move(kind)) {}

FieldDeclaration& SchemaBuilder::last(const char* what) {
    if (m_fields.empty()) {
        throw SchemaError(m_kind + ": " + what + " called before any field was declared");
    }
    return m_fields.back();
}

SchemaBuilder& SchemaBuilder::field(const std::string& name, SemanticType type) {
    FieldDeclaration f;
    f.name = name;
    f.type = type;
    m_fields.push_back(std::move(f));
    return *this;
}

SchemaBuilder& SchemaBuilder::nested(const std::string& name, const std::string& record_kind) {
    field(name, SemanticType::NestedRecord);
    m_fields.back().record_kind = record_kind;
    return *this;
}

SchemaBuilder& SchemaBuilder::collection(const std::string& name, const std::string& record_kind) {
    field(name, SemanticType::RecordList);
    m_fields.back().record_kind = record_kind;
    return *this;
}

SchemaBuilder& SchemaBuilder::constrain(Constraint c) {
    last("constrain").constraints.push_back(std::move(c));
    return *this;
}

SchemaBuilder& SchemaBuilder::optional() {
    last("optional").optional = true;
    return *this;
}

SchemaBuilder& SchemaBuilder::default_value(nlohmann::json v) {
    last("default_value").default_value = std::move(v);
    return *this;
}

SchemaBuilder& SchemaBuilder::rule(BusinessRule r) {
    m_rules.push_back(std::move(r));
    return *this;
}

static void require_rule_field(const std::string& kind, const BusinessRule& r,
                               const std::unordered_set<std::string>& names, const std::string& field) {
    if (field.empty() || names.find(field) == names.end()) {
        throw SchemaError(kind + ": rule " + r.name + " references unknown field '" + field + "'");
    }
}

RecordSchema SchemaBuilder::build() const {
    if (m_kind.empty()) throw SchemaError("record kind must not be empty");

    std::unordered_set<std::string> names;
    for (const auto& f : m_fields) {
        const std::string where = m_kind + "." + f.name;

        if (f.name.empty()) throw SchemaError(m_kind + ": field name must not be empty");
        if (!names.insert(f.name).second) throw SchemaError(where + ": duplicate field name");

        const bool embeds = f.type == SemanticType::NestedRecord || f.type == SemanticType::RecordList;
        if (embeds && f.record_kind.empty()) throw SchemaError(where + ": embedded record kind missing");

        for (const auto& c : f.constraints) {
            if (!applies_to(c, f.type)) {
                throw SchemaError(where + ": " + constraint_name(c.kind) +
                                  " does not apply to " + type_name(f.type) + " fields");
            }
        }

        if (f.default_value) {
            if (embeds) throw SchemaError(where + ": embedded record fields cannot have defaults");
            if (!coerce_value(f.type, *f.default_value)) {
                throw SchemaError(where + ": default value is not a valid " + type_name(f.type));
            }
        }
    }

    std::unordered_set<std::string> rule_names;
    for (const auto& r : m_rules) {
        if (!rule_names.insert(r.name).second) throw SchemaError(m_kind + ": duplicate rule name " + r.name);

        require_rule_field(m_kind, r, names, r.field);
        switch (r.kind) {
            case RuleKind::RequiredPrefix:
                break;
            case RuleKind::FlagRequiredForTag:
            case RuleKind::MinimumForTag:
            case RuleKind::TextRequiredAbove:
                require_rule_field(m_kind, r, names, r.subject);
                break;
            case RuleKind::AnyElementInTags:
            case RuleKind::AllElementsFlag:
                break;
            case RuleKind::ExperiencedShareAbove:
                require_rule_field(m_kind, r, names, r.trigger);
                break;
        }
    }

    RecordSchema s;
    s.m_kind = m_kind;
    s.m_fields = m_fields;
    s.m_rules = m_rules;
    return s;
}

}  // namespace spacecheck
