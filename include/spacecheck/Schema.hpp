#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spacecheck/Constraint.hpp"
#include "spacecheck/Record.hpp"

namespace spacecheck {

struct FieldDeclaration {
    std::string name;
    SemanticType type = SemanticType::String;
    bool optional = false;  // may be absent or null

    // used when the key is absent (or null on an optional field); not constraint-checked
    std::optional<nlohmann::json> default_value;

    // kind of the embedded records (NestedRecord / RecordList only)
    std::string record_kind;

    std::vector<Constraint> constraints;
};

enum class RuleKind {
    RequiredPrefix,         // field starts with tag
    FlagRequiredForTag,     // field == tag  =>  subject is true
    MinimumForTag,          // field == tag  =>  subject >= minimum
    TextRequiredAbove,      // field > threshold  =>  subject present and non-empty
    AnyElementInTags,       // some element of field has subject in tags
    ExperiencedShareAbove,  // trigger > threshold  =>  #(elements of field with subject >= minimum) >= size / 2
    AllElementsFlag         // every element of field has subject set
};

const char* rule_kind_name(RuleKind kind);

// A business rule is plain data; RuleValidator is the only thing that interprets it.
struct BusinessRule {
    RuleKind kind = RuleKind::RequiredPrefix;
    std::string name;
    std::string path;     // where the violation is reported

    std::string field;
    std::string subject;  // on the record, or on each element for collection rules
    std::string trigger;

    std::string tag;
    std::vector<std::string> tags;
    double threshold = 0.0;
    double minimum = 0.0;

    std::string message;
};

BusinessRule require_prefix(const std::string& name, const std::string& field,
                            const std::string& prefix, const std::string& message);
BusinessRule flag_required_for_tag(const std::string& name, const std::string& tag_field, const std::string& tag,
                                   const std::string& flag_field, const std::string& message);
BusinessRule minimum_for_tag(const std::string& name, const std::string& tag_field, const std::string& tag,
                             const std::string& count_field, double minimum, const std::string& message);
BusinessRule text_required_above(const std::string& name, const std::string& value_field, double threshold,
                                 const std::string& text_field, const std::string& message);
BusinessRule any_element_in_tags(const std::string& name, const std::string& list_field, const std::string& element_field,
                                 std::vector<std::string> tags, const std::string& message);
BusinessRule experienced_share_above(const std::string& name, const std::string& trigger_field, double threshold,
                                     const std::string& list_field, const std::string& element_field,
                                     double minimum, const std::string& message);
BusinessRule all_elements_flag(const std::string& name, const std::string& list_field, const std::string& element_field,
                               const std::string& message);

class RecordSchema {
public:
    const std::string& kind() const { return m_kind; }
    const std::vector<FieldDeclaration>& fields() const { return m_fields; }
    const std::vector<BusinessRule>& rules() const { return m_rules; }

    const FieldDeclaration* find(const std::string& name) const;

private:
    friend class SchemaBuilder;

    std::string m_kind;
    std::vector<FieldDeclaration> m_fields;
    std::vector<BusinessRule> m_rules;
};

// Declares one record kind field by field. constrain/optional/default_value
// apply to the most recently declared field.
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string kind);

    SchemaBuilder& field(const std::string& name, SemanticType type);
    SchemaBuilder& nested(const std::string& name, const std::string& record_kind);
    SchemaBuilder& collection(const std::string& name, const std::string& record_kind);

    SchemaBuilder& constrain(Constraint c);
    SchemaBuilder& optional();
    SchemaBuilder& default_value(nlohmann::json v);

    SchemaBuilder& rule(BusinessRule r);

    // throws SchemaError on duplicate field names, constraints that do not fit
    // the field type, defaults that do not coerce, or rules naming unknown fields
    RecordSchema build() const;

private:
    std::string m_kind;
    std::vector<FieldDeclaration> m_fields;
    std::vector<BusinessRule> m_rules;

    FieldDeclaration& last(const char* what);
};

}  // namespace spacecheck
