#include "spacecheck/SchemaRegistry.hpp"

#include "spacecheck/Violation.hpp"

#include <utility>

namespace spacecheck {

static bool is_numeric(SemanticType t) {
    return t == SemanticType::Integer || t == SemanticType::Float;
}

static bool is_textual(SemanticType t) {
    return t == SemanticType::String || t == SemanticType::EnumTag;
}

static void require_type(const RecordSchema& owner, const BusinessRule& r, const RecordSchema& where,
                         const std::string& field, bool ok_type, const char* expected) {
    const FieldDeclaration* f = where.find(field);
    if (!f) {
        throw SchemaError(owner.kind() + ": rule " + r.name + " references unknown field '" +
                          where.kind() + "." + field + "'");
    }
    if (!ok_type) {
        throw SchemaError(owner.kind() + ": rule " + r.name + " needs " + expected + " field '" +
                          where.kind() + "." + field + "', got " + type_name(f->type));
    }
}

void SchemaRegistry::check_embedded(const RecordSchema& schema) const {
    for (const auto& f : schema.fields()) {
        if (f.type != SemanticType::NestedRecord && f.type != SemanticType::RecordList) continue;
        if (!contains(f.record_kind)) {
            throw SchemaError(schema.kind() + "." + f.name + ": embedded kind '" + f.record_kind +
                              "' must be defined first");
        }
    }

    // field existence on this schema is checked by SchemaBuilder::build; here the
    // types, and the element fields of collection rules, are checked
    for (const auto& r : schema.rules()) {
        const FieldDeclaration* main = schema.find(r.field);
        if (!main) throw SchemaError(schema.kind() + ": rule " + r.name + " references unknown field '" + r.field + "'");

        switch (r.kind) {
            case RuleKind::RequiredPrefix:
                require_type(schema, r, schema, r.field, is_textual(main->type), "a string");
                break;

            case RuleKind::FlagRequiredForTag: {
                require_type(schema, r, schema, r.field, is_textual(main->type), "a string");
                const FieldDeclaration* s = schema.find(r.subject);
                require_type(schema, r, schema, r.subject, s && s->type == SemanticType::Boolean, "a boolean");
                break;
            }

            case RuleKind::MinimumForTag: {
                require_type(schema, r, schema, r.field, is_textual(main->type), "a string");
                const FieldDeclaration* s = schema.find(r.subject);
                require_type(schema, r, schema, r.subject, s && is_numeric(s->type), "a numeric");
                break;
            }

            case RuleKind::TextRequiredAbove: {
                require_type(schema, r, schema, r.field, is_numeric(main->type), "a numeric");
                const FieldDeclaration* s = schema.find(r.subject);
                require_type(schema, r, schema, r.subject, s && is_textual(s->type), "a string");
                break;
            }

            case RuleKind::AnyElementInTags:
            case RuleKind::ExperiencedShareAbove:
            case RuleKind::AllElementsFlag: {
                require_type(schema, r, schema, r.field, main->type == SemanticType::RecordList, "a record list");
                const RecordSchema& element = lookup(main->record_kind);
                const FieldDeclaration* s = element.find(r.subject);

                if (r.kind == RuleKind::AnyElementInTags) {
                    require_type(schema, r, element, r.subject, s && is_textual(s->type), "a string");
                } else if (r.kind == RuleKind::AllElementsFlag) {
                    require_type(schema, r, element, r.subject, s && s->type == SemanticType::Boolean, "a boolean");
                } else {
                    require_type(schema, r, element, r.subject, s && is_numeric(s->type), "a numeric");
                    const FieldDeclaration* t = schema.find(r.trigger);
                    require_type(schema, r, schema, r.trigger, t && is_numeric(t->type), "a numeric");
                }
                break;
            }
        }
    }
}

const RecordSchema& SchemaRegistry::define(RecordSchema schema) {
    if (contains(schema.kind())) {
        throw SchemaError("record kind already defined: " + schema.kind());
    }
    check_embedded(schema);

    const std::string kind = schema.kind();
    auto owned = std::make_unique<const RecordSchema>(std::move(schema));
    const RecordSchema& ref = *owned;
    m_schemas.emplace(kind, std::move(owned));
    m_order.push_back(kind);
    return ref;
}

const RecordSchema& SchemaRegistry::define(const SchemaBuilder& builder) {
    return define(builder.build());
}

const RecordSchema& SchemaRegistry::lookup(const std::string& kind) const {
    auto it = m_schemas.find(kind);
    if (it == m_schemas.end()) throw UnknownRecordKind(kind);
    return *it->second;
}

bool SchemaRegistry::contains(const std::string& kind) const {
    return m_schemas.find(kind) != m_schemas.end();
}

std::vector<std::string> SchemaRegistry::kinds() const {
    return m_order;
}

}  // namespace spacecheck
