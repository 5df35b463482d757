#include "spacecheck/Validator.hpp"

#include "spacecheck/FieldValidator.hpp"
#include "spacecheck/RuleValidator.hpp"

#include <utility>

namespace spacecheck {

ValidationResult validate(const SchemaRegistry& registry, const std::string& kind, const nlohmann::json& raw) {
    const RecordSchema& schema = registry.lookup(kind);

    Result<TypedFields> fields = validate_fields(registry, schema, raw);
    if (!fields.is_ok()) return ValidationResult::fail(fields.error());

    return validate_rules(schema, std::move(fields).take());
}

ValidationResult Validator::validate(const std::string& kind, const nlohmann::json& raw) const {
    return spacecheck::validate(m_registry, kind, raw);
}

}  // namespace spacecheck
