#pragma once

#include <optional>

#include "nlohmann/json.hpp"
#include "spacecheck/Record.hpp"
#include "spacecheck/Result.hpp"
#include "spacecheck/Schema.hpp"

namespace spacecheck {

class SchemaRegistry;

// Coerces one raw scalar to its declared type. Empty when the value cannot be
// coerced, and always empty for NestedRecord / RecordList.
std::optional<FieldValue> coerce_value(SemanticType type, const nlohmann::json& raw);

// Field phase. Checks every field of `schema` against `raw` and collects every
// violation; embedded records go through the full pipeline recursively and
// their violations come back with the parent field (and index) prefixed.
Result<TypedFields> validate_fields(const SchemaRegistry& registry,
                                    const RecordSchema& schema,
                                    const nlohmann::json& raw);

}  // namespace spacecheck
