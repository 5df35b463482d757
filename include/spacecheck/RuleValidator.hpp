#pragma once

#include <optional>

#include "spacecheck/Record.hpp"
#include "spacecheck/Result.hpp"
#include "spacecheck/Schema.hpp"

namespace spacecheck {

// Evaluates one rule against field-valid values. Empty when the rule holds.
std::optional<Violation> evaluate_rule(const BusinessRule& rule, const TypedFields& fields);

// Rule phase. Runs the schema's rules in declaration order and stops at the first
// failure (single-violation report). On success this is the only place a
// ValidatedRecord is created. Throws std::logic_error when `fields` came out of
// the field phase of a different record kind.
ValidationResult validate_rules(const RecordSchema& schema, TypedFields fields);

}  // namespace spacecheck
