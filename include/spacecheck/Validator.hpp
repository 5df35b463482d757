#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "spacecheck/Result.hpp"
#include "spacecheck/SchemaRegistry.hpp"

namespace spacecheck {

// Field phase, then (only if it reported nothing) the rule phase.
// Throws UnknownRecordKind before touching the input when `kind` is not registered.
ValidationResult validate(const SchemaRegistry& registry, const std::string& kind, const nlohmann::json& raw);

class Validator {
public:
    explicit Validator(const SchemaRegistry& registry) : m_registry(registry) {}

    ValidationResult validate(const std::string& kind, const nlohmann::json& raw) const;

private:
    const SchemaRegistry& m_registry;
};

}  // namespace spacecheck
