#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "spacecheck/Schema.hpp"

namespace spacecheck {

// Owns every record schema. Populated once at startup; after that only the
// const members are used, so one registry can serve concurrent validations.
class SchemaRegistry {
public:
    // Registers and freezes a schema. Throws SchemaError if the kind already
    // exists, an embedded kind is not registered yet, or a rule names an element
    // field the embedded schema does not declare.
    const RecordSchema& define(RecordSchema schema);
    const RecordSchema& define(const SchemaBuilder& builder);

    // throws UnknownRecordKind
    const RecordSchema& lookup(const std::string& kind) const;

    bool contains(const std::string& kind) const;
    std::vector<std::string> kinds() const;  // in definition order
    size_t size() const { return m_order.size(); }

private:
    std::map<std::string, std::unique_ptr<const RecordSchema>> m_schemas;
    std::vector<std::string> m_order;

    void check_embedded(const RecordSchema& schema) const;
};

}  // namespace spacecheck
