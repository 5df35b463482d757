#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "spacecheck/Timestamp.hpp"

namespace spacecheck {

enum class SemanticType {
    String,
    Integer,
    Float,
    Boolean,
    Timestamp,
    EnumTag,
    NestedRecord,
    RecordList
};

const char* type_name(SemanticType type);

class ValidatedRecord;
class RecordSchema;
class SchemaRegistry;
template <typename T> class Result;

using RecordPtr = std::shared_ptr<const ValidatedRecord>;
using RecordList = std::vector<RecordPtr>;

// String and EnumTag both hold std::string
using FieldValue = std::variant<std::string, std::int64_t, double, bool, Timestamp, RecordPtr, RecordList>;

// Coerced values of one record, keyed by field name, in schema order. Absent
// optional fields have no entry. Only the field phase can create or fill one.
class TypedFields {
public:
    // kind of the schema these fields were checked against
    const std::string& record_kind() const { return m_kind; }

    bool has(const std::string& name) const;
    const FieldValue* find(const std::string& name) const;

    // throw std::out_of_range when absent, std::logic_error on a type mismatch
    const std::string& get_string(const std::string& name) const;
    std::int64_t get_int(const std::string& name) const;
    double get_float(const std::string& name) const;
    bool get_bool(const std::string& name) const;
    const Timestamp& get_timestamp(const std::string& name) const;
    const ValidatedRecord& get_record(const std::string& name) const;
    const RecordList& get_records(const std::string& name) const;

    const std::map<std::string, FieldValue>& values() const { return m_values; }
    const std::vector<std::string>& names() const { return m_names; }  // declaration order
    size_t size() const { return m_names.size(); }

private:
    explicit TypedFields(std::string kind) : m_kind(std::move(kind)) {}

    friend Result<TypedFields> validate_fields(const SchemaRegistry& registry,
                                               const RecordSchema& schema,
                                               const nlohmann::json& raw);

    void set(const std::string& name, FieldValue value);
    const FieldValue& at(const std::string& name) const;

    std::string m_kind;
    std::map<std::string, FieldValue> m_values;
    std::vector<std::string> m_names;
};

// Only the business rule phase can create one; there is no way to modify it afterwards.
class ValidatedRecord {
public:
    ValidatedRecord(const ValidatedRecord&) = default;
    ValidatedRecord(ValidatedRecord&&) = default;
    ValidatedRecord& operator=(const ValidatedRecord&) = delete;
    ValidatedRecord& operator=(ValidatedRecord&&) = delete;

    const std::string& kind() const { return m_kind; }
    const TypedFields& fields() const { return m_fields; }

    bool has(const std::string& name) const { return m_fields.has(name); }
    const std::string& get_string(const std::string& name) const { return m_fields.get_string(name); }
    std::int64_t get_int(const std::string& name) const { return m_fields.get_int(name); }
    double get_float(const std::string& name) const { return m_fields.get_float(name); }
    bool get_bool(const std::string& name) const { return m_fields.get_bool(name); }
    const Timestamp& get_timestamp(const std::string& name) const { return m_fields.get_timestamp(name); }
    const ValidatedRecord& get_record(const std::string& name) const { return m_fields.get_record(name); }
    const RecordList& get_records(const std::string& name) const { return m_fields.get_records(name); }

private:
    ValidatedRecord(std::string kind, TypedFields fields)
        : m_kind(std::move(kind)), m_fields(std::move(fields)) {}

    friend Result<ValidatedRecord> validate_rules(const RecordSchema& schema, TypedFields fields);

    std::string m_kind;
    TypedFields m_fields;
};

}  // namespace spacecheck
