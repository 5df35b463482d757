#include "spacecheck/Record.hpp"

#include <stdexcept>
#include <utility>

namespace spacecheck {

const char* type_name(SemanticType type) {
    switch (type) {
        case SemanticType::String: return "string";
        case SemanticType::Integer: return "integer";
        case SemanticType::Float: return "float";
        case SemanticType::Boolean: return "boolean";
        case SemanticType::Timestamp: return "timestamp";
        case SemanticType::EnumTag: return "enum";
        case SemanticType::NestedRecord: return "record";
        case SemanticType::RecordList: return "record_list";
    }
    return "unknown";
}

template <typename T>
static const T& get_as(const FieldValue& v, const std::string& name, const char* what) {
    const T* p = std::get_if<T>(&v);
    if (!p) throw std::logic_error("field " + name + " is not " + what);
    return *p;
}

void TypedFields::set(const std::string& name, FieldValue value) {
    auto inserted = m_values.insert_or_assign(name, std::move(value));
    if (inserted.second) m_names.push_back(name);
}

bool TypedFields::has(const std::string& name) const {
    return m_values.find(name) != m_values.end();
}

const FieldValue* TypedFields::find(const std::string& name) const {
    auto it = m_values.find(name);
    if (it == m_values.end()) return nullptr;
    return &it->second;
}

const FieldValue& TypedFields::at(const std::string& name) const {
    auto it = m_values.find(name);
    if (it == m_values.end()) throw std::out_of_range("field not present: " + name);
    return it->second;
}

const std::string& TypedFields::get_string(const std::string& name) const {
    return get_as<std::string>(at(name), name, "a string");
}

std::int64_t TypedFields::get_int(const std::string& name) const {
    return get_as<std::int64_t>(at(name), name, "an integer");
}

double TypedFields::get_float(const std::string& name) const {
    return get_as<double>(at(name), name, "a float");
}

bool TypedFields::get_bool(const std::string& name) const {
    return get_as<bool>(at(name), name, "a boolean");
}

const Timestamp& TypedFields::get_timestamp(const std::string& name) const {
    return get_as<Timestamp>(at(name), name, "a timestamp");
}

const ValidatedRecord& TypedFields::get_record(const std::string& name) const {
    const RecordPtr& p = get_as<RecordPtr>(at(name), name, "a record");
    if (!p) throw std::logic_error("field " + name + " holds no record");
    return *p;
}

const RecordList& TypedFields::get_records(const std::string& name) const {
    return get_as<RecordList>(at(name), name, "a record list");
}

}  // namespace spacecheck
