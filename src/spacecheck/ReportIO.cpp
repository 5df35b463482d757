#include "spacecheck/ReportIO.hpp"

#include "spacecheck/FieldValidator.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace spacecheck {

OutputJson violation_to_json(const Violation& v) {
    return {
        {"path", v.path},
        {"code", kind_name(v.kind)},
        {"message", v.message}
    };
}

OutputJson report_to_json(const ErrorReport& rep) {
    OutputJson j;
    j["kind"] = rep.record_kind;
    j["pass"] = false;
    j["errors"] = OutputJson::array();
    for (const auto& v : rep.violations) j["errors"].push_back(violation_to_json(v));
    return j;
}

static OutputJson value_to_json(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* i = std::get_if<std::int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    if (const auto* t = std::get_if<Timestamp>(&value)) return t->to_iso();
    if (const auto* r = std::get_if<RecordPtr>(&value)) {
        if (!*r) return nullptr;
        return record_to_json(**r);
    }
    if (const auto* list = std::get_if<RecordList>(&value)) {
        OutputJson arr = OutputJson::array();
        for (const auto& e : *list) {
            if (e) arr.push_back(record_to_json(*e));
            else arr.push_back(nullptr);
        }
        return arr;
    }
    return nullptr;
}

OutputJson record_to_json(const ValidatedRecord& rec) {
    OutputJson j = OutputJson::object();
    for (const auto& name : rec.fields().names()) {
        j[name] = value_to_json(*rec.fields().find(name));
    }
    return j;
}

OutputJson result_to_json(const ValidationResult& result) {
    if (!result.is_ok()) return report_to_json(result.error());

    OutputJson j;
    j["kind"] = result.value().kind();
    j["pass"] = true;
    j["record"] = record_to_json(result.value());
    return j;
}

static OutputJson constraint_to_json(const Constraint& c) {
    OutputJson j;
    j["type"] = constraint_name(c.kind);
    switch (c.kind) {
        case ConstraintKind::NumericRange:
            j["min"] = c.min_value;
            j["max"] = c.max_value;
            break;
        case ConstraintKind::StringLength:
        case ConstraintKind::CollectionSize:
            j["min"] = c.min_count;
            j["max"] = c.max_count;
            break;
        case ConstraintKind::SetMembership:
            j["allowed"] = c.allowed;
            break;
    }
    return j;
}

static OutputJson rule_to_json(const BusinessRule& r) {
    OutputJson j;
    j["name"] = r.name;
    j["type"] = rule_kind_name(r.kind);
    j["path"] = r.path;
    j["field"] = r.field;
    if (!r.subject.empty()) j["subject"] = r.subject;
    if (!r.trigger.empty()) j["trigger"] = r.trigger;
    if (!r.tag.empty()) j["tag"] = r.tag;
    if (!r.tags.empty()) j["tags"] = r.tags;

    switch (r.kind) {
        case RuleKind::MinimumForTag:
            j["minimum"] = r.minimum;
            break;
        case RuleKind::TextRequiredAbove:
            j["threshold"] = r.threshold;
            break;
        case RuleKind::ExperiencedShareAbove:
            j["threshold"] = r.threshold;
            j["minimum"] = r.minimum;
            break;
        case RuleKind::RequiredPrefix:
        case RuleKind::FlagRequiredForTag:
        case RuleKind::AnyElementInTags:
        case RuleKind::AllElementsFlag:
            break;
    }

    j["message"] = r.message;
    return j;
}

OutputJson schema_to_json(const RecordSchema& schema) {
    OutputJson j;
    j["kind"] = schema.kind();

    OutputJson fields = OutputJson::array();
    for (const auto& f : schema.fields()) {
        OutputJson fj;
        fj["name"] = f.name;
        fj["type"] = type_name(f.type);
        fj["optional"] = f.optional;
        if (f.default_value) {
            auto dv = coerce_value(f.type, *f.default_value);
            if (dv) fj["default"] = value_to_json(*dv);
        }
        if (!f.record_kind.empty()) fj["record_kind"] = f.record_kind;

        OutputJson cs = OutputJson::array();
        for (const auto& c : f.constraints) cs.push_back(constraint_to_json(c));
        fj["constraints"] = cs;

        fields.push_back(fj);
    }
    j["fields"] = fields;

    OutputJson rules = OutputJson::array();
    for (const auto& r : schema.rules()) rules.push_back(rule_to_json(r));
    j["rules"] = rules;

    return j;
}

void write_json_file(const std::filesystem::path& path, const OutputJson& j) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());

    out << j.dump(2) << "\n";
}

}  // namespace spacecheck
