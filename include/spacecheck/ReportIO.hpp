#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"
#include "spacecheck/Record.hpp"
#include "spacecheck/Result.hpp"
#include "spacecheck/Schema.hpp"
#include "spacecheck/Violation.hpp"

namespace spacecheck {

// Output keeps insertion order so records list their fields the way the schema declares them.
using OutputJson = nlohmann::ordered_json;

OutputJson violation_to_json(const Violation& v);

// {"kind", "pass": false, "errors": [{"path", "code", "message"}, ...]}, errors in report order
OutputJson report_to_json(const ErrorReport& rep);

// coerced field values in declaration order; timestamps in canonical ISO-8601, embedded records as objects
OutputJson record_to_json(const ValidatedRecord& rec);

// {"kind", "pass": true, "record": {...}} or the report_to_json shape
OutputJson result_to_json(const ValidationResult& result);

OutputJson schema_to_json(const RecordSchema& schema);

// creates parent directories; throws std::runtime_error when the file cannot be written
void write_json_file(const std::filesystem::path& path, const OutputJson& j);

}  // namespace spacecheck
