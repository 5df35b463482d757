#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// A request file names one record kind and carries either a single raw
// record ("record") or several ("records").
struct ValidationRequest {
    std::string kind;
    std::vector<nlohmann::json> records;
    bool batch = false;
};

// throws std::runtime_error with the offending location ("root.records must be an array")
ValidationRequest parseValidationRequest(const nlohmann::json& j);

ValidationRequest loadValidationRequest(const std::string& path);
