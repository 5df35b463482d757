#include "io/JsonIO.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

ValidationRequest parseValidationRequest(const json& j) {
    require_object(j, "root");

    ValidationRequest req;
    req.kind = require_string(j, "kind", "root");

    const bool has_one = j.contains("record");
    const bool has_many = j.contains("records");

    if (has_one && has_many) {
        throw std::runtime_error("root must contain either record or records, not both");
    }
    if (!has_one && !has_many) {
        throw std::runtime_error("root missing required field: record or records");
    }

    if (has_one) {
        // the record itself may be malformed; that is the validator's job to report
        req.records.push_back(j.at("record"));
        return req;
    }

    const json& recs = j.at("records");
    require_array(recs, "root.records");
    req.batch = true;
    req.records.reserve(recs.size());
    for (size_t i = 0; i < recs.size(); ++i) {
        req.records.push_back(recs.at(i));
    }

    if (req.records.empty()) {
        throw std::runtime_error("root.records must contain at least one record");
    }

    return req;
}

ValidationRequest loadValidationRequest(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open request file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }

    return parseValidationRequest(j);
}
