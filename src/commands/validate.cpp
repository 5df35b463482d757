#include "commands/validate.hpp"

#include "io/JsonIO.hpp"
#include "records/SpaceSchemas.hpp"
#include "spacecheck/ReportIO.hpp"
#include "spacecheck/Validator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  spacecheck validate --input <path> [--kind <kind>] [--outdir <dir>] [--out <path>] [--quiet]\n";
    return 2;
}

int cmd_validate(int argc, char** argv) {
    const std::string input_path = get_arg(argc, argv, "--input", "");
    const std::string kind_arg   = get_arg(argc, argv, "--kind", "");
    const std::string outdir     = get_arg(argc, argv, "--outdir", "out");
    const bool quiet             = has_flag(argc, argv, "--quiet");

    if (input_path.empty()) {
        std::cerr << "error: missing --input\n";
        return validate_usage();
    }

    const std::string out_path = get_arg(argc, argv, "--out", (fs::path(outdir) / "validation_report.json").string());

    ValidationRequest req;
    try {
        req = loadValidationRequest(input_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    const std::string kind = !kind_arg.empty() ? kind_arg : req.kind;
    const spacecheck::SchemaRegistry& registry = records::space_registry();

    if (!registry.contains(kind)) {
        std::cerr << "error: unknown record kind: " << kind << "\n";
        return 2;
    }

    const spacecheck::Validator validator(registry);

    spacecheck::OutputJson report;
    report["kind"] = kind;
    report["input"] = input_path;
    report["results"] = spacecheck::OutputJson::array();

    size_t rejected = 0;
    for (size_t i = 0; i < req.records.size(); ++i) {
        const spacecheck::ValidationResult result = validator.validate(kind, req.records[i]);
        report["results"].push_back(spacecheck::result_to_json(result));

        if (result.is_ok()) continue;
        ++rejected;

        if (quiet) continue;
        for (const auto& v : result.error().violations) {
            std::cerr << "- ";
            if (req.batch) std::cerr << "records[" << i << "] ";
            std::cerr << (v.path.empty() ? "(record)" : v.path) << ": "
                      << spacecheck::kind_name(v.kind) << ": " << v.message << "\n";
        }
    }
    report["pass"] = (rejected == 0);

    try {
        spacecheck::write_json_file(fs::path(out_path), report);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    if (rejected > 0) {
        std::cerr << "validation failed: " << rejected << " of " << req.records.size()
                  << " record(s) rejected; wrote " << out_path << "\n";
        return 1;
    }

    std::cout << "VALIDATION: pass (" << req.records.size() << " record(s))\n";
    std::cout << "OUT_REPORT: " << out_path << "\n";
    return 0;
}
