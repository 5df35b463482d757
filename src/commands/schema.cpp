#include "commands/schema.hpp"

#include "records/SpaceSchemas.hpp"
#include "spacecheck/ReportIO.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_schema(int argc, char** argv) {
    const std::string kind = get_arg(argc, argv, "--kind", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");

    const spacecheck::SchemaRegistry& registry = records::space_registry();

    spacecheck::OutputJson j;
    try {
        if (!kind.empty()) {
            j = spacecheck::schema_to_json(registry.lookup(kind));
        } else {
            j = spacecheck::OutputJson::array();
            for (const auto& k : registry.kinds()) j.push_back(spacecheck::schema_to_json(registry.lookup(k)));
        }
    } catch (const spacecheck::UnknownRecordKind& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    if (out_path.empty()) {
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    try {
        spacecheck::write_json_file(out_path, j);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
    std::cout << "OUT_SCHEMA: " << out_path << "\n";
    return 0;
}

int cmd_kinds(int, char**) {
    for (const auto& k : records::space_registry().kinds()) std::cout << k << "\n";
    return 0;
}
