#include "commands/schema.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  spacecheck validate [args]\n"
        << "  spacecheck schema [--kind <kind>] [--out <path>]\n"
        << "  spacecheck kinds\n"
        << "  spacecheck help\n";
    return 2;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  spacecheck validate --input <path> [options]\n"
        << "\n"
        << "input:\n"
        << "  --input <path>               (required) {\"kind\": ..., \"record\": {...}} or {\"kind\": ..., \"records\": [...]}\n"
        << "  --kind <str>                 override the kind named in the input file\n"
        << "\n"
        << "output:\n"
        << "  --outdir <dir>               default: out\n"
        << "  --out <path>                 default: <outdir>/validation_report.json\n"
        << "  --quiet                      do not list violations on stderr\n"
        << "\n"
        << "exit status: 0 all records valid, 1 some record rejected, 2 usage or input error\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "validate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_validate_help();

    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "schema")   return cmd_schema(argc - 1, argv + 1);
    if (cmd == "kinds")    return cmd_kinds(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
