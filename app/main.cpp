#include "commands/build.hpp"
#include "commands/dump.hpp"
#include "commands/places.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  gedsite build <file.ged> [args]\n"
        << "  gedsite dump <file.ged>\n"
        << "  gedsite places <file.ged>\n"
        << "  gedsite validate [args]\n"
        << "  gedsite help\n";
    return 1;
}

static int print_build_help() {
    std::cerr
        << "usage:\n"
        << "  gedsite build <file.ged> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --outdir <dir>               default: site/content/profiles\n"
        << "  --bios <dir>                 default: <outdir>/bios (missing dir = no biographies)\n"
        << "  --place_map <path>           JSON object place -> Wikipedia article; enables place links\n"
        << "\n"
        << "documents:\n"
        << "  --families                   also write Families/<id>.md\n"
        << "  --no_mermaid                 omit the family diagram on profiles\n"
        << "  --no_index                   omit index.md and biographies.md\n"
        << "  --prune                      delete documents of the previous run that are gone now\n"
        << "\n"
        << "logging:\n"
        << "  --verbose                    debug lines on stderr\n"
        << "  --log <path>                 mirror console output to a file\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  gedsite validate [options]\n"
        << "\n"
        << "options:\n"
        << "  --outdir <dir>               default: site/content/profiles\n"
        << "  --out <path>                 write the report as JSON\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    if (cmd == "build"    && (argc >= 3 && std::string(argv[2]) == "--help")) return print_build_help();
    if (cmd == "validate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_validate_help();

    if (cmd == "build")    return cmd_build(argc - 1, argv + 1);
    if (cmd == "dump")     return cmd_dump(argc - 1, argv + 1);
    if (cmd == "places")   return cmd_places(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
