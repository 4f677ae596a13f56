#include "commands/validate.hpp"

#include "site/LinkValidator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_validate(int argc, char** argv) {
    const std::string outdir = get_arg(argc, argv, "--outdir", "site/content/profiles");
    const std::string out_path = get_arg(argc, argv, "--out", "");

    try {
        const site::ValidationReport rep = site::validate_site(fs::path(outdir));
        if (!out_path.empty()) site::write_validation_report(fs::path(out_path), rep);

        if (!rep.pass) {
            std::cerr << "validation failed";
            if (!out_path.empty()) std::cerr << ": wrote " << out_path;
            std::cerr << "\n";
            for (const auto& e : rep.errors) {
                std::cerr << "- " << e.code << ": " << e.message;
                if (!e.document.empty()) std::cerr << " (document=" << e.document << ")";
                std::cerr << "\n";
            }
            return 1;
        }

        std::cout << "VALIDATION: pass\n";
        std::cout << "DOCUMENTS: " << rep.documents_checked << "\n";
        std::cout << "LINKS: " << rep.links_checked << "\n";
        if (!out_path.empty()) std::cout << "OUT_VALIDATE: " << out_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "validate failed: " << e.what() << "\n";
        return 1;
    }
}
