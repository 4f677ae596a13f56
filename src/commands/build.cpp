#include "commands/build.hpp"

#include "gedcom/RecordTree.hpp"
#include "graph/GraphBuilder.hpp"
#include "site/BiographyStore.hpp"
#include "site/Emitter.hpp"
#include "site/PlaceLinker.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
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

// flags followed by a value
static bool takes_value(const std::string& flag) {
    return flag == "--ged" || flag == "--outdir" || flag == "--bios" || flag == "--place_map" || flag == "--log";
}

// first argument after argv[0] that is neither a flag nor a flag's value
static std::string first_positional(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            if (takes_value(a)) ++i;
            continue;
        }
        return a;
    }
    return "";
}

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
};

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    fs::path p(out_path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    if (ec) return false;
    out.open(p, std::ios::out | std::ios::trunc);
    return static_cast<bool>(out);
}

static int build_usage() {
    std::cerr
        << "usage:\n"
        << "  gedsite build <file.ged> [--outdir <dir>] [--bios <dir>] [options]\n";
    return 1;
}

int cmd_build(int argc, char** argv) {
    // argv[0] is "build"; the GEDCOM path is --ged or the first positional argument
    std::string ged_path = get_arg(argc, argv, "--ged", "");
    if (ged_path.empty()) ged_path = first_positional(argc, argv);
    if (ged_path.empty()) {
        std::cerr << "error: missing GEDCOM file\n";
        return build_usage();
    }

    const bool verbose = has_flag(argc, argv, "--verbose");
    const std::string log_path = get_arg(argc, argv, "--log", "");

    std::ofstream log_out;
    if (!log_path.empty() && !open_out(log_out, log_path)) {
        std::cerr << "[warn] cannot open log file: " << log_path << "\n";
    }
    Printer pr{&std::cout, log_out.is_open() ? &log_out : nullptr};
    Printer err{&std::cerr, log_out.is_open() ? &log_out : nullptr};

    try {
        site::EmitConfig cfg;
        cfg.outdir = get_arg(argc, argv, "--outdir", cfg.outdir.string());
        cfg.source = ged_path;
        cfg.family_pages = has_flag(argc, argv, "--families");
        cfg.mermaid = !has_flag(argc, argv, "--no_mermaid");
        cfg.index_pages = !has_flag(argc, argv, "--no_index");
        cfg.prune = has_flag(argc, argv, "--prune");

        const std::string place_map = get_arg(argc, argv, "--place_map", "");
        if (!place_map.empty()) cfg.places = site::PlaceLinker::load_from_json(place_map);

        const fs::path bios_dir = get_arg(argc, argv, "--bios", (cfg.outdir / "bios").string());

        if (verbose) err << "[debug] loading GEDCOM file: " << ged_path << "\n";
        const auto roots = gedcom::parse_gedcom_file(ged_path);
        if (verbose) err << "[debug] " << roots.size() << " top-level records\n";

        const graph::Graph g = graph::build_graph(roots);

        if (verbose) {
            err << "[debug] biography directory: " << bios_dir.string()
                << (fs::is_directory(bios_dir) ? "" : " (not found, no biographies)") << "\n";
        }
        const site::BiographyStore bios = site::BiographyStore::load_from_dir(bios_dir, g);
        if (verbose) err << "[debug] " << bios.file_count() << " biography files\n";

        site::EmitResult result = site::render_site(g, bios, cfg);
        site::write_site(result, cfg);

        for (const auto& w : result.warnings) {
            err << "[warn] ";
            if (!w.individual_id.empty()) err << w.individual_id << ": ";
            err << w.message << "\n";
        }

        pr << "SOURCE: " << ged_path << "\n";
        pr << "INDIVIDUALS: " << g.individuals().size() << "\n";
        pr << "FAMILIES: " << g.families().size() << "\n";
        pr << "DOCUMENTS: " << result.documents.size() << "\n";
        pr << "WRITTEN: " << result.files_written << "\n";
        if (cfg.prune) pr << "PRUNED: " << result.files_pruned << "\n";
        pr << "BIOGRAPHIES: " << result.biographies_merged << "\n";
        pr << "WARNINGS: " << result.warnings.size() << "\n";
        pr << "OUTDIR: " << cfg.outdir.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        err << "build failed: " << e.what() << "\n";
        return 1;
    }
}
