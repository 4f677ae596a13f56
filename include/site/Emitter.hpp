#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "graph/Graph.hpp"
#include "site/BiographyStore.hpp"
#include "site/Manifest.hpp"
#include "site/PlaceLinker.hpp"

namespace site {

struct EmitConfig {
    std::filesystem::path outdir = "site/content/profiles";
    std::string source;              // recorded in the manifest only
    bool family_pages = false;
    bool mermaid = true;
    bool index_pages = true;
    bool prune = false;              // delete documents of the previous run that are gone now
    PlaceLinker places;
};

struct EmitWarning {
    std::string individual_id;
    std::string message;
};

struct RenderedDocument {
    std::string id;
    std::string kind;                         // "profile" | "family" | "index"
    std::filesystem::path relpath;            // relative to outdir
    std::string title;
    std::string content;
    std::optional<BiographyMatch> biography;
};

struct EmitResult {
    std::vector<RenderedDocument> documents;  // graph order, index pages last
    std::vector<EmitWarning> warnings;
    int biographies_merged = 0;
    int files_written = 0;                    // content differed or file was new
    int files_pruned = 0;

    SiteManifest manifest(const std::string& source) const;
};

// Renders every document in memory. Biography failures become warnings;
// nothing here throws for a single individual.
EmitResult render_site(const graph::Graph& g, const BiographyStore& bios, const EmitConfig& cfg);

// Writes the rendered documents and manifest.json. Files whose bytes are
// already identical are left alone. Throws WriteError.
void write_site(EmitResult& result, const EmitConfig& cfg);

EmitResult emit_site(const graph::Graph& g, const BiographyStore& bios, const EmitConfig& cfg);

// true when the file was created or changed
bool write_document(const std::filesystem::path& path, const std::string& content);

}  // namespace site
