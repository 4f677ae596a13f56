#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace site {

struct ManifestEntry {
    std::string id;         // "@I1@"; empty for index pages
    std::string kind;       // "profile" | "family" | "index"
    std::string path;       // relative to outdir, '/' separated
    std::string stem;
    std::string title;
    std::string biography;  // "id" | "slug" | "" (none)
};

// <outdir>/manifest.json. Holds no timestamps so reruns reproduce it exactly.
struct SiteManifest {
    std::string source;
    std::vector<ManifestEntry> documents;
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
    std::string dump() const;

    static SiteManifest from_json(const nlohmann::json& j);
    static SiteManifest load_from(const std::filesystem::path& path);
};

extern const char* const kManifestFileName;

}  // namespace site
