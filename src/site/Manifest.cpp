#include "site/Manifest.hpp"

#include <fstream>
#include <stdexcept>

namespace site {

const char* const kManifestFileName = "manifest.json";

nlohmann::json SiteManifest::to_json() const {
    nlohmann::json j;
    j["source"] = source;

    nlohmann::json docs = nlohmann::json::array();
    for (const auto& d : documents) {
        nlohmann::json dj;
        dj["id"] = d.id;
        dj["kind"] = d.kind;
        dj["path"] = d.path;
        dj["stem"] = d.stem;
        dj["title"] = d.title;
        if (d.biography.empty()) dj["biography"] = nullptr;
        else dj["biography"] = d.biography;
        docs.push_back(dj);
    }
    j["documents"] = docs;
    j["warnings"] = warnings;
    return j;
}

std::string SiteManifest::dump() const {
    return to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

SiteManifest SiteManifest::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("manifest must be an object");
    if (!j.contains("documents") || !j["documents"].is_array()) {
        throw std::runtime_error("manifest missing documents array");
    }

    SiteManifest m;
    m.source = j.value("source", "");

    for (const auto& dj : j["documents"]) {
        if (!dj.is_object()) throw std::runtime_error("manifest document must be an object");
        ManifestEntry e;
        e.id = dj.value("id", "");
        e.kind = dj.value("kind", "");
        e.path = dj.value("path", "");
        e.stem = dj.value("stem", "");
        e.title = dj.value("title", "");
        if (dj.contains("biography") && dj["biography"].is_string()) e.biography = dj["biography"].get<std::string>();
        if (e.path.empty() || e.stem.empty()) throw std::runtime_error("manifest document missing path or stem");
        m.documents.push_back(std::move(e));
    }

    if (j.contains("warnings") && j["warnings"].is_array()) {
        for (const auto& w : j["warnings"]) {
            if (w.is_string()) m.warnings.push_back(w.get<std::string>());
        }
    }
    return m;
}

SiteManifest SiteManifest::load_from(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open manifest: " + path.string());

    nlohmann::json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse manifest " + path.string() + ": " + e.what());
    }
    return from_json(j);
}

}  // namespace site
