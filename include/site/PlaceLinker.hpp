#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace site {

// Renders place names, optionally as Wikipedia links. The map file is a JSON
// object of place -> article name; unmapped places link to the place name
// with spaces turned into underscores.
class PlaceLinker {
public:
    PlaceLinker() = default;  // plain text

    static PlaceLinker load_from_json(const std::filesystem::path& path);
    static PlaceLinker from_map(std::map<std::string, std::string> articles);

    bool enabled() const { return m_enabled; }
    std::string render(const std::string& place) const;

private:
    bool m_enabled = false;
    std::map<std::string, std::string> m_articles;
};

}  // namespace site
