#include "site/PlaceLinker.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace site {

PlaceLinker PlaceLinker::load_from_json(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open place map: " + path.string());

    nlohmann::json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse place map " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("place map must be a JSON object: " + path.string());

    std::map<std::string, std::string> articles;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            throw std::runtime_error("place map entry '" + it.key() + "' must be a string");
        }
        articles[it.key()] = it.value().get<std::string>();
    }
    return from_map(std::move(articles));
}

PlaceLinker PlaceLinker::from_map(std::map<std::string, std::string> articles) {
    PlaceLinker p;
    p.m_enabled = true;
    p.m_articles = std::move(articles);
    return p;
}

static std::string article_url(const std::string& article) {
    std::string out = "https://en.wikipedia.org/wiki/";
    for (char c : article) {
        if (c == ' ') out += '_';
        else if (c == '(') out += "%28";
        else if (c == ')') out += "%29";
        else if (c == '[') out += "%5B";
        else if (c == ']') out += "%5D";
        else out += c;
    }
    return out;
}

static std::string link_text(const std::string& place) {
    std::string out;
    for (char c : place) {
        if (c == '[' || c == ']') out += '\\';
        out += c;
    }
    return out;
}

std::string PlaceLinker::render(const std::string& place) const {
    if (!m_enabled || place.empty()) return place;

    auto it = m_articles.find(place);
    const std::string& article = (it != m_articles.end()) ? it->second : place;
    return "[" + link_text(place) + "](" + article_url(article) + ")";
}

}  // namespace site
