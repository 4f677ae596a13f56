#include "site/BiographyStore.hpp"

#include "site/Errors.hpp"
#include "site/Naming.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace site {

static int extension_rank(const std::string& ext) {
    if (ext == ".md") return 0;
    if (ext == ".MD") return 1;
    if (ext == ".markdown") return 2;
    if (ext == ".txt") return 3;
    return -1;
}

static bool valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        size_t n = 0;
        if (c < 0x80) n = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) n = 1;
        else if ((c & 0xF0) == 0xE0) n = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) n = 3;
        else return false;

        if (i + n >= s.size()) return false;
        for (size_t k = 1; k <= n; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += n + 1;
    }
    return true;
}

static std::string read_biography(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw BiographyReadError("failed to open biography: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw BiographyReadError("failed to read biography: " + p.string());

    std::string text = ss.str();
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);
    if (!valid_utf8(text)) throw BiographyReadError("biography is not valid UTF-8: " + p.string());
    if (text.find('\0') != std::string::npos) throw BiographyReadError("biography contains NUL bytes: " + p.string());

    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());

    size_t a = 0;
    while (a < text.size() && std::isspace(static_cast<unsigned char>(text[a]))) ++a;
    size_t b = text.size();
    while (b > a && std::isspace(static_cast<unsigned char>(text[b - 1]))) --b;
    return text.substr(a, b - a);
}

BiographyStore BiographyStore::load_from_dir(const std::optional<fs::path>& dir, const graph::Graph& g) {
    BiographyStore s;

    for (const auto& ind : g.individuals()) {
        s.m_id_keys.insert(document_stem(ind.id));
        const std::string slug = name_slug(ind.display_name());
        if (!slug.empty()) s.m_slug_owners[slug] += 1;
    }

    if (!dir) return s;

    std::error_code ec;
    if (!fs::is_directory(*dir, ec)) return s;

    for (const auto& entry : fs::directory_iterator(*dir)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        if (extension_rank(p.extension().string()) < 0) continue;
        s.m_files_by_key[p.stem().string()].push_back(p);
        ++s.m_file_count;
    }

    for (auto& kv : s.m_files_by_key) {
        std::sort(kv.second.begin(), kv.second.end(), [](const fs::path& a, const fs::path& b) {
            const int ra = extension_rank(a.extension().string());
            const int rb = extension_rank(b.extension().string());
            if (ra != rb) return ra < rb;
            return a.filename().string() < b.filename().string();
        });
    }

    return s;
}

std::optional<BiographyRecord> BiographyStore::lookup(const graph::Individual& ind) const {
    auto by_id = m_files_by_key.find(document_stem(ind.id));
    if (by_id != m_files_by_key.end()) {
        BiographyRecord rec;
        rec.individual_id = ind.id;
        rec.source = by_id->second.front();
        rec.text = read_biography(rec.source);
        rec.match = BiographyMatch::ById;
        if (rec.text.empty()) return std::nullopt;
        return rec;
    }

    const std::string slug = name_slug(ind.display_name());
    if (slug.empty() || m_id_keys.count(slug) > 0) return std::nullopt;

    auto by_slug = m_files_by_key.find(slug);
    if (by_slug == m_files_by_key.end()) return std::nullopt;

    if (by_slug->second.size() > 1) {
        throw AmbiguousBiographyMatchError(ind.id, "several biography files match name slug '" + slug + "' for " + ind.id);
    }
    auto owners = m_slug_owners.find(slug);
    if (owners != m_slug_owners.end() && owners->second > 1) {
        throw AmbiguousBiographyMatchError(ind.id, "name slug '" + slug + "' is shared by " +
                                           std::to_string(owners->second) + " individuals");
    }

    BiographyRecord rec;
    rec.individual_id = ind.id;
    rec.source = by_slug->second.front();
    rec.text = read_biography(rec.source);
    rec.match = BiographyMatch::BySlug;
    if (rec.text.empty()) return std::nullopt;
    return rec;
}

}  // namespace site
