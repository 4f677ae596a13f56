#include "site/LinkValidator.hpp"

#include "site/Manifest.hpp"

#include "nlohmann/json.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace site {

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& document = "") {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.document = document;
    rep.errors.push_back(std::move(e));
}

static void scan_line(const std::string& line, std::vector<std::string>& out) {
    size_t pos = 0;
    while ((pos = line.find("[[", pos)) != std::string::npos) {
        const size_t close = line.find("]]", pos + 2);
        if (close == std::string::npos) return;

        std::string target = line.substr(pos + 2, close - pos - 2);
        const size_t bar = target.find('|');
        if (bar != std::string::npos) target = target.substr(0, bar);
        const size_t hash = target.find('#');
        if (hash != std::string::npos) target = target.substr(0, hash);
        const size_t slash = target.rfind('/');
        if (slash != std::string::npos) target = target.substr(slash + 1);

        out.push_back(target);
        pos = close + 2;
    }
}

std::vector<std::string> extract_wikilinks(const std::string& markdown) {
    std::vector<std::string> out;
    std::istringstream in(markdown);
    std::string line;
    bool in_fence = false;
    bool in_bio = false;

    while (std::getline(in, line)) {
        if (!in_fence && line == "<!-- biography:start -->") {
            in_bio = true;
            continue;
        }
        if (line == "<!-- biography:end -->") {
            in_bio = false;
            continue;
        }
        if (in_bio) continue;
        if (line.rfind("```", 0) == 0) {
            in_fence = !in_fence;
            continue;
        }
        if (in_fence) continue;
        scan_line(line, out);
    }
    return out;
}

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

ValidationReport validate_site(const fs::path& outdir) {
    ValidationReport rep;

    const fs::path manifest_path = outdir / kManifestFileName;
    if (!fs::exists(manifest_path)) {
        add_error(rep, "missing_file", "manifest.json missing in outdir: " + manifest_path.string());
        return rep;
    }

    SiteManifest manifest;
    try {
        manifest = SiteManifest::load_from(manifest_path);
    } catch (const std::exception& e) {
        add_error(rep, "bad_manifest", e.what());
        return rep;
    }

    std::map<std::string, int> stem_count;
    for (const auto& d : manifest.documents) stem_count[d.stem] += 1;

    for (const auto& d : manifest.documents) {
        const fs::path doc_path = outdir / fs::path(d.path);
        if (!fs::exists(doc_path)) {
            add_error(rep, "missing_file", "document listed in manifest does not exist: " + d.path, d.path);
            continue;
        }

        std::string content;
        try {
            content = read_all(doc_path);
        } catch (const std::exception& e) {
            add_error(rep, "missing_file", e.what(), d.path);
            continue;
        }
        ++rep.documents_checked;

        for (const auto& target : extract_wikilinks(content)) {
            ++rep.links_checked;
            auto it = stem_count.find(target);
            if (it == stem_count.end()) {
                add_error(rep, "dangling_link", "link target '" + target + "' is not an emitted document", d.path);
            } else if (it->second > 1) {
                add_error(rep, "ambiguous_link", "link target '" + target + "' matches several documents", d.path);
            }
        }
    }

    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw std::runtime_error("failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }

    nlohmann::json j;
    j["pass"] = rep.pass;
    j["documents_checked"] = rep.documents_checked;
    j["links_checked"] = rep.links_checked;
    j["errors"] = nlohmann::json::array();

    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.document.empty()) ej["document"] = e.document;
        j["errors"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open validation report: " + path.string());
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace site
