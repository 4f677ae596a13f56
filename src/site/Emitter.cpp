#include "site/Emitter.hpp"

#include "site/Errors.hpp"
#include "site/IndexPages.hpp"
#include "site/Naming.hpp"
#include "site/ProfileRenderer.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace site {

static const char* biography_str(BiographyMatch m) {
    switch (m) {
        case BiographyMatch::ById: return "id";
        case BiographyMatch::BySlug: return "slug";
        default: return "";
    }
}

static std::string stem_of(const fs::path& relpath) {
    return relpath.stem().string();
}

SiteManifest EmitResult::manifest(const std::string& source) const {
    SiteManifest m;
    m.source = source;
    for (const auto& d : documents) {
        ManifestEntry e;
        e.id = d.id;
        e.kind = d.kind;
        e.path = d.relpath.generic_string();
        e.stem = stem_of(d.relpath);
        e.title = d.title;
        if (d.biography) e.biography = biography_str(*d.biography);
        m.documents.push_back(std::move(e));
    }
    for (const auto& w : warnings) {
        m.warnings.push_back(w.individual_id.empty() ? w.message : w.individual_id + ": " + w.message);
    }
    return m;
}

EmitResult render_site(const graph::Graph& g, const BiographyStore& bios, const EmitConfig& cfg) {
    EmitResult result;

    RenderOptions opts;
    opts.mermaid = cfg.mermaid;
    opts.family_pages = cfg.family_pages;
    opts.places = cfg.places.enabled() ? &cfg.places : nullptr;

    std::set<std::string> ids_with_bio;

    for (const auto& ind : g.individuals()) {
        std::optional<BiographyRecord> bio;
        try {
            bio = bios.lookup(ind);
        } catch (const AmbiguousBiographyMatchError& e) {
            result.warnings.push_back({ind.id, e.what()});
        } catch (const BiographyReadError& e) {
            result.warnings.push_back({ind.id, e.what()});
        }

        RenderedDocument doc;
        doc.id = ind.id;
        doc.kind = "profile";
        doc.relpath = profile_relpath(ind.id);
        doc.title = ind.display_name();
        doc.content = render_profile(g, ind, bio ? &*bio : nullptr, opts);
        if (bio) {
            doc.biography = bio->match;
            ids_with_bio.insert(ind.id);
            ++result.biographies_merged;
        }
        result.documents.push_back(std::move(doc));
    }

    if (cfg.family_pages) {
        for (const auto& fam : g.families()) {
            RenderedDocument doc;
            doc.id = fam.id;
            doc.kind = "family";
            doc.relpath = family_relpath(fam.id);
            doc.title = family_title(g, fam);
            doc.content = render_family(g, fam, opts);
            result.documents.push_back(std::move(doc));
        }
    }

    if (cfg.index_pages) {
        RenderedDocument people;
        people.kind = "index";
        people.relpath = fs::path(std::string(kPeopleIndexStem) + ".md");
        people.title = "All People";
        people.content = render_people_index(g);
        result.documents.push_back(std::move(people));

        RenderedDocument bios_page;
        bios_page.kind = "index";
        bios_page.relpath = fs::path(std::string(kBiographiesIndexStem) + ".md");
        bios_page.title = "Profiles with Biographies";
        bios_page.content = render_biographies_index(g, ids_with_bio);
        result.documents.push_back(std::move(bios_page));
    }

    return result;
}

bool write_document(const fs::path& path, const std::string& content) {
    {
        std::ifstream existing(path, std::ios::binary);
        if (existing) {
            std::ostringstream ss;
            ss << existing.rdbuf();
            if (ss.str() == content) return false;
        }
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw WriteError("failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out) throw WriteError("failed to open output file: " + path.string());
    out << content;
    out.close();
    if (!out) throw WriteError("failed to write output file: " + path.string());
    return true;
}

// only relative paths that stay inside outdir
static bool safe_relpath(const fs::path& rel) {
    if (rel.empty() || rel.is_absolute() || rel.has_root_name()) return false;
    for (const auto& part : rel) {
        if (part == "..") return false;
    }
    return true;
}

static int prune_previous(const fs::path& outdir, const EmitResult& result, std::vector<EmitWarning>& warnings) {
    const fs::path manifest_path = outdir / kManifestFileName;
    std::error_code ec;
    if (!fs::exists(manifest_path, ec)) return 0;

    SiteManifest previous;
    try {
        previous = SiteManifest::load_from(manifest_path);
    } catch (const std::exception& e) {
        warnings.push_back({"", std::string("not pruning, previous manifest unreadable: ") + e.what()});
        return 0;
    }

    std::set<std::string> current;
    for (const auto& d : result.documents) current.insert(d.relpath.generic_string());

    int removed = 0;
    for (const auto& old : previous.documents) {
        if (current.count(old.path) > 0) continue;
        const fs::path rel(old.path);
        if (!safe_relpath(rel)) {
            warnings.push_back({old.id, "not pruning unsafe manifest path " + old.path});
            continue;
        }
        if (fs::remove(outdir / rel, ec)) ++removed;
        if (ec) warnings.push_back({old.id, "failed to prune " + old.path + ": " + ec.message()});
        ec.clear();
    }
    return removed;
}

void write_site(EmitResult& result, const EmitConfig& cfg) {
    if (cfg.prune) result.files_pruned = prune_previous(cfg.outdir, result, result.warnings);

    for (const auto& doc : result.documents) {
        if (write_document(cfg.outdir / doc.relpath, doc.content)) ++result.files_written;
    }

    write_document(cfg.outdir / kManifestFileName, result.manifest(cfg.source).dump());
}

EmitResult emit_site(const graph::Graph& g, const BiographyStore& bios, const EmitConfig& cfg) {
    EmitResult result = render_site(g, bios, cfg);
    write_site(result, cfg);
    return result;
}

}  // namespace site
