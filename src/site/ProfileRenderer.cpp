#include "site/ProfileRenderer.hpp"

#include "graph/Relationships.hpp"
#include "site/Naming.hpp"

#include <set>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

namespace site {

const char* const kNoBiographyPlaceholder = "_No biography available._";

static const char* kDash = "\xE2\x80\x94";

// JSON strings are valid YAML double-quoted scalars
static std::string yaml_str(const std::string& s) {
    return nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// GEDCOM free text in the body stays plain text: brackets are escaped so it
// never forms a link, and a line that would open a code fence or look like a
// region marker gets a leading backslash.
static std::string body_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find('\n', start);
        if (end == std::string::npos) end = s.size();
        const std::string line = s.substr(start, end - start);

        const size_t first = line.find_first_not_of(' ');
        const bool opener = first != std::string::npos &&
                            (line.compare(first, 3, "```") == 0 || line.compare(first, 3, "~~~") == 0 ||
                             line.compare(first, 4, "<!--") == 0);
        for (size_t i = 0; i < line.size(); ++i) {
            if (opener && i == first) out += '\\';
            if (line[i] == '[' || line[i] == ']') out += '\\';
            out += line[i];
        }

        if (end == s.size()) break;
        out += '\n';
        start = end + 1;
    }
    return out;
}

// A biography is Markdown and keeps its links, but a fence left open would
// run over the rest of the profile.
static std::string close_open_fence(const std::string& text) {
    std::string open;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const size_t first = line.find_first_not_of(' ');
        if (first == std::string::npos || first > 3) continue;
        const std::string marker = line.substr(first, 3);
        if (marker != "```" && marker != "~~~") continue;
        if (open.empty()) open = marker;
        else if (marker == open) open.clear();
    }
    return open.empty() ? text : text + "\n" + open;
}

static std::string link_label(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '|') out += '/';
        else if (c == '[') out += '(';
        else if (c == ']') out += ')';
        else if (c == '\n') out += ' ';
        else out += c;
    }
    return out;
}

std::string person_link(const graph::Individual& ind) {
    return "[[" + document_stem(ind.id) + "|" + link_label(ind.display_name()) + "]]";
}

std::string family_title(const graph::Graph& g, const graph::Family& fam) {
    std::vector<std::string> names;
    for (const auto& sid : fam.spouse_ids) {
        if (const graph::Individual* s = g.find_individual(sid)) names.push_back(s->display_name());
    }
    if (names.empty()) return "Family " + document_stem(fam.id);
    if (names.size() == 1) return "Family of " + names[0];
    return "Family of " + names[0] + " & " + names[1];
}

static std::string family_link(const graph::Graph& g, const graph::Family& fam) {
    return "[[" + document_stem(fam.id) + "|" + link_label(family_title(g, fam)) + "]]";
}

static std::string place_text(const std::string& place, const RenderOptions& opts) {
    return opts.places ? opts.places->render(place) : body_text(place);
}

static std::string event_text(const graph::Event* e, const RenderOptions& opts) {
    if (!e) return kDash;
    std::string out = e->date ? body_text(e->date->original) : std::string(kDash);
    if (e->place) out += " at " + place_text(*e->place, opts);
    return out;
}

static void frontmatter_event(std::string& out, const std::string& prefix, const graph::Event* e) {
    if (!e) return;
    if (e->date) {
        out += prefix + "_date: " + yaml_str(e->date->original) + "\n";
        const std::string iso = e->date->iso();
        if (!iso.empty()) out += prefix + "_date_iso: " + yaml_str(iso) + "\n";
        out += prefix + "_fidelity: " + graph::fidelity_str(e->date->fidelity) + "\n";
    }
    if (e->place) out += prefix + "_place: " + yaml_str(*e->place) + "\n";
}

static void link_section(std::string& out, const char* title, const std::vector<const graph::Individual*>& people) {
    out += "## ";
    out += title;
    out += "\n\n";
    if (people.empty()) {
        out += std::string(kDash) + "\n\n";
        return;
    }
    for (const auto* p : people) out += "- " + person_link(*p) + "\n";
    out += "\n";
}

static std::string mermaid_label(const std::string& s) {
    std::string out;
    for (char c : s) out += (c == '"') ? '\'' : c;
    return out;
}

static std::string mermaid_diagram(const graph::Graph& g, const graph::Individual& ind) {
    std::vector<std::string> lines = {
        "```mermaid",
        "flowchart TD",
        "classDef person fill:#e1f5fe,stroke:#0277bd,stroke-width:2px;",
        "classDef internal-link fill:#e1f5fe,stroke:#0277bd,stroke-width:2px;",
    };
    std::set<std::string> declared;

    auto person_node = [&](const graph::Individual& p) {
        const std::string id = "p_" + document_stem(p.id);
        if (declared.insert(id).second) {
            lines.push_back(id + "[\"" + mermaid_label(p.display_name()) + "\"]");
            lines.push_back("class " + id + " internal-link");
        }
        return id;
    };
    auto union_node = [&](const graph::Family& f) {
        const std::string id = "m_" + document_stem(f.id);
        if (declared.insert(id).second) lines.push_back(id + "((\" \"))");
        return id;
    };

    const std::string self = person_node(ind);

    for (const auto& fid : ind.families_as_child) {
        const graph::Family* fam = g.find_family(fid);
        if (!fam) continue;

        std::vector<std::string> parents;
        for (const auto& sid : fam->spouse_ids) {
            if (const graph::Individual* p = g.find_individual(sid)) parents.push_back(person_node(*p));
        }
        if (parents.size() == 2) {
            const std::string m = union_node(*fam);
            lines.push_back(parents[0] + " --- " + m);
            lines.push_back(parents[1] + " --- " + m);
            lines.push_back(m + " --> " + self);
        } else if (parents.size() == 1) {
            lines.push_back(parents[0] + " --> " + self);
        }
    }

    for (const auto& fid : ind.families_as_spouse) {
        const graph::Family* fam = g.find_family(fid);
        if (!fam) continue;

        const graph::Individual* spouse = nullptr;
        for (const auto& sid : fam->spouse_ids) {
            if (sid != ind.id) spouse = g.find_individual(sid);
        }

        std::string from = self;
        if (spouse) {
            const std::string s = person_node(*spouse);
            from = union_node(*fam);
            lines.push_back(self + " --- " + from);
            lines.push_back(s + " --- " + from);
        }
        for (const auto& cid : fam->child_ids) {
            if (cid == ind.id) continue;
            if (const graph::Individual* c = g.find_individual(cid)) lines.push_back(from + " --> " + person_node(*c));
        }
    }

    lines.push_back("```");

    std::string out;
    for (const auto& l : lines) out += l + "\n";
    return out;
}

std::string render_profile(const graph::Graph& g,
                           const graph::Individual& ind,
                           const BiographyRecord* bio,
                           const RenderOptions& opts) {
    const std::string name = ind.display_name();
    const graph::Event* birth = ind.first_event(graph::EventKind::Birth);
    const graph::Event* death = ind.first_event(graph::EventKind::Death);
    const graph::RelationshipView rel = graph::relationships_of(g, ind);

    std::string out;

    out += "---\n";
    out += "title: " + yaml_str(name) + "\n";
    out += "id: " + yaml_str(ind.id) + "\n";
    out += "type: profile\n";
    out += std::string("sex: ") + graph::sex_str(ind.sex) + "\n";
    frontmatter_event(out, "birth", birth);
    frontmatter_event(out, "death", death);
    if (ind.names.size() > 1) {
        nlohmann::json other = nlohmann::json::array();
        for (size_t i = 1; i < ind.names.size(); ++i) other.push_back(ind.names[i].display());
        out += "other_names: " + other.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    }
    out += "tags: [profile]\n";
    out += "---\n\n";

    out += "# " + body_text(name) + "\n\n";
    out += "- **Birth**: " + event_text(birth, opts) + "\n";
    out += "- **Death**: " + event_text(death, opts) + "\n";

    std::string occupation;
    for (const auto& o : ind.occupations) {
        if (!occupation.empty()) occupation += ", ";
        occupation += body_text(o);
    }
    out += "- **Occupation**: " + (occupation.empty() ? std::string(kDash) : occupation) + "\n\n";

    if (opts.mermaid) out += mermaid_diagram(g, ind) + "\n";

    link_section(out, "Parents", rel.parents);
    link_section(out, "Spouses", rel.spouses);
    link_section(out, "Children", rel.children);
    link_section(out, "Siblings", rel.siblings);

    if (opts.family_pages && (!ind.families_as_child.empty() || !ind.families_as_spouse.empty())) {
        out += "## Families\n\n";
        for (const auto& fid : ind.families_as_child) {
            if (const graph::Family* f = g.find_family(fid)) out += "- " + family_link(g, *f) + " (child)\n";
        }
        for (const auto& fid : ind.families_as_spouse) {
            if (const graph::Family* f = g.find_family(fid)) out += "- " + family_link(g, *f) + " (spouse)\n";
        }
        out += "\n";
    }

    // everything not already shown as the primary birth/death
    std::string events;
    for (const auto& e : ind.events) {
        if (&e == birth || &e == death) continue;
        events += std::string("- **") + graph::event_label(e) + "**: " + event_text(&e, opts) + "\n";
    }
    if (!events.empty()) out += "## Events\n\n" + events + "\n";

    out += "## Notes\n\n";
    if (ind.notes.empty()) {
        out += std::string(kDash) + "\n\n";
    } else {
        for (const auto& n : ind.notes) out += body_text(n) + "\n\n";
    }

    out += "## Biography\n\n";
    out += "<!-- biography:start -->\n";
    out += (bio ? close_open_fence(bio->text) : std::string(kNoBiographyPlaceholder)) + "\n";
    out += "<!-- biography:end -->\n\n";

    out += "**GEDCOM ID**: " + ind.id + "\n";
    return out;
}

std::string render_family(const graph::Graph& g, const graph::Family& fam, const RenderOptions& opts) {
    const std::string title = family_title(g, fam);

    std::vector<const graph::Individual*> spouses;
    for (const auto& sid : fam.spouse_ids) {
        if (const graph::Individual* s = g.find_individual(sid)) spouses.push_back(s);
    }
    std::vector<const graph::Individual*> children;
    for (const auto& cid : fam.child_ids) {
        if (const graph::Individual* c = g.find_individual(cid)) children.push_back(c);
    }

    std::string out;
    out += "---\n";
    out += "title: " + yaml_str(title) + "\n";
    out += "id: " + yaml_str(fam.id) + "\n";
    out += "type: family\n";
    for (const auto& e : fam.events) {
        if (e.kind == graph::EventKind::Marriage) {
            frontmatter_event(out, "marriage", &e);
            break;
        }
    }
    out += "tags: [family]\n";
    out += "---\n\n";

    out += "# " + body_text(title) + "\n\n";
    link_section(out, "Spouses", spouses);
    link_section(out, "Children", children);

    out += "## Events\n\n";
    if (fam.events.empty()) out += std::string(kDash) + "\n";
    for (const auto& e : fam.events) {
        out += std::string("- **") + graph::event_label(e) + "**: " + event_text(&e, opts) + "\n";
    }
    out += "\n**GEDCOM ID**: " + fam.id + "\n";
    return out;
}

}  // namespace site
