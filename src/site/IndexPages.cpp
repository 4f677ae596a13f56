#include "site/IndexPages.hpp"

#include "site/Naming.hpp"
#include "site/ProfileRenderer.hpp"

#include <algorithm>
#include <vector>

namespace site {

static std::vector<const graph::Individual*> sorted_people(const graph::Graph& g) {
    std::vector<const graph::Individual*> people;
    people.reserve(g.individuals().size());
    for (const auto& ind : g.individuals()) people.push_back(&ind);

    std::sort(people.begin(), people.end(), [](const graph::Individual* a, const graph::Individual* b) {
        const std::string na = a->display_name();
        const std::string nb = b->display_name();
        if (na != nb) return na < nb;
        return document_stem(a->id) < document_stem(b->id);
    });
    return people;
}

std::string render_people_index(const graph::Graph& g) {
    std::string out;
    out += "---\n";
    out += "title: \"All People\"\n";
    out += "type: index\n";
    out += "---\n\n";
    out += "# All People\n\n";

    for (const auto* p : sorted_people(g)) out += "- " + person_link(*p) + "\n";
    return out;
}

std::string render_biographies_index(const graph::Graph& g, const std::set<std::string>& ids_with_bio) {
    std::string out;
    out += "---\n";
    out += "title: \"Profiles with Biographies\"\n";
    out += "type: index\n";
    out += "---\n\n";
    out += "# Profiles with Biographies\n\n";
    out += "This page lists all family members who have biographical information.\n\n";

    bool any = false;
    for (const auto* p : sorted_people(g)) {
        if (ids_with_bio.count(p->id) == 0) continue;
        out += "- " + person_link(*p) + "\n";
        any = true;
    }
    if (!any) out += "_No biographical information available yet._\n";
    return out;
}

}  // namespace site
