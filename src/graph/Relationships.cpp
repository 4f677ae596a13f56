#include "graph/Relationships.hpp"

#include <algorithm>
#include <string>

namespace graph {

static void collect(const Graph& g,
                    const Individual& self,
                    const std::vector<std::string>& family_ids,
                    std::vector<std::string> Family::*members,
                    std::vector<const Individual*>& out) {
    for (const auto& fid : family_ids) {
        const Family* fam = g.find_family(fid);
        if (!fam) continue;
        for (const auto& id : fam->*members) {
            if (id == self.id) continue;
            const Individual* other = g.find_individual(id);
            if (!other) continue;
            if (std::find(out.begin(), out.end(), other) != out.end()) continue;
            out.push_back(other);
        }
    }
}

std::vector<const Individual*> parents_of(const Graph& g, const Individual& ind) {
    std::vector<const Individual*> out;
    collect(g, ind, ind.families_as_child, &Family::spouse_ids, out);
    return out;
}

std::vector<const Individual*> spouses_of(const Graph& g, const Individual& ind) {
    std::vector<const Individual*> out;
    collect(g, ind, ind.families_as_spouse, &Family::spouse_ids, out);
    return out;
}

std::vector<const Individual*> children_of(const Graph& g, const Individual& ind) {
    std::vector<const Individual*> out;
    collect(g, ind, ind.families_as_spouse, &Family::child_ids, out);
    return out;
}

std::vector<const Individual*> siblings_of(const Graph& g, const Individual& ind) {
    std::vector<const Individual*> out;
    collect(g, ind, ind.families_as_child, &Family::child_ids, out);
    return out;
}

RelationshipView relationships_of(const Graph& g, const Individual& ind) {
    RelationshipView v;
    v.parents = parents_of(g, ind);
    v.spouses = spouses_of(g, ind);
    v.children = children_of(g, ind);
    v.siblings = siblings_of(g, ind);
    return v;
}

}  // namespace graph
