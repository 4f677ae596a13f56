#pragma once

#include <vector>

#include "graph/Graph.hpp"

namespace graph {

// Derived on demand from family membership; never stored.
// Each list is duplicate-free, in first-seen order, and excludes the subject.
struct RelationshipView {
    std::vector<const Individual*> parents;
    std::vector<const Individual*> spouses;
    std::vector<const Individual*> children;
    std::vector<const Individual*> siblings;
};

RelationshipView relationships_of(const Graph& g, const Individual& ind);

std::vector<const Individual*> parents_of(const Graph& g, const Individual& ind);
std::vector<const Individual*> spouses_of(const Graph& g, const Individual& ind);
std::vector<const Individual*> children_of(const Graph& g, const Individual& ind);
std::vector<const Individual*> siblings_of(const Graph& g, const Individual& ind);

}  // namespace graph
