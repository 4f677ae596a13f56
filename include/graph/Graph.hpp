#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "graph/Models.hpp"

namespace graph {

// Resolved genealogy graph. Built once by build_graph() and read-only after.
class Graph {
public:
    Graph() = default;
    Graph(std::vector<Individual> individuals, std::vector<Family> families);

    const std::vector<Individual>& individuals() const { return m_individuals; }
    const std::vector<Family>& families() const { return m_families; }

    const Individual* find_individual(const std::string& id) const;
    const Family* find_family(const std::string& id) const;

private:
    std::vector<Individual> m_individuals;  // source order
    std::vector<Family> m_families;
    std::unordered_map<std::string, size_t> m_individual_index;
    std::unordered_map<std::string, size_t> m_family_index;
};

}  // namespace graph
