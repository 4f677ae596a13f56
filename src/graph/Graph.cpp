#include "graph/Graph.hpp"

#include <utility>

namespace graph {

Graph::Graph(std::vector<Individual> individuals, std::vector<Family> families)
    : m_individuals(std::move(individuals)), m_families(std::move(families)) {
    m_individual_index.reserve(m_individuals.size() * 2 + 8);
    for (size_t i = 0; i < m_individuals.size(); ++i) m_individual_index[m_individuals[i].id] = i;

    m_family_index.reserve(m_families.size() * 2 + 8);
    for (size_t i = 0; i < m_families.size(); ++i) m_family_index[m_families[i].id] = i;
}

const Individual* Graph::find_individual(const std::string& id) const {
    auto it = m_individual_index.find(id);
    if (it == m_individual_index.end()) return nullptr;
    return &m_individuals[it->second];
}

const Family* Graph::find_family(const std::string& id) const {
    auto it = m_family_index.find(id);
    if (it == m_family_index.end()) return nullptr;
    return &m_families[it->second];
}

}  // namespace graph
