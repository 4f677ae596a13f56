#pragma once

#include <set>
#include <string>

#include "graph/Graph.hpp"

namespace site {

// index.md: every profile, sorted by display name then stem
std::string render_people_index(const graph::Graph& g);

// biographies.md: profiles that received a biography
std::string render_biographies_index(const graph::Graph& g, const std::set<std::string>& ids_with_bio);

}  // namespace site
