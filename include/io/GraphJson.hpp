#pragma once

#include "nlohmann/json.hpp"

#include "graph/Graph.hpp"

nlohmann::json graph_to_json(const graph::Graph& g);
