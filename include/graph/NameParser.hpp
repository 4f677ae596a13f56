#pragma once

#include <string>

#include "graph/Models.hpp"

namespace graph {

// "John /Smith/ Jr" -> given "John", surname "Smith", suffix "Jr".
// Unbalanced slashes fall back to the raw string as the only part.
PersonName parse_name(const std::string& value);

}  // namespace graph
