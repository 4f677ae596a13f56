#pragma once

#include <string>

#include "graph/Models.hpp"

namespace graph {

// Never fails: text outside the recognized forms comes back Unparsed with
// the original text preserved.
NormalizedDate parse_gedcom_date(const std::string& text);

}  // namespace graph
