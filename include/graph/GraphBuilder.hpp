#pragma once

#include <vector>

#include "gedcom/RecordTree.hpp"
#include "graph/Graph.hpp"

namespace graph {

// Two passes: collect every INDI/FAM root with its raw pointers, then resolve
// the pointers against the id map. Forward references are therefore fine.
//
// Throws gedcom::DanglingReferenceError for a pointer with no matching
// record and gedcom::StructuralError for duplicate ids or a family with more
// than two spouses. FAMC/FAMS and HUSB/WIFE/CHIL are reconciled so both
// directions agree in the result.
Graph build_graph(const std::vector<gedcom::RawRecord>& roots);

}  // namespace graph
