#include "graph/Relationships.hpp"

#include "graph/GraphBuilder.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using graph::Graph;
using graph::Individual;

// Two generations: I1+I2 -> I3, I4; I3+I5 -> I6; I2 remarried to I7 -> I8
const char* kTreeGed =
    "0 @I1@ INDI\n1 NAME John /Smith/\n"
    "0 @I2@ INDI\n1 NAME Mary /Jones/\n"
    "0 @I3@ INDI\n1 NAME Peter /Smith/\n"
    "0 @I4@ INDI\n1 NAME Ruth /Smith/\n"
    "0 @I5@ INDI\n1 NAME Eve /Brown/\n"
    "0 @I6@ INDI\n1 NAME Tom /Smith/\n"
    "0 @I7@ INDI\n1 NAME Carl /White/\n"
    "0 @I8@ INDI\n1 NAME Lily /White/\n"
    "0 @F1@ FAM\n1 HUSB @I1@\n1 WIFE @I2@\n1 CHIL @I3@\n1 CHIL @I4@\n"
    "0 @F2@ FAM\n1 HUSB @I3@\n1 WIFE @I5@\n1 CHIL @I6@\n"
    "0 @F3@ FAM\n1 HUSB @I7@\n1 WIFE @I2@\n1 CHIL @I8@\n";

std::vector<std::string> Ids(const std::vector<const Individual*>& people) {
    std::vector<std::string> out;
    for (const auto* p : people) out.push_back(p->id);
    return out;
}

bool Contains(const std::vector<const Individual*>& people, const Individual* who) {
    return std::find(people.begin(), people.end(), who) != people.end();
}

void TestScenarioRelations() {
    const Graph g = graph::build_graph(gedcom::parse_gedcom(
        "0 @I1@ INDI\n0 @I2@ INDI\n0 @I3@ INDI\n"
        "0 @F1@ FAM\n1 HUSB @I1@\n1 WIFE @I2@\n1 CHIL @I3@\n"));

    const auto child = graph::relationships_of(g, *g.find_individual("@I3@"));
    assert(Ids(child.parents) == (std::vector<std::string>{"@I1@", "@I2@"}));
    assert(child.children.empty());
    assert(child.siblings.empty());

    const auto father = graph::relationships_of(g, *g.find_individual("@I1@"));
    assert(Ids(father.children) == (std::vector<std::string>{"@I3@"}));
    assert(Ids(father.spouses) == (std::vector<std::string>{"@I2@"}));
    assert(father.parents.empty());
}

void TestSiblingsSpousesAcrossFamilies() {
    const Graph g = graph::build_graph(gedcom::parse_gedcom(kTreeGed));

    const Individual* mary = g.find_individual("@I2@");
    assert(Ids(graph::spouses_of(g, *mary)) == (std::vector<std::string>{"@I1@", "@I7@"}));
    assert(Ids(graph::children_of(g, *mary)) == (std::vector<std::string>{"@I3@", "@I4@", "@I8@"}));

    const Individual* peter = g.find_individual("@I3@");
    assert(Ids(graph::siblings_of(g, *peter)) == (std::vector<std::string>{"@I4@"}));
    assert(Ids(graph::children_of(g, *peter)) == (std::vector<std::string>{"@I6@"}));

    // half-sibling only through the shared mother's other family, not derived
    const Individual* lily = g.find_individual("@I8@");
    assert(graph::siblings_of(g, *lily).empty());
}

void TestParentChildSymmetry() {
    const Graph g = graph::build_graph(gedcom::parse_gedcom(kTreeGed));

    for (const auto& a : g.individuals()) {
        for (const auto* b : graph::children_of(g, a)) {
            assert(Contains(graph::parents_of(g, *b), &a));
        }
        for (const auto* p : graph::parents_of(g, a)) {
            assert(Contains(graph::children_of(g, *p), &a));
        }
        for (const auto* s : graph::spouses_of(g, a)) {
            assert(Contains(graph::spouses_of(g, *s), &a));
        }
    }
}

void TestSelfReferencingFamilyTerminates() {
    // I1 is listed as both spouse and child of F1
    const Graph g = graph::build_graph(gedcom::parse_gedcom(
        "0 @I1@ INDI\n1 FAMS @F1@\n1 FAMC @F1@\n0 @I2@ INDI\n"
        "0 @F1@ FAM\n1 HUSB @I1@\n1 WIFE @I2@\n1 CHIL @I1@\n"));

    const Individual* i1 = g.find_individual("@I1@");
    const auto rel = graph::relationships_of(g, *i1);
    assert(!Contains(rel.parents, i1));
    assert(!Contains(rel.children, i1));
    assert(!Contains(rel.siblings, i1));
    assert(Ids(rel.parents) == (std::vector<std::string>{"@I2@"}));
}

}  // namespace

int main() {
    TestScenarioRelations();
    TestSiblingsSpousesAcrossFamilies();
    TestParentChildSymmetry();
    TestSelfReferencingFamilyTerminates();

    std::cout << "gedsite_unit_relationships: pass\n";
    return 0;
}
