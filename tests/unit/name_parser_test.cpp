#include "graph/NameParser.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using graph::parse_name;
using graph::PersonName;

void TestSurnameDelimiters() {
    const PersonName n = parse_name("John  Paul /Smith/ Jr.");
    assert(n.structured);
    assert(n.given == "John Paul");
    assert(n.surname == "Smith");
    assert(n.suffix == "Jr.");
    assert(n.parts() == (std::vector<std::string>{"John Paul", "Smith", "Jr."}));
    assert(n.display() == "John Paul Smith Jr.");
}

void TestSurnameOnlyAndGivenOnly() {
    PersonName n = parse_name("/Cohen/");
    assert(n.structured);
    assert(n.given.empty());
    assert(n.parts() == (std::vector<std::string>{"Cohen"}));

    n = parse_name("Madonna");
    assert(n.structured);
    assert(n.display() == "Madonna");
}

void TestUnbalancedSlashesFallBackToRaw() {
    const PersonName n = parse_name("Anna /Maria/ /Schmidt");
    assert(!n.structured);
    assert(n.parts() == (std::vector<std::string>{"Anna /Maria/ /Schmidt"}));
    assert(n.display() == "Anna /Maria/ /Schmidt");
}

}  // namespace

int main() {
    TestSurnameDelimiters();
    TestSurnameOnlyAndGivenOnly();
    TestUnbalancedSlashesFallBackToRaw();

    std::cout << "gedsite_unit_name_parser: pass\n";
    return 0;
}
