#include "commands/places.hpp"

#include "gedcom/RecordTree.hpp"
#include "graph/GraphBuilder.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

static void count_places(const std::vector<graph::Event>& events, std::map<std::string, int>& counts) {
    for (const auto& e : events) {
        if (e.place) counts[*e.place] += 1;
    }
}

int cmd_places(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n  gedsite places <file.ged>\n";
        return 1;
    }

    graph::Graph g;
    try {
        g = graph::build_graph(gedcom::parse_gedcom_file(argv[1]));
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load GEDCOM: " << e.what() << "\n";
        return 1;
    }

    std::map<std::string, int> counts;
    for (const auto& ind : g.individuals()) count_places(ind.events, counts);
    for (const auto& fam : g.families()) count_places(fam.events, counts);

    std::vector<std::pair<std::string, int>> sorted(counts.begin(), counts.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    std::cout << "PLACES:\n";
    for (const auto& [place, count] : sorted) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%3dx ", count);
        std::cout << buf << place << "\n";
    }
    std::cout << "UNIQUE_PLACES: " << sorted.size() << "\n";
    return 0;
}
