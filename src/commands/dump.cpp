#include "commands/dump.hpp"

#include "gedcom/RecordTree.hpp"
#include "graph/GraphBuilder.hpp"
#include "io/GraphJson.hpp"

#include <iostream>
#include <string>

int cmd_dump(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n  gedsite dump <file.ged>\n";
        return 1;
    }

    try {
        const graph::Graph g = graph::build_graph(gedcom::parse_gedcom_file(argv[1]));
        std::cout << graph_to_json(g).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load GEDCOM: " << e.what() << "\n";
        return 1;
    }
}
