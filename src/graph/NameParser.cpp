#include "graph/NameParser.hpp"

#include <cctype>
#include <vector>

namespace graph {

static std::string collapse_ws(const std::string& s) {
    std::string out;
    bool pending_space = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

PersonName parse_name(const std::string& value) {
    PersonName n;
    n.raw = collapse_ws(value);

    std::vector<size_t> slashes;
    for (size_t i = 0; i < n.raw.size(); ++i) {
        if (n.raw[i] == '/') slashes.push_back(i);
    }

    if (slashes.empty()) {
        n.given = n.raw;
        n.structured = true;
        return n;
    }

    if (slashes.size() != 2) {
        n.structured = false;
        return n;
    }

    n.given = collapse_ws(n.raw.substr(0, slashes[0]));
    n.surname = collapse_ws(n.raw.substr(slashes[0] + 1, slashes[1] - slashes[0] - 1));
    n.suffix = collapse_ws(n.raw.substr(slashes[1] + 1));
    n.structured = true;
    return n;
}

}  // namespace graph
