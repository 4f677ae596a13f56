#pragma once

#include <string>

#include "graph/Graph.hpp"
#include "site/BiographyStore.hpp"
#include "site/PlaceLinker.hpp"

namespace site {

struct RenderOptions {
    bool mermaid = true;        // family diagram on profiles
    bool family_pages = false;  // link profiles to Families/<stem>.md
    const PlaceLinker* places = nullptr;
};

extern const char* const kNoBiographyPlaceholder;

// "[[I12|Anna Schmidt]]"
std::string person_link(const graph::Individual& ind);
std::string family_title(const graph::Graph& g, const graph::Family& fam);

// Markdown with YAML frontmatter. Output depends only on the arguments.
std::string render_profile(const graph::Graph& g,
                           const graph::Individual& ind,
                           const BiographyRecord* bio,
                           const RenderOptions& opts);

std::string render_family(const graph::Graph& g, const graph::Family& fam, const RenderOptions& opts);

}  // namespace site
