#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "graph/Graph.hpp"

namespace site {

enum class BiographyMatch {
    ById,
    BySlug
};

struct BiographyRecord {
    std::string individual_id;
    std::string text;
    std::filesystem::path source;
    BiographyMatch match = BiographyMatch::ById;
};

// Index of the biography directory. Files are keyed by stem: either the
// document stem of an individual's id ("I12.md") or the slug of a display
// name ("anna-schmidt.md"). Read-only once loaded.
class BiographyStore {
public:
    // A missing or unset directory gives an empty store.
    static BiographyStore load_from_dir(const std::optional<std::filesystem::path>& dir, const graph::Graph& g);

    // An id-keyed file always wins; the slug is only consulted when no id-keyed
    // file exists. Throws AmbiguousBiographyMatchError when several slug files
    // or several individuals compete for the slug, and BiographyReadError when
    // the chosen file cannot be read as UTF-8 text. An empty file is no match.
    std::optional<BiographyRecord> lookup(const graph::Individual& ind) const;

    size_t file_count() const { return m_file_count; }

private:
    std::map<std::string, std::vector<std::filesystem::path>> m_files_by_key;  // precedence order
    std::map<std::string, int> m_slug_owners;                                  // slug -> individuals
    std::set<std::string> m_id_keys;
    size_t m_file_count = 0;
};

}  // namespace site
