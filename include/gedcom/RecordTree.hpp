#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gedcom/LineReader.hpp"

namespace gedcom {

struct RawRecord {
    int line = 0;
    int level = 0;
    std::string tag;
    std::optional<std::string> pointer;
    std::optional<std::string> value;    // CONT/CONC already folded in
    std::vector<RawRecord> children;

    // first child with the given tag, or nullptr
    const RawRecord* child(const std::string& child_tag) const;

    std::string value_or(const std::string& def) const { return value ? *value : def; }
};

enum class RecordKind {
    Individual,
    Family,
    Note,
    Other
};

RecordKind record_kind(const RawRecord& root);

// Consumes every token of the reader and returns the level-0 records.
// Throws StructuralError on a level jump of more than one.
std::vector<RawRecord> build_record_tree(LineReader& reader);

std::vector<RawRecord> parse_gedcom(const std::string& text);
std::vector<RawRecord> parse_gedcom_file(const std::filesystem::path& path);

}  // namespace gedcom
