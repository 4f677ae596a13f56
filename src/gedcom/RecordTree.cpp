#include "gedcom/RecordTree.hpp"

#include "gedcom/Errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace gedcom {

const RawRecord* RawRecord::child(const std::string& child_tag) const {
    for (const auto& c : children) {
        if (c.tag == child_tag) return &c;
    }
    return nullptr;
}

RecordKind record_kind(const RawRecord& root) {
    if (root.tag == "INDI") return RecordKind::Individual;
    if (root.tag == "FAM") return RecordKind::Family;
    if (root.tag == "NOTE" && root.pointer) return RecordKind::Note;
    return RecordKind::Other;
}

static void fold_continuation(RawRecord& parent, const LineToken& tok) {
    std::string joined = parent.value_or("");
    if (tok.tag == "CONT") joined += "\n";
    if (tok.value) joined += *tok.value;
    parent.value = std::move(joined);
}

std::vector<RawRecord> build_record_tree(LineReader& reader) {
    std::vector<RawRecord> roots;

    // Open records, innermost last. Only the top's children vector is ever
    // appended to, so the pointers below it stay valid.
    std::vector<RawRecord*> open;

    LineToken tok;
    while (reader.next(tok)) {
        while (!open.empty() && open.back()->level >= tok.level) open.pop_back();

        const int expected = open.empty() ? 0 : open.back()->level + 1;
        if (tok.level != expected) {
            if (open.empty()) {
                throw StructuralError(tok.line, "level " + std::to_string(tok.level) + " record outside any level 0 record");
            }
            throw StructuralError(tok.line, "level " + std::to_string(tok.level) +
                                  " cannot follow level " + std::to_string(expected - 1));
        }

        if (!open.empty() && (tok.tag == "CONT" || tok.tag == "CONC")) {
            fold_continuation(*open.back(), tok);
            continue;
        }

        RawRecord rec;
        rec.line = tok.line;
        rec.level = tok.level;
        rec.tag = tok.tag;
        rec.pointer = tok.pointer;
        rec.value = tok.value;

        if (open.empty()) {
            roots.push_back(std::move(rec));
            open.push_back(&roots.back());
        } else {
            RawRecord* parent = open.back();
            parent->children.push_back(std::move(rec));
            open.push_back(&parent->children.back());
        }
    }

    return roots;
}

std::vector<RawRecord> parse_gedcom(const std::string& text) {
    LineReader reader(text);
    return build_record_tree(reader);
}

std::vector<RawRecord> parse_gedcom_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open GEDCOM file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_gedcom(ss.str());
}

}  // namespace gedcom
