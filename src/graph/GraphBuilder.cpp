#include "graph/GraphBuilder.hpp"

#include "gedcom/Errors.hpp"
#include "graph/DateParser.hpp"
#include "graph/NameParser.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace graph {

using gedcom::DanglingReferenceError;
using gedcom::RawRecord;
using gedcom::RecordKind;
using gedcom::StructuralError;

namespace {

struct PendingLink {
    std::string pointer;
    std::string tag;
    int line = 0;
};

struct PendingNote {
    std::string text;   // inline text, or the pointer when is_ref
    bool is_ref = false;
    int line = 0;
};

struct PendingIndividual {
    Individual ind;
    int line = 0;
    std::vector<PendingLink> famc;
    std::vector<PendingLink> fams;
    std::vector<PendingNote> notes;
};

struct PendingFamily {
    Family fam;
    int line = 0;
    std::vector<PendingLink> spouses;
    std::vector<PendingLink> children;
};

}  // namespace

static std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

static bool is_pointer(const std::string& v) {
    return v.size() > 2 && v.front() == '@' && v.back() == '@';
}

static std::string fold_case(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

static bool add_unique(std::vector<std::string>& v, const std::string& s) {
    if (std::find(v.begin(), v.end(), s) != v.end()) return false;
    v.push_back(s);
    return true;
}

static bool is_individual_event(const std::string& tag) {
    static const std::unordered_set<std::string> tags = {
        "BIRT", "DEAT", "CHR", "BAPM", "BURI", "CREM", "ADOP",
        "RESI", "EMIG", "IMMI", "NATU", "GRAD", "RETI", "EVEN"
    };
    return tags.count(tag) > 0;
}

static bool is_family_event(const std::string& tag) {
    static const std::unordered_set<std::string> tags = {"MARR", "DIV", "ENGA", "MARB", "EVEN"};
    return tags.count(tag) > 0;
}

static EventKind event_kind(const std::string& tag) {
    if (tag == "BIRT") return EventKind::Birth;
    if (tag == "DEAT") return EventKind::Death;
    if (tag == "MARR") return EventKind::Marriage;
    return EventKind::Other;
}

static Event parse_event(const RawRecord& rec) {
    Event e;
    e.kind = event_kind(rec.tag);
    e.tag = rec.tag;

    if (const RawRecord* d = rec.child("DATE")) {
        const std::string text = trim_copy(d->value_or(""));
        if (!text.empty()) e.date = parse_gedcom_date(text);
    }
    if (const RawRecord* p = rec.child("PLAC")) {
        const std::string place = trim_copy(p->value_or(""));
        if (!place.empty()) e.place = place;
    }
    return e;
}

static PersonName parse_name_record(const RawRecord& rec) {
    const std::string value = trim_copy(rec.value_or(""));
    if (!value.empty()) return parse_name(value);

    // name given only through its pieces
    PersonName n;
    if (const RawRecord* g = rec.child("GIVN")) n.given = trim_copy(g->value_or(""));
    if (const RawRecord* s = rec.child("SURN")) n.surname = trim_copy(s->value_or(""));
    if (const RawRecord* x = rec.child("NSFX")) n.suffix = trim_copy(x->value_or(""));
    n.raw = n.given + (n.surname.empty() ? "" : " /" + n.surname + "/") + (n.suffix.empty() ? "" : " " + n.suffix);
    n.raw = trim_copy(n.raw);
    n.structured = true;
    return n;
}

static Sex parse_sex(const std::string& v) {
    const std::string t = trim_copy(v);
    if (t.empty()) return Sex::Unknown;
    const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(t[0])));
    if (c == 'M') return Sex::Male;
    if (c == 'F') return Sex::Female;
    return Sex::Unknown;
}

static PendingLink link_of(const RawRecord& rec) {
    PendingLink l;
    l.pointer = trim_copy(rec.value_or(""));
    l.tag = rec.tag;
    l.line = rec.line;
    return l;
}

static PendingIndividual collect_individual(const RawRecord& root) {
    PendingIndividual p;
    p.ind.id = *root.pointer;
    p.line = root.line;

    for (const auto& c : root.children) {
        if (c.tag == "NAME") {
            PersonName n = parse_name_record(c);
            if (!n.raw.empty()) p.ind.names.push_back(std::move(n));
        } else if (c.tag == "SEX") {
            p.ind.sex = parse_sex(c.value_or(""));
        } else if (c.tag == "FAMC") {
            p.famc.push_back(link_of(c));
        } else if (c.tag == "FAMS") {
            p.fams.push_back(link_of(c));
        } else if (c.tag == "OCCU") {
            const std::string occ = trim_copy(c.value_or(""));
            if (!occ.empty()) p.ind.occupations.push_back(occ);
        } else if (c.tag == "NOTE") {
            PendingNote n;
            n.text = trim_copy(c.value_or(""));
            n.is_ref = is_pointer(n.text);
            n.line = c.line;
            if (!n.text.empty()) p.notes.push_back(std::move(n));
        } else if (is_individual_event(c.tag)) {
            p.ind.events.push_back(parse_event(c));
        }
    }
    return p;
}

static PendingFamily collect_family(const RawRecord& root) {
    PendingFamily p;
    p.fam.id = *root.pointer;
    p.line = root.line;

    for (const auto& c : root.children) {
        if (c.tag == "HUSB" || c.tag == "WIFE") {
            p.spouses.push_back(link_of(c));
        } else if (c.tag == "CHIL") {
            p.children.push_back(link_of(c));
        } else if (is_family_event(c.tag)) {
            p.fam.events.push_back(parse_event(c));
        }
    }
    return p;
}

static DanglingReferenceError dangling(const PendingLink& l, const std::string& owner, const char* expected) {
    return DanglingReferenceError(
        l.pointer.empty() ? owner : l.pointer,
        "line " + std::to_string(l.line) + ": " + l.tag + " " +
        (l.pointer.empty() ? std::string("<empty>") : l.pointer) +
        " in " + owner + " does not name " + expected);
}

Graph build_graph(const std::vector<RawRecord>& roots) {
    std::vector<PendingIndividual> individuals;
    std::vector<PendingFamily> families;
    std::unordered_map<std::string, std::string> shared_notes;

    std::unordered_map<std::string, size_t> ind_index;
    std::unordered_map<std::string, size_t> fam_index;
    std::unordered_set<std::string> seen_ids;
    // documents are named after ids; ids equal up to case would share a file
    // on case-insensitive filesystems
    std::unordered_map<std::string, std::string> folded_ids;

    // pass 1: collect
    for (const auto& root : roots) {
        const RecordKind kind = record_kind(root);
        if (kind == RecordKind::Other) continue;

        if (!root.pointer) {
            throw StructuralError(root.line, root.tag + " record without a cross-reference id");
        }
        if (!seen_ids.insert(*root.pointer).second) {
            throw StructuralError(root.line, "duplicate record id " + *root.pointer);
        }
        if (kind == RecordKind::Individual || kind == RecordKind::Family) {
            auto folded = folded_ids.emplace(fold_case(*root.pointer), *root.pointer);
            if (!folded.second) {
                throw StructuralError(root.line, "record id " + *root.pointer +
                                      " differs from " + folded.first->second + " only in letter case");
            }
        }

        switch (kind) {
            case RecordKind::Individual:
                ind_index[*root.pointer] = individuals.size();
                individuals.push_back(collect_individual(root));
                break;
            case RecordKind::Family:
                fam_index[*root.pointer] = families.size();
                families.push_back(collect_family(root));
                break;
            case RecordKind::Note:
                shared_notes[*root.pointer] = trim_copy(root.value_or(""));
                break;
            default:
                break;
        }
    }

    // pass 2: resolve
    for (auto& p : individuals) {
        for (const auto& l : p.famc) {
            if (fam_index.find(l.pointer) == fam_index.end()) throw dangling(l, p.ind.id, "a family");
            add_unique(p.ind.families_as_child, l.pointer);
        }
        for (const auto& l : p.fams) {
            if (fam_index.find(l.pointer) == fam_index.end()) throw dangling(l, p.ind.id, "a family");
            add_unique(p.ind.families_as_spouse, l.pointer);
        }
        for (const auto& n : p.notes) {
            if (!n.is_ref) {
                p.ind.notes.push_back(n.text);
                continue;
            }
            auto it = shared_notes.find(n.text);
            if (it == shared_notes.end()) {
                throw DanglingReferenceError(n.text, "line " + std::to_string(n.line) + ": NOTE " + n.text +
                                             " in " + p.ind.id + " does not name a note record");
            }
            if (!it->second.empty()) p.ind.notes.push_back(it->second);
        }
    }

    for (auto& p : families) {
        for (const auto& l : p.spouses) {
            if (ind_index.find(l.pointer) == ind_index.end()) throw dangling(l, p.fam.id, "an individual");
            add_unique(p.fam.spouse_ids, l.pointer);
        }
        for (const auto& l : p.children) {
            if (ind_index.find(l.pointer) == ind_index.end()) throw dangling(l, p.fam.id, "an individual");
            add_unique(p.fam.child_ids, l.pointer);
        }
    }

    // make family membership agree in both directions
    for (const auto& p : families) {
        for (const auto& s : p.fam.spouse_ids) {
            add_unique(individuals[ind_index[s]].ind.families_as_spouse, p.fam.id);
        }
        for (const auto& c : p.fam.child_ids) {
            add_unique(individuals[ind_index[c]].ind.families_as_child, p.fam.id);
        }
    }
    for (const auto& p : individuals) {
        for (const auto& f : p.ind.families_as_child) {
            add_unique(families[fam_index[f]].fam.child_ids, p.ind.id);
        }
        for (const auto& f : p.ind.families_as_spouse) {
            add_unique(families[fam_index[f]].fam.spouse_ids, p.ind.id);
        }
    }

    for (const auto& p : families) {
        if (p.fam.spouse_ids.size() > 2) {
            throw StructuralError(p.line, "family " + p.fam.id + " has more than two spouses");
        }
    }

    std::vector<Individual> out_inds;
    out_inds.reserve(individuals.size());
    for (auto& p : individuals) out_inds.push_back(std::move(p.ind));

    std::vector<Family> out_fams;
    out_fams.reserve(families.size());
    for (auto& p : families) out_fams.push_back(std::move(p.fam));

    return Graph(std::move(out_inds), std::move(out_fams));
}

}  // namespace graph
