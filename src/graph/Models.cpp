#include "graph/Models.hpp"

#include <cstdio>

namespace graph {

std::string CalendarDate::iso() const {
    if (year == 0) return "";
    char buf[32];
    if (month == 0) std::snprintf(buf, sizeof(buf), "%04d", year);
    else if (day == 0) std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    else std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string NormalizedDate::iso() const {
    switch (fidelity) {
        case DateFidelity::Unparsed: return "";
        case DateFidelity::Range: return start.iso() + ".." + end.iso();
        default: return start.iso();
    }
}

std::vector<std::string> PersonName::parts() const {
    if (!structured) {
        if (raw.empty()) return {};
        return {raw};
    }
    std::vector<std::string> out;
    if (!given.empty()) out.push_back(given);
    if (!surname.empty()) out.push_back(surname);
    if (!suffix.empty()) out.push_back(suffix);
    return out;
}

std::string PersonName::display() const {
    std::string out;
    for (const auto& p : parts()) {
        if (!out.empty()) out += " ";
        out += p;
    }
    return out;
}

std::string Individual::display_name() const {
    if (!names.empty()) {
        const std::string d = names.front().display();
        if (!d.empty()) return d;
    }
    std::string bare;
    for (char c : id) {
        if (c != '@') bare.push_back(c);
    }
    return bare;
}

const Event* Individual::first_event(EventKind kind) const {
    for (const auto& e : events) {
        if (e.kind == kind) return &e;
    }
    return nullptr;
}

const char* sex_str(Sex s) {
    switch (s) {
        case Sex::Male: return "male";
        case Sex::Female: return "female";
        default: return "unknown";
    }
}

const char* fidelity_str(DateFidelity f) {
    switch (f) {
        case DateFidelity::Exact: return "exact";
        case DateFidelity::YearMonth: return "year-month";
        case DateFidelity::YearOnly: return "year-only";
        case DateFidelity::Approximate: return "approximate";
        case DateFidelity::Range: return "range";
        default: return "unparsed";
    }
}

const char* event_label(const Event& e) {
    switch (e.kind) {
        case EventKind::Birth: return "Birth";
        case EventKind::Death: return "Death";
        case EventKind::Marriage: return "Marriage";
        default: break;
    }
    if (e.tag == "CHR") return "Christening";
    if (e.tag == "BAPM") return "Baptism";
    if (e.tag == "BURI") return "Burial";
    if (e.tag == "CREM") return "Cremation";
    if (e.tag == "ADOP") return "Adoption";
    if (e.tag == "RESI") return "Residence";
    if (e.tag == "EMIG") return "Emigration";
    if (e.tag == "IMMI") return "Immigration";
    if (e.tag == "NATU") return "Naturalization";
    if (e.tag == "GRAD") return "Graduation";
    if (e.tag == "RETI") return "Retirement";
    if (e.tag == "DIV") return "Divorce";
    if (e.tag == "ENGA") return "Engagement";
    if (e.tag == "MARB") return "Marriage banns";
    return "Event";
}

}  // namespace graph
