#pragma once

#include <optional>
#include <string>
#include <vector>

namespace graph {

enum class Sex {
    Male,
    Female,
    Unknown
};

enum class DateFidelity {
    Exact,        // 12 MAR 1901
    YearMonth,    // MAR 1901
    YearOnly,     // 1901
    Approximate,  // ABT 1901, BEF 12 MAR 1901
    Range,        // BET 1900 AND 1905, FROM 1900 TO 1905
    Unparsed      // kept verbatim
};

struct CalendarDate {
    int year = 0;   // 0 = absent
    int month = 0;  // 1..12, 0 = absent
    int day = 0;    // 1..31, 0 = absent

    bool empty() const { return year == 0; }
    std::string iso() const;  // "1901", "1901-03", "1901-03-12"
};

struct NormalizedDate {
    std::string original;                       // source text, never dropped
    DateFidelity fidelity = DateFidelity::Unparsed;
    CalendarDate start;
    CalendarDate end;                           // Range only
    std::string qualifier;                      // ABT, BEF, AFT, ... (Approximate only)

    // "" when unparsed
    std::string iso() const;
};

struct PersonName {
    std::string raw;
    std::string given;
    std::string surname;
    std::string suffix;
    bool structured = false;  // false: raw is the only part

    std::vector<std::string> parts() const;
    std::string display() const;
};

enum class EventKind {
    Birth,
    Death,
    Marriage,
    Other
};

struct Event {
    EventKind kind = EventKind::Other;
    std::string tag;                       // BIRT, DEAT, MARR, BURI, ...
    std::optional<NormalizedDate> date;
    std::optional<std::string> place;
};

struct Individual {
    std::string id;                        // "@I1@"
    std::vector<PersonName> names;         // first one is primary
    Sex sex = Sex::Unknown;
    std::vector<Event> events;             // source order
    std::vector<std::string> occupations;
    std::vector<std::string> notes;
    std::vector<std::string> families_as_child;   // family ids, no duplicates
    std::vector<std::string> families_as_spouse;

    // primary name, or the id without '@' when nameless
    std::string display_name() const;

    // first event of the kind, or nullptr
    const Event* first_event(EventKind kind) const;
};

struct Family {
    std::string id;
    std::vector<std::string> spouse_ids;   // at most two
    std::vector<std::string> child_ids;
    std::vector<Event> events;
};

const char* sex_str(Sex s);
const char* fidelity_str(DateFidelity f);
const char* event_label(const Event& e);  // "Birth", "Burial", ...

}  // namespace graph
