#include "graph/DateParser.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace graph {

static std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

static std::string to_upper_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string t;
    while (iss >> t) out.push_back(t);
    return out;
}

static int month_number(const std::string& tok) {
    static const char* months[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                   "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
    for (int i = 0; i < 12; ++i) {
        if (tok == months[i]) return i + 1;
    }
    return 0;
}

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// "1901" or the dual-year form "1700/01"
static int parse_year(const std::string& tok) {
    std::string y = tok;
    const size_t slash = y.find('/');
    if (slash != std::string::npos) {
        if (!all_digits(y.substr(slash + 1))) return 0;
        y = y.substr(0, slash);
    }
    if (!all_digits(y) || y.size() > 4) return 0;
    return std::stoi(y);
}

// [day] [month] year
static bool parse_simple(const std::vector<std::string>& toks, size_t begin, size_t end, CalendarDate& out) {
    const size_t n = end - begin;
    if (n == 0 || n > 3) return false;

    CalendarDate d;
    d.year = parse_year(toks[end - 1]);
    if (d.year == 0) return false;

    if (n >= 2) {
        d.month = month_number(toks[end - 2]);
        if (d.month == 0) return false;
    }
    if (n == 3) {
        if (!all_digits(toks[begin]) || toks[begin].size() > 2) return false;
        d.day = std::stoi(toks[begin]);
        if (d.day < 1 || d.day > 31) return false;
    }

    out = d;
    return true;
}

static DateFidelity simple_fidelity(const CalendarDate& d) {
    if (d.day != 0) return DateFidelity::Exact;
    if (d.month != 0) return DateFidelity::YearMonth;
    return DateFidelity::YearOnly;
}

static size_t find_token(const std::vector<std::string>& toks, const std::string& t, size_t from) {
    for (size_t i = from; i < toks.size(); ++i) {
        if (toks[i] == t) return i;
    }
    return toks.size();
}

NormalizedDate parse_gedcom_date(const std::string& text) {
    NormalizedDate nd;
    nd.original = trim_copy(text);

    std::string work = to_upper_copy(nd.original);

    // calendar escape, e.g. "@#DJULIAN@ 1700"
    if (work.rfind("@#", 0) == 0) {
        const size_t close = work.find('@', 2);
        if (close != std::string::npos) work = work.substr(close + 1);
    }

    const std::vector<std::string> toks = split_ws(work);
    if (toks.empty()) return nd;

    const std::string& head = toks.front();

    if (head == "ABT" || head == "CAL" || head == "EST" || head == "BEF" || head == "AFT") {
        if (parse_simple(toks, 1, toks.size(), nd.start)) {
            nd.fidelity = DateFidelity::Approximate;
            nd.qualifier = head;
        }
        return nd;
    }

    if (head == "BET") {
        const size_t and_pos = find_token(toks, "AND", 1);
        if (and_pos < toks.size() &&
            parse_simple(toks, 1, and_pos, nd.start) &&
            parse_simple(toks, and_pos + 1, toks.size(), nd.end)) {
            nd.fidelity = DateFidelity::Range;
        } else {
            nd.start = CalendarDate{};
            nd.end = CalendarDate{};
        }
        return nd;
    }

    if (head == "FROM" || head == "TO") {
        const size_t to_pos = (head == "FROM") ? find_token(toks, "TO", 1) : toks.size();
        if (head == "FROM" && to_pos < toks.size()) {
            if (parse_simple(toks, 1, to_pos, nd.start) &&
                parse_simple(toks, to_pos + 1, toks.size(), nd.end)) {
                nd.fidelity = DateFidelity::Range;
            } else {
                nd.start = CalendarDate{};
                nd.end = CalendarDate{};
            }
            return nd;
        }
        if (parse_simple(toks, 1, toks.size(), nd.start)) {
            nd.fidelity = DateFidelity::Approximate;
            nd.qualifier = head;
        }
        return nd;
    }

    if (parse_simple(toks, 0, toks.size(), nd.start)) {
        nd.fidelity = simple_fidelity(nd.start);
    }
    return nd;
}

}  // namespace graph
