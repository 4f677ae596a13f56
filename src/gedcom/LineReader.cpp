#include "gedcom/LineReader.hpp"

#include "gedcom/Errors.hpp"

#include <cctype>
#include <utility>

namespace gedcom {

static bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

static std::string trim_blanks(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && is_blank(s[a])) ++a;
    size_t b = s.size();
    while (b > a && is_blank(s[b - 1])) --b;
    return s.substr(a, b - a);
}

static bool is_tag_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

LineReader::LineReader(std::string text) : m_text(std::move(text)) {
    // UTF-8 byte order mark
    if (m_text.size() >= 3 && m_text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        m_text.erase(0, 3);
    }
}

void LineReader::rewind() {
    m_pos = 0;
    m_line = 0;
}

bool LineReader::next_physical_line(std::string& line) {
    if (m_pos >= m_text.size()) return false;

    size_t end = m_pos;
    while (end < m_text.size() && m_text[end] != '\n' && m_text[end] != '\r') ++end;

    line.assign(m_text, m_pos, end - m_pos);
    ++m_line;

    if (end < m_text.size()) {
        if (m_text[end] == '\r' && end + 1 < m_text.size() && m_text[end + 1] == '\n') end += 2;
        else end += 1;
    }
    m_pos = end;
    return true;
}

bool LineReader::next(LineToken& out) {
    std::string raw;
    while (next_physical_line(raw)) {
        const std::string line = trim_blanks(raw);
        if (line.empty()) continue;

        size_t i = 0;
        while (i < line.size() && !is_blank(line[i])) ++i;
        const std::string level_s = line.substr(0, i);

        if (level_s.size() > 3) throw MalformedLineError(m_line, "level out of range: " + level_s);
        for (char c : level_s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw MalformedLineError(m_line, "non-numeric level: " + level_s);
            }
        }

        LineToken tok;
        tok.line = m_line;
        tok.level = std::stoi(level_s);

        while (i < line.size() && is_blank(line[i])) ++i;
        if (i >= line.size()) throw MalformedLineError(m_line, "missing tag");

        if (line[i] == '@') {
            const size_t close = line.find('@', i + 1);
            if (close == std::string::npos || close == i + 1) {
                throw MalformedLineError(m_line, "unterminated cross-reference id");
            }
            if (close + 1 < line.size() && !is_blank(line[close + 1])) {
                throw MalformedLineError(m_line, "cross-reference id must be followed by a tag");
            }
            tok.pointer = line.substr(i, close - i + 1);
            i = close + 1;
            while (i < line.size() && is_blank(line[i])) ++i;
            if (i >= line.size()) throw MalformedLineError(m_line, "missing tag after " + *tok.pointer);
        }

        const size_t tag_begin = i;
        while (i < line.size() && !is_blank(line[i])) ++i;
        tok.tag = line.substr(tag_begin, i - tag_begin);

        for (char c : tok.tag) {
            if (!is_tag_char(c)) throw MalformedLineError(m_line, "invalid tag: " + tok.tag);
        }

        // exactly one delimiter; the value keeps any further leading blanks
        if (i < line.size()) ++i;
        if (i < line.size()) tok.value = line.substr(i);

        out = std::move(tok);
        return true;
    }
    return false;
}

}  // namespace gedcom
