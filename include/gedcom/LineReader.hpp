#pragma once

#include <optional>
#include <string>

namespace gedcom {

struct LineToken {
    int line = 0;                        // 1-based physical line
    int level = 0;
    std::string tag;                     // "INDI", "NAME", "_CUSTOM"
    std::optional<std::string> pointer;  // "@I1@" on record lines
    std::optional<std::string> value;    // rest of the line, absent if empty
};

// Lazy tokenizer over the full text of a GEDCOM file.
// Blank lines are skipped; CR, LF and CRLF endings are all accepted.
class LineReader {
public:
    explicit LineReader(std::string text);

    // false at end of input; throws MalformedLineError on a bad line
    bool next(LineToken& out);

    // restart from the first line
    void rewind();

private:
    bool next_physical_line(std::string& line);

    std::string m_text;
    size_t m_pos = 0;
    int m_line = 0;
};

}  // namespace gedcom
