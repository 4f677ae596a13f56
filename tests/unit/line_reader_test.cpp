#include "gedcom/LineReader.hpp"

#include "gedcom/Errors.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using gedcom::LineReader;
using gedcom::LineToken;
using gedcom::MalformedLineError;

std::vector<LineToken> ReadAll(const std::string& text) {
    LineReader reader(text);
    std::vector<LineToken> out;
    LineToken tok;
    while (reader.next(tok)) out.push_back(tok);
    return out;
}

int MalformedLineOf(const std::string& text) {
    try {
        ReadAll(text);
    } catch (const MalformedLineError& e) {
        return e.line();
    }
    return -1;
}

void TestTokenizesRecordAndValueLines() {
    const auto toks = ReadAll("0 @I1@ INDI\n1 NAME John  /Smith/\n1 SEX M\n");
    assert(toks.size() == 3);

    assert(toks[0].level == 0);
    assert(toks[0].pointer && *toks[0].pointer == "@I1@");
    assert(toks[0].tag == "INDI");
    assert(!toks[0].value);

    assert(toks[1].line == 2);
    assert(toks[1].level == 1);
    assert(toks[1].tag == "NAME");
    assert(!toks[1].pointer);
    assert(toks[1].value && *toks[1].value == "John  /Smith/");

    assert(toks[2].value && *toks[2].value == "M");
}

void TestToleratesLineEndingsBlankLinesAndBom() {
    const auto toks = ReadAll("\xEF\xBB\xBF" "0 HEAD\r\n  1 CHAR UTF-8   \r\n\r\n2 VERS 5.5\r0 TRLR\n\n\n   \n");
    assert(toks.size() == 4);
    assert(toks[0].tag == "HEAD");
    assert(toks[1].tag == "CHAR");
    assert(toks[1].value && *toks[1].value == "UTF-8");
    assert(toks[2].line == 4);
    assert(toks[2].level == 2);
    assert(toks[3].tag == "TRLR");
    assert(toks[3].line == 5);
}

void TestFamilyPointerValues() {
    const auto toks = ReadAll("0 @F1@ FAM\n1 HUSB @I1@\n1 _MARNM Smith\n");
    assert(toks.size() == 3);
    assert(toks[1].value && *toks[1].value == "@I1@");
    assert(toks[2].tag == "_MARNM");
}

void TestMalformedLinesCarryLineNumber() {
    assert(MalformedLineOf("0 HEAD\nX NAME John\n") == 2);
    assert(MalformedLineOf("0 HEAD\n1\n") == 2);
    assert(MalformedLineOf("0 @I1 INDI\n") == 1);
    assert(MalformedLineOf("0 HEAD\n\n0 @I1@\n") == 3);
    assert(MalformedLineOf("0 HEAD\n1 NA.ME x\n") == 2);
    assert(MalformedLineOf("0 HEAD\n1 NAME ok\n") == -1);
}

void TestRewindRestartsFromFirstLine() {
    LineReader reader("0 HEAD\n0 TRLR\n");
    LineToken tok;
    assert(reader.next(tok) && tok.tag == "HEAD");
    assert(reader.next(tok) && tok.tag == "TRLR");
    assert(!reader.next(tok));

    reader.rewind();
    assert(reader.next(tok) && tok.tag == "HEAD" && tok.line == 1);
}

}  // namespace

int main() {
    TestTokenizesRecordAndValueLines();
    TestToleratesLineEndingsBlankLinesAndBom();
    TestFamilyPointerValues();
    TestMalformedLinesCarryLineNumber();
    TestRewindRestartsFromFirstLine();

    std::cout << "gedsite_unit_line_reader: pass\n";
    return 0;
}
