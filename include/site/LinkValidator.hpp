#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace site {

struct ValidationError {
    std::string code;      // missing_file | bad_manifest | dangling_link | ambiguous_link
    std::string message;
    std::string document;  // manifest path of the offending document
};

struct ValidationReport {
    bool pass = true;
    int documents_checked = 0;
    int links_checked = 0;
    std::vector<ValidationError> errors;
};

// "[[target|label]]" and "[[target]]" targets of a Markdown document.
// Fenced code blocks and the biography region are skipped.
std::vector<std::string> extract_wikilinks(const std::string& markdown);

// Checks that every document listed in <outdir>/manifest.json exists and that
// each of its cross-links resolves to exactly one listed document.
ValidationReport validate_site(const std::filesystem::path& outdir);

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace site
