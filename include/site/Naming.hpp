#pragma once

#include <filesystem>
#include <string>

namespace site {

// "@I12@" -> "I12". Bytes outside [A-Za-z0-9-] become "_XX" (hex), so
// distinct ids never share a stem. "index" and "biographies" belong to the
// index pages and get their first byte escaped too.
std::string document_stem(const std::string& id);

// "Anna Maria Schmidt" -> "anna-maria-schmidt"
std::string name_slug(const std::string& name);

std::filesystem::path profile_relpath(const std::string& individual_id);  // People/<stem>.md
std::filesystem::path family_relpath(const std::string& family_id);       // Families/<stem>.md

extern const char* const kPeopleIndexStem;       // "index"
extern const char* const kBiographiesIndexStem;  // "biographies"

}  // namespace site
