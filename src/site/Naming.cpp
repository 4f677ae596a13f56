#include "site/Naming.hpp"

#include <cctype>

namespace site {

const char* const kPeopleIndexStem = "index";
const char* const kBiographiesIndexStem = "biographies";

std::string document_stem(const std::string& id) {
    std::string bare = id;
    if (bare.size() >= 2 && bare.front() == '@' && bare.back() == '@') bare = bare.substr(1, bare.size() - 2);

    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(bare.size());
    for (unsigned char c : bare) {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
        if (keep) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('_');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }

    // names taken by the index pages
    std::string lower;
    for (char c : out) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "index" || lower == "biographies") {
        const unsigned char first = static_cast<unsigned char>(out[0]);
        out = std::string("_") + hex[first >> 4] + hex[first & 0x0F] + out.substr(1);
    }
    return out;
}

std::string name_slug(const std::string& name) {
    std::string out;
    bool pending_dash = false;
    for (unsigned char c : name) {
        const bool word = std::isalnum(c) || c >= 0x80;
        if (!word) {
            pending_dash = !out.empty();
            continue;
        }
        if (pending_dash) out.push_back('-');
        pending_dash = false;
        out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
    }
    return out;
}

std::filesystem::path profile_relpath(const std::string& individual_id) {
    return std::filesystem::path("People") / (document_stem(individual_id) + ".md");
}

std::filesystem::path family_relpath(const std::string& family_id) {
    return std::filesystem::path("Families") / (document_stem(family_id) + ".md");
}

}  // namespace site
