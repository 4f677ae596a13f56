#include "site/PlaceLinker.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

namespace fs = std::filesystem;

using site::PlaceLinker;

fs::path FreshDir() {
    const auto dir = fs::temp_directory_path() / "gedsite_place_linker_tests";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

fs::path WriteMap(const fs::path& dir, const std::string& name, const std::string& content) {
    const auto p = dir / name;
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
}

// message of the runtime_error thrown by load_from_json, or "" when it loads
std::string LoadError(const fs::path& path) {
    try {
        PlaceLinker::load_from_json(path);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

bool Contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

void TestLoadsObjectOfStrings() {
    const auto dir = FreshDir();
    const auto path = WriteMap(dir, "good.json",
                               "{\"Perth, Australia\": \"Perth, Western Australia\", \"Bern\": \"Bern (city)\"}");

    const PlaceLinker linker = PlaceLinker::load_from_json(path);
    assert(linker.enabled());
    assert(linker.render("Perth, Australia") ==
           "[Perth, Australia](https://en.wikipedia.org/wiki/Perth,_Western_Australia)");
    assert(linker.render("Bern") == "[Bern](https://en.wikipedia.org/wiki/Bern_%28city%29)");
    assert(linker.render("New York") == "[New York](https://en.wikipedia.org/wiki/New_York)");
    assert(linker.render("").empty());
}

void TestRejectsBadFiles() {
    const auto dir = FreshDir();

    const auto array = WriteMap(dir, "array.json", "[\"Perth\"]");
    assert(Contains(LoadError(array), "must be a JSON object"));
    assert(Contains(LoadError(array), array.string()));

    const auto number = WriteMap(dir, "number.json", "{\"Perth\": \"Perth\", \"Bern\": 3}");
    assert(Contains(LoadError(number), "'Bern' must be a string"));

    const auto broken = WriteMap(dir, "broken.json", "{\"Perth\": ");
    assert(Contains(LoadError(broken), "failed to parse place map " + broken.string()));

    assert(Contains(LoadError(dir / "absent.json"), "failed to open place map"));
}

void TestDefaultIsPlainText() {
    const PlaceLinker plain;
    assert(!plain.enabled());
    assert(plain.render("Perth") == "Perth");
}

}  // namespace

int main() {
    TestLoadsObjectOfStrings();
    TestRejectsBadFiles();
    TestDefaultIsPlainText();

    std::cout << "gedsite_unit_place_linker: pass\n";
    return 0;
}
