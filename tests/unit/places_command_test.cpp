#include "commands/places.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

// Zurich and Perth tie on count, as do Albany and Bern
const char* kGed =
    "0 @I1@ INDI\n"
    "1 BIRT\n2 PLAC Zurich\n"
    "1 DEAT\n2 PLAC Perth\n"
    "0 @I2@ INDI\n"
    "1 BIRT\n2 PLAC Perth\n"
    "1 RESI\n2 PLAC Bern\n"
    "0 @I3@ INDI\n"
    "1 BIRT\n2 DATE 1900\n"
    "0 @F1@ FAM\n"
    "1 MARR\n2 PLAC Zurich\n"
    "1 DIV\n2 PLAC Albany\n";

fs::path FreshDir(const std::string& test_name) {
    const auto dir = fs::temp_directory_path() / "gedsite_places_command_tests" / test_name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

int RunPlaces(std::vector<std::string> args, std::string& out) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    std::ostringstream captured;
    std::streambuf* old = std::cout.rdbuf(captured.rdbuf());
    const int rc = cmd_places(static_cast<int>(args.size()), argv.data());
    std::cout.rdbuf(old);

    out = captured.str();
    return rc;
}

void TestCountsThenNames() {
    const auto dir = FreshDir("ordering");
    {
        std::ofstream f(dir / "places.ged", std::ios::binary);
        f << kGed;
    }

    std::string out;
    assert(RunPlaces({"places", (dir / "places.ged").string()}, out) == 0);
    assert(out ==
           "PLACES:\n"
           "  2x Perth\n"
           "  2x Zurich\n"
           "  1x Albany\n"
           "  1x Bern\n"
           "UNIQUE_PLACES: 4\n");
}

void TestNoPlaces() {
    const auto dir = FreshDir("none");
    {
        std::ofstream f(dir / "empty.ged", std::ios::binary);
        f << "0 HEAD\n0 @I1@ INDI\n1 NAME Solo /Person/\n0 TRLR\n";
    }

    std::string out;
    assert(RunPlaces({"places", (dir / "empty.ged").string()}, out) == 0);
    assert(out == "PLACES:\nUNIQUE_PLACES: 0\n");
}

void TestBadInput() {
    const auto dir = FreshDir("bad_input");
    std::string out;
    assert(RunPlaces({"places"}, out) == 1);
    assert(RunPlaces({"places", (dir / "absent.ged").string()}, out) == 1);
    assert(out.empty());
}

}  // namespace

int main() {
    TestCountsThenNames();
    TestNoPlaces();
    TestBadInput();

    std::cout << "gedsite_unit_places_command: pass\n";
    return 0;
}
