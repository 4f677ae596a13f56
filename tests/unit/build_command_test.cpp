#include "commands/build.hpp"
#include "commands/validate.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

const char* kGed =
    "0 HEAD\n"
    "1 GEDC\n"
    "2 VERS 5.5.1\n"
    "0 @I1@ INDI\n"
    "1 NAME John /Smith/\n"
    "1 BIRT\n"
    "2 DATE ABT 1870\n"
    "2 PLAC Perth\n"
    "1 FAMS @F1@\n"
    "0 @I2@ INDI\n"
    "1 NAME Mary /Jones/\n"
    "1 FAMS @F1@\n"
    "0 @I3@ INDI\n"
    "1 NAME Peter /Smith/\n"
    "1 FAMC @F1@\n"
    "0 @F1@ FAM\n"
    "1 HUSB @I1@\n"
    "1 WIFE @I2@\n"
    "1 CHIL @I3@\n"
    "0 TRLR\n";

fs::path FreshDir(const std::string& test_name) {
    const auto dir = fs::temp_directory_path() / "gedsite_build_command_tests" / test_name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void WriteFile(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

std::string ReadFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int Run(int (*cmd)(int, char**), std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return cmd(static_cast<int>(args.size()), argv.data());
}

void TestBuildWritesSite() {
    const auto dir = FreshDir("writes_site");
    WriteFile(dir / "family.ged", kGed);
    fs::create_directories(dir / "bios");
    WriteFile(dir / "bios" / "mary-jones.md", "Mary ran the post office.\n");
    WriteFile(dir / "places.json", "{\"Perth\": \"Perth, Western Australia\"}");

    const fs::path out = dir / "site";
    const int rc = Run(cmd_build, {"build", (dir / "family.ged").string(),
                                   "--outdir", out.string(),
                                   "--bios", (dir / "bios").string(),
                                   "--place_map", (dir / "places.json").string(),
                                   "--families",
                                   "--log", (dir / "logs" / "build.log").string()});
    assert(rc == 0);

    assert(fs::exists(out / "People" / "I1.md"));
    assert(fs::exists(out / "People" / "I2.md"));
    assert(fs::exists(out / "People" / "I3.md"));
    assert(fs::exists(out / "Families" / "F1.md"));
    assert(fs::exists(out / "index.md"));
    assert(fs::exists(out / "manifest.json"));

    const std::string john = ReadFile(out / "People" / "I1.md");
    assert(john.find("birth_fidelity: approximate\n") != std::string::npos);
    assert(john.find("[Perth](https://en.wikipedia.org/wiki/Perth,_Western_Australia)") != std::string::npos);

    const std::string mary = ReadFile(out / "People" / "I2.md");
    assert(mary.find("Mary ran the post office.") != std::string::npos);

    const std::string log = ReadFile(dir / "logs" / "build.log");
    assert(log.find("INDIVIDUALS: 3\n") != std::string::npos);
    assert(log.find("BIOGRAPHIES: 1\n") != std::string::npos);

    assert(Run(cmd_validate, {"validate", "--outdir", out.string()}) == 0);
}

void TestStructuralErrorWritesNothing() {
    const auto dir = FreshDir("level_jump");
    WriteFile(dir / "broken.ged",
              "0 @I1@ INDI\n"
              "1 NAME John /Smith/\n"
              "3 DATE 1900\n");

    const fs::path out = dir / "site";
    assert(Run(cmd_build, {"build", (dir / "broken.ged").string(), "--outdir", out.string()}) == 1);
    assert(!fs::exists(out));
}

void TestDanglingReferenceWritesNothing() {
    const auto dir = FreshDir("dangling");
    WriteFile(dir / "dangling.ged",
              "0 @I1@ INDI\n"
              "1 NAME John /Smith/\n"
              "1 FAMS @F9@\n");

    const fs::path out = dir / "site";
    assert(Run(cmd_build, {"build", (dir / "dangling.ged").string(), "--outdir", out.string()}) == 1);
    assert(!fs::exists(out));
}

void TestMissingInput() {
    const auto dir = FreshDir("missing_input");
    assert(Run(cmd_build, {"build"}) == 1);
    assert(Run(cmd_build, {"build", (dir / "absent.ged").string(), "--outdir", (dir / "site").string()}) == 1);
    assert(!fs::exists(dir / "site"));
}

void TestPathAfterFlags() {
    const auto dir = FreshDir("path_after_flags");
    WriteFile(dir / "family.ged", kGed);

    const fs::path out = dir / "site";
    assert(Run(cmd_build, {"build", "--verbose", "--outdir", out.string(), "--no_mermaid",
                           (dir / "family.ged").string()}) == 0);
    assert(fs::exists(out / "People" / "I3.md"));
    assert(ReadFile(out / "People" / "I3.md").find("```mermaid") == std::string::npos);

    // a flag value is never taken for the input file
    assert(Run(cmd_build, {"build", "--outdir", (dir / "other").string()}) == 1);
    assert(!fs::exists(dir / "other"));
}

}  // namespace

int main() {
    TestBuildWritesSite();
    TestStructuralErrorWritesNothing();
    TestDanglingReferenceWritesNothing();
    TestMissingInput();
    TestPathAfterFlags();

    std::cout << "gedsite_unit_build_command: pass\n";
    return 0;
}
