#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "termcode-patch/ConflictExtractor.h"
#include "TestHelpers.h"

using namespace termcode_patch;
using Catch::Matchers::ContainsSubstring;

// Reports a fixed list of unmerged files
class UnmergedOnly : public VersionControl {
public:
    explicit UnmergedOnly(std::vector<std::string> files) : files_(std::move(files)) {}

    CommandResult apply(const std::filesystem::path&, const std::filesystem::path&,
                        bool, bool) override {
        return CommandResult{1, "not supported"};
    }
    std::vector<std::string> listStagedFiles(const std::filesystem::path&) override {
        return {};
    }
    std::vector<std::string> listUnmergedFiles(const std::filesystem::path&) override {
        return files_;
    }

private:
    std::vector<std::string> files_;
};

TEST_CASE("ConflictExtractor::scanContent - single block", "[conflicts]") {
    auto conflicts = ConflictExtractor::scanContent(
        "f.txt", "<<<<<<< HEAD\nA\n=======\nB\n>>>>>>> branch");

    REQUIRE(conflicts.size() == 1);
    const auto& c = conflicts[0];
    CHECK(c.file == "f.txt");
    CHECK(c.line == 1);
    CHECK(c.kind == ConflictKind::Merge);
    CHECK(c.original == "A");
    CHECK(c.incoming == "B");
    CHECK_THAT(c.message, ContainsSubstring("line 1"));
}

TEST_CASE("ConflictExtractor::scanContent - multiple blocks and multi-line sides", "[conflicts]") {
    const char* content =
        "header\n"
        "<<<<<<< ours\n"
        "a1\n"
        "a2\n"
        "=======\n"
        "b1\n"
        ">>>>>>> theirs\n"
        "middle\n"
        "<<<<<<< ours\n"
        "=======\n"
        "added\n"
        ">>>>>>> theirs\n";

    auto conflicts = ConflictExtractor::scanContent("f.txt", content);

    REQUIRE(conflicts.size() == 2);
    CHECK(conflicts[0].line == 2);
    CHECK(conflicts[0].original == "a1\na2");
    CHECK(conflicts[0].incoming == "b1");
    CHECK(conflicts[1].line == 9);
    CHECK(conflicts[1].original == "");
    CHECK(conflicts[1].incoming == "added");
}

TEST_CASE("ConflictExtractor::scanContent - diff3 base section is dropped", "[conflicts]") {
    auto conflicts = ConflictExtractor::scanContent(
        "f.txt",
        "<<<<<<< ours\n"
        "mine\n"
        "||||||| base\n"
        "common ancestor\n"
        "=======\n"
        "yours\n"
        ">>>>>>> theirs\n");

    REQUIRE(conflicts.size() == 1);
    CHECK(conflicts[0].original == "mine");
    CHECK(conflicts[0].incoming == "yours");
}

TEST_CASE("ConflictExtractor::scanContent - clean and unterminated content", "[conflicts]") {
    CHECK(ConflictExtractor::scanContent("f.txt", "no markers here\n").empty());

    auto conflicts = ConflictExtractor::scanContent(
        "f.txt", "<<<<<<< ours\nmine\n=======\nyours\n");
    REQUIRE(conflicts.size() == 1);
    CHECK_THAT(conflicts[0].message, ContainsSubstring("unterminated"));
    CHECK(conflicts[0].original == "mine");
}

TEST_CASE("ConflictExtractor::findConflicts - reads unmerged files", "[conflicts]") {
    TempDir repo("conflicts");
    repo.write("src/a.txt", "<<<<<<< HEAD\nA\n=======\nB\n>>>>>>> branch\n");

    UnmergedOnly vcs({"src/a.txt", "missing.txt"});
    DiagnosticCollector diags;
    ConflictExtractor extractor(vcs, &diags);

    auto conflicts = extractor.findConflicts(repo.path());

    REQUIRE(conflicts.size() == 1);
    CHECK(conflicts[0].file == "src/a.txt");
    CHECK(conflicts[0].original == "A");
    CHECK(diags.countOfType("io") == 1);

    CHECK(findConflicts(repo.path(), vcs).size() == 1);
}
