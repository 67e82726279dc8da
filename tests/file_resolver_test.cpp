#include "kiln/console.hpp"
#include "kiln/file_resolver.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

using kiln::testing::ScopedTempDir;
using kiln::testing::write_file;

std::vector<std::string> strings(const std::vector<std::filesystem::path> &paths) {
    std::vector<std::string> out;
    for (const auto &p : paths)
        out.push_back(p.string());
    return out;
}

TEST(GlobMatchTest, SingleComponentWildcards) {
    EXPECT_TRUE(kiln::glob_match("*.rs", "main.rs"));
    EXPECT_FALSE(kiln::glob_match("*.rs", "src/main.rs"));
    EXPECT_TRUE(kiln::glob_match("src/?ain.rs", "src/main.rs"));
    EXPECT_TRUE(kiln::glob_match("src/[lm]ain.rs", "src/main.rs"));
    EXPECT_FALSE(kiln::glob_match("src/[!m]ain.rs", "src/main.rs"));
    EXPECT_TRUE(kiln::glob_match("src/[a-z]*.rs", "src/lib.rs"));
}

TEST(GlobMatchTest, DoubleStarSpansDirectories) {
    EXPECT_TRUE(kiln::glob_match("src/**/*.rs", "src/main.rs"));
    EXPECT_TRUE(kiln::glob_match("src/**/*.rs", "src/task/config.rs"));
    EXPECT_TRUE(kiln::glob_match("**/*.rs", "a/b/c.rs"));
    EXPECT_FALSE(kiln::glob_match("src/**/*.rs", "tests/main.rs"));
}

TEST(GlobMatchTest, DetectsGlobPatterns) {
    EXPECT_TRUE(kiln::is_glob_pattern("src/*.c"));
    EXPECT_TRUE(kiln::is_glob_pattern("file?.txt"));
    EXPECT_TRUE(kiln::is_glob_pattern("[ab].txt"));
    EXPECT_FALSE(kiln::is_glob_pattern("Cargo.toml"));
}

class FileResolverTest : public ::testing::Test {
protected:
    ScopedTempDir dir;
    kiln::BufferConsole console;
    kiln::FileResolver resolver{console};
};

TEST_F(FileResolverTest, ExpandsGlobsToSortedRegularFiles) {
    write_file("src/b.rs", "b");
    write_file("src/a.rs", "a");
    write_file("src/notes.txt", "n");
    std::filesystem::create_directories("src/dir.rs");

    auto res = resolver.resolve({"src/*.rs"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(strings(*res), (std::vector<std::string>{"src/a.rs", "src/b.rs"}));
}

TEST_F(FileResolverTest, RecursiveGlob) {
    write_file("src/main.rs", "");
    write_file("src/task/config.rs", "");
    write_file("src/task/deep/analysis.rs", "");
    write_file("other/skip.rs", "");

    auto res = resolver.resolve({"src/**/*.rs"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(strings(*res),
              (std::vector<std::string>{"src/main.rs", "src/task/config.rs", "src/task/deep/analysis.rs"}));
}

TEST_F(FileResolverTest, DeduplicatesAcrossPatterns) {
    write_file("a.txt", "a");
    write_file("b.txt", "b");

    auto res = resolver.resolve({"a.txt", "*.txt", "a.txt"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(strings(*res), (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST_F(FileResolverTest, MissingLiteralIsDroppedWithWarning) {
    write_file("present.txt", "x");

    auto res = resolver.resolve({"present.txt", "missing.txt"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(strings(*res), (std::vector<std::string>{"present.txt"}));
    EXPECT_NE(console.err().find("Input file 'missing.txt' does not exist"), std::string::npos);
}

TEST_F(FileResolverTest, MissingLiteralSilentWhenAsked) {
    auto res = resolver.resolve({"missing.txt"}, false);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->empty());
    EXPECT_TRUE(console.err().empty());
}

TEST_F(FileResolverTest, LiteralDirectoryIsKept) {
    std::filesystem::create_directories("target/debug");

    auto res = resolver.resolve({"target"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(strings(*res), (std::vector<std::string>{"target"}));
}

TEST_F(FileResolverTest, GlobWithoutMatchesIsEmpty) {
    auto res = resolver.resolve({"nothing/*.o"});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->empty());
}

TEST_F(FileResolverTest, InvalidPatternIsAFileError) {
    auto unterminated = resolver.resolve({"src/[abc.rs"});
    ASSERT_FALSE(unterminated.has_value());
    EXPECT_EQ(unterminated.error().kind, kiln::ErrorKind::File);

    auto partial_star = resolver.resolve({"src/a**/*.rs"});
    ASSERT_FALSE(partial_star.has_value());
    EXPECT_EQ(partial_star.error().kind, kiln::ErrorKind::File);
}

} // namespace
