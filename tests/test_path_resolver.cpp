/*
 * Path resolver tests - GChat
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <gchat/fs/path_resolver.hpp>
#include "test_support.hpp"

using namespace gchat;
using gchat::testing::TempDir;
namespace fs = std::filesystem;

static std::vector<std::string> rel(const PathResolution& r, const fs::path& root) {
    std::vector<std::string> out;
    for (auto& p : r.paths) out.push_back(relative_display(p, root));
    return out;
}

TEST(PathResolve, LiteralFile) {
    TempDir dir; dir.write("notes.txt", "hello");
    auto r = resolve("notes.txt", dir.path());
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(rel(r, dir.path()), std::vector<std::string>{"notes.txt"});
    EXPECT_TRUE(resolve("./notes.txt", dir.path()).ok());
}

TEST(PathResolve, MissingFile) {
    TempDir dir;
    auto r = resolve("missing.txt", dir.path());
    EXPECT_EQ(r.error, PathError::NotFound);
}

TEST(PathResolve, DirectoryRecursesSorted) {
    TempDir dir;
    dir.write("src/b.cpp", "b");
    dir.write("src/a.cpp", "a");
    dir.write("src/sub/c.hpp", "c");
    auto r = resolve("src", dir.path());
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(rel(r, dir.path()), (std::vector<std::string>{"src/a.cpp", "src/b.cpp", "src/sub/c.hpp"}));
}

TEST(PathResolve, GlobSingleSegment) {
    TempDir dir;
    dir.write("b.txt", "");
    dir.write("a.txt", "");
    dir.write("c.log", "");
    auto r = resolve("*.txt", dir.path());
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(rel(r, dir.path()), (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST(PathResolve, GlobDoubleStar) {
    TempDir dir;
    dir.write("src/x.cpp", "");
    dir.write("src/deep/er/y.cpp", "");
    dir.write("src/deep/z.h", "");
    auto r = resolve("src/**/*.cpp", dir.path());
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(rel(r, dir.path()), (std::vector<std::string>{"src/deep/er/y.cpp", "src/x.cpp"}));
}

TEST(PathResolve, GlobNoMatchAndBadPattern) {
    TempDir dir; dir.write("a.txt", "");
    EXPECT_EQ(resolve("*.md", dir.path()).error, PathError::NotFound);
    EXPECT_EQ(resolve("[a.txt", dir.path()).error, PathError::BadPattern);
    EXPECT_EQ(resolve("", dir.path()).error, PathError::BadPattern);
}

TEST(PathResolve, TraversalAndAbsoluteRejected) {
    TempDir dir; dir.write("a.txt", "");
    for (auto policy : {Containment::Strict, Containment::DropOffending}) {
        EXPECT_EQ(resolve("../secret.txt", dir.path(), policy).error, PathError::OutsideRoot);
        EXPECT_EQ(resolve("/etc/passwd", dir.path(), policy).error, PathError::OutsideRoot);
        EXPECT_EQ(resolve("a/../../x", dir.path(), policy).error, PathError::OutsideRoot);
    }
}

TEST(PathResolve, SymlinkEscapeStrictFailsDropSkips) {
    TempDir dir, outside;
    outside.write("secret.txt", "s");
    dir.write("docs/readme.md", "r");
    std::error_code ec;
    fs::create_symlink(outside.path() / "secret.txt", dir.path() / "docs" / "leak.txt", ec);
    if (ec) GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    auto strict = resolve("docs", dir.path(), Containment::Strict);
    EXPECT_EQ(strict.error, PathError::OutsideRoot);

    auto dropped = resolve("docs", dir.path(), Containment::DropOffending);
    ASSERT_TRUE(dropped.ok()) << dropped.message;
    EXPECT_EQ(rel(dropped, dir.path()), std::vector<std::string>{"docs/readme.md"});
    ASSERT_EQ(dropped.dropped.size(), 1u);

    EXPECT_EQ(resolve("docs/leak.txt", dir.path(), Containment::Strict).error, PathError::OutsideRoot);
}

TEST(PathTree, NestedListing) {
    TempDir dir;
    dir.write("proj/main.cpp", "");
    dir.write("proj/lib/util.cpp", "");
    auto t = render_tree("proj", dir.path());
    ASSERT_TRUE(t.ok()) << t.message;
    EXPECT_EQ(t.text, "Contents of directory proj:\n```\nlib/\n  util.cpp\nmain.cpp\n```\n");
}

TEST(PathTree, EmptyAndErrors) {
    TempDir dir;
    fs::create_directories(dir.path() / "empty");
    dir.write("file.txt", "");
    auto t = render_tree("empty", dir.path());
    ASSERT_TRUE(t.ok());
    EXPECT_NE(t.text.find("(empty directory)"), std::string::npos);
    EXPECT_EQ(render_tree("file.txt", dir.path()).error, PathError::NotADirectory);
    EXPECT_EQ(render_tree("nope", dir.path()).error, PathError::NotFound);
    EXPECT_EQ(render_tree("..", dir.path()).error, PathError::OutsideRoot);
}

TEST(PathRead, SizeLimit) {
    TempDir dir;
    auto p = dir.write("big.txt", std::string(100, 'x'));
    std::string why;
    EXPECT_FALSE(read_text_file(p, 10, &why).has_value());
    EXPECT_NE(why.find("too large"), std::string::npos);
    EXPECT_EQ(read_text_file(p, 1000).value().size(), 100u);
}

TEST(PathRead, RejectsNonUtf8) {
    TempDir dir;
    std::string why;
    EXPECT_FALSE(read_text_file(dir.write("bin", std::string("\x89PNG\xff\xfe", 6)), 0, &why).has_value());
    EXPECT_EQ(why, "not a UTF-8 text file");
    EXPECT_FALSE(read_text_file(dir.write("cut", "ab\xE2\x82"), 0).has_value());
    EXPECT_FALSE(read_text_file(dir.write("overlong", "\xC0\xAF"), 0).has_value());
    EXPECT_EQ(read_text_file(dir.write("euro", "\xE2\x82\xAC 5\n"), 0).value(), "\xE2\x82\xAC 5\n");
}

TEST(GlobRegex, Translation) {
    EXPECT_EQ(glob_to_regex("*.txt"), "^.*\\.txt$");
    EXPECT_EQ(glob_to_regex("a?[!b]"), "^a.[^b]$");
    EXPECT_TRUE(has_glob_chars("x*"));
    EXPECT_FALSE(has_glob_chars("plain.txt"));
}
