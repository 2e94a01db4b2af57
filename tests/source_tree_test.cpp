#include <gtest/gtest.h>

#include "core/source_tree/source_tree.hpp"
#include "test_support.hpp"

using ferry::core::SourceScanOptions;
using ferry::core::scan_source_tree;
using ferry::infra::ErrorCode;
using ferry::testing::TempDir;
using ferry::testing::write_file;

namespace {

auto relatives(const ferry::core::SourceTree& tree) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& f : tree.files) out.push_back(f.relative);
    return out;
}

} // namespace

TEST(SourceTreeTest, RegularFilesSortedByRelativePath)
{
    TempDir dir;
    write_file(dir / "src/z.txt", "z");
    write_file(dir / "src/a/b.txt", "bb");
    write_file(dir / "src/a.txt", "aaa");
    std::filesystem::create_directories(dir / "src/empty");

    auto tree = scan_source_tree(dir / "src", {});
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(relatives(*tree), (std::vector<std::string>{"a.txt", "a/b.txt", "z.txt"}));
    EXPECT_EQ(tree->total_bytes, 6u);
}

TEST(SourceTreeTest, MissingRootIsFatal)
{
    TempDir dir;
    auto tree = scan_source_tree(dir / "absent", {});
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, ErrorCode::FileNotFound);
}

TEST(SourceTreeTest, RootMustBeADirectory)
{
    TempDir dir;
    write_file(dir / "file.txt", "x");
    auto tree = scan_source_tree(dir / "file.txt", {});
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, ErrorCode::InvalidPath);
}

TEST(SourceTreeTest, ExcludePatternsMatchFileNames)
{
    TempDir dir;
    write_file(dir / "src/keep.txt", "k");
    write_file(dir / "src/drop.tmp", "d");
    write_file(dir / "src/sub/also.tmp", "d");

    auto tree = scan_source_tree(dir / "src", {.exclude_patterns = {R"(.*\.tmp)"}});
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(relatives(*tree), (std::vector<std::string>{"keep.txt"}));
}

TEST(SourceTreeTest, SkipPathsAreNeverEnumerated)
{
    TempDir dir;
    write_file(dir / "src/data.txt", "d");
    write_file(dir / "src/out.tar.gz", "archive");
    write_file(dir / "src/out.filelist.txt", "sidecar");

    SourceScanOptions options{.skip_paths = {dir / "src/out.tar.gz", dir / "src/out.filelist.txt"}};
    auto tree = scan_source_tree(dir / "src", options);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(relatives(*tree), (std::vector<std::string>{"data.txt"}));
}

TEST(SourceTreeTest, SkipPathsMatchByDirectoryNotJustName)
{
    TempDir dir;
    write_file(dir / "src/sub/out.tar.gz", "archive");
    write_file(dir / "src/sub/keep.txt", "k");
    write_file(dir / "src/out.tar.gz", "same name, other directory");
    std::filesystem::create_directory_symlink(dir / "src", dir / "alias");

    SourceScanOptions options{.skip_paths = {dir / "alias/sub/../sub/out.tar.gz"}};
    auto tree = scan_source_tree(dir / "src", options);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(relatives(*tree), (std::vector<std::string>{"out.tar.gz", "sub/keep.txt"}));
}

TEST(SourceTreeTest, SymlinksFollowedOnlyWhenAsked)
{
    TempDir dir;
    write_file(dir / "target.txt", "target");
    write_file(dir / "src/real.txt", "r");
    std::filesystem::create_symlink(dir / "target.txt", dir / "src/link.txt");
    std::filesystem::create_directory_symlink(dir / "src", dir / "src/loop");

    auto plain = scan_source_tree(dir / "src", {});
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(relatives(*plain), (std::vector<std::string>{"real.txt"}));

    auto followed = scan_source_tree(dir / "src", {.follow_symlinks = true});
    ASSERT_TRUE(followed.has_value());
    EXPECT_EQ(relatives(*followed), (std::vector<std::string>{"link.txt", "real.txt"}));
    EXPECT_EQ(followed->files[0].size, 6u);
}
