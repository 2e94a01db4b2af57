#include <gtest/gtest.h>

#include <sys/stat.h>

#include "adapters/archive/appender.hpp"
#include "adapters/archive/extractor.hpp"
#include "adapters/archive/gzip_stream.hpp"
#include "adapters/archive/tar_format.hpp"
#include "adapters/fs.hpp"
#include "core/archive_job/archive_job.hpp"
#include "test_support.hpp"

namespace archive = ferry::adapters::archive;
using ferry::infra::ErrorCode;
using ferry::testing::TempDir;
using ferry::testing::read_file;
using ferry::testing::strip_terminator;
using ferry::testing::write_file;

namespace {

struct Member {
    archive::TarEntry entry;
    std::string data;
};

// Single-member .tar.gz with arbitrary entry types, as another tar would write it.
void write_tar_gz(const std::filesystem::path& path, const std::vector<Member>& members) {
    std::string tar;
    for (auto m : members) {
        m.entry.size = m.data.size();
        const auto headers = archive::encode_headers(m.entry);
        tar.append(headers.begin(), headers.end());
        tar += m.data;
        tar.append(archive::padded_size(m.data.size()) - m.data.size(), '\0');
    }
    const auto eoa = archive::end_of_archive_blocks();
    tar.append(eoa.begin(), eoa.end());

    auto fd = ferry::adapters::fs::open_write(path);
    ASSERT_TRUE(fd.has_value());
    ASSERT_TRUE(archive::write_member(fd->get(), path, 6, tar).has_value());
}

auto symlink_entry(std::string name, std::string target) -> archive::TarEntry {
    return {.name = std::move(name), .mode = 0777, .type = archive::EntryType::Symlink,
            .linkname = std::move(target)};
}

auto file_entry(std::string name) -> archive::TarEntry {
    return {.name = std::move(name)};
}

} // namespace

TEST(ExtractorTest, RoundTripRestoresContentModeAndMtime)
{
    TempDir dir;
    const std::string big(300000, 'q');
    write_file(dir / "src/a.txt", "alpha");
    write_file(dir / "src/deep/er/b.bin", big);
    write_file(dir / "src/empty", "");
    std::filesystem::permissions(dir / "src/a.txt", std::filesystem::perms::owner_read |
                                                    std::filesystem::perms::owner_write |
                                                    std::filesystem::perms::owner_exec);
    const auto mtime = std::filesystem::last_write_time(dir / "src/deep/er/b.bin");

    ferry::infra::Config config;
    config.progress = false;
    ASSERT_TRUE(ferry::core::ArchiveJob{config}.run({.source = dir / "src", .archive = dir / "x.tar.gz"}));

    auto stats = archive::extract_archive(dir / "x.tar.gz", dir / "dst");
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats->files, 3u);
    EXPECT_EQ(stats->bytes, 5u + big.size());
    EXPECT_TRUE(stats->terminated);

    EXPECT_EQ(read_file(dir / "dst/src/a.txt"), "alpha");
    EXPECT_EQ(read_file(dir / "dst/src/deep/er/b.bin"), big);
    EXPECT_TRUE(std::filesystem::is_regular_file(dir / "dst/src/empty"));

    struct stat st{};
    ASSERT_EQ(::stat((dir / "dst/src/a.txt").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);

    const auto restored = std::filesystem::last_write_time(dir / "dst/src/deep/er/b.bin");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(restored.time_since_epoch()).count(),
              std::chrono::duration_cast<std::chrono::seconds>(mtime.time_since_epoch()).count());
}

TEST(ExtractorTest, UnsafeMemberNamesAreSkipped)
{
    TempDir dir;
    write_file(dir / "payload.txt", "evil");
    {
        auto appender = archive::ArchiveAppender::open(dir / "bad.tar.gz", 0, 6);
        ASSERT_TRUE(appender.has_value());
        ASSERT_TRUE(appender->append_file(dir / "payload.txt", "../escaped.txt").has_value());
        ASSERT_TRUE(appender->append_file(dir / "payload.txt", "/abs.txt").has_value());
        ASSERT_TRUE(appender->append_file(dir / "payload.txt", "ok/fine.txt").has_value());
        ASSERT_TRUE(appender->append_end_of_archive().has_value());
    }

    auto stats = archive::extract_archive(dir / "bad.tar.gz", dir / "dst");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->skipped, 2u);
    EXPECT_EQ(stats->files, 1u);
    EXPECT_FALSE(std::filesystem::exists(dir / "escaped.txt"));
    EXPECT_EQ(read_file(dir / "dst/ok/fine.txt"), "evil");
}

TEST(ExtractorTest, UnfinishedArchiveStillExtracts)
{
    TempDir dir;
    write_file(dir / "src/a.txt", "a");
    ferry::infra::Config config;
    config.progress = false;
    ASSERT_TRUE(ferry::core::ArchiveJob{config}.run({.source = dir / "src", .archive = dir / "x.tar.gz"}));
    strip_terminator(dir / "x.tar.gz");

    auto stats = archive::extract_archive(dir / "x.tar.gz", dir / "dst");
    ASSERT_TRUE(stats.has_value());
    EXPECT_FALSE(stats->terminated);
    EXPECT_EQ(read_file(dir / "dst/src/a.txt"), "a");
}

TEST(ExtractorTest, TruncatedArchiveIsAnError)
{
    TempDir dir;
    write_file(dir / "src/a.txt", std::string(5000, 'a'));
    ferry::infra::Config config;
    config.progress = false;
    ASSERT_TRUE(ferry::core::ArchiveJob{config}.run({.source = dir / "src", .archive = dir / "x.tar.gz"}));
    std::filesystem::resize_file(dir / "x.tar.gz", 20);

    auto stats = archive::extract_archive(dir / "x.tar.gz", dir / "dst");
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::ArchiveIOFailure);
}

TEST(ExtractorTest, SymlinkPointingOutsideIsNotFollowed)
{
    TempDir dir;
    std::filesystem::create_directories(dir / "outside");
    write_tar_gz(dir / "evil.tar.gz", {
        {symlink_entry("link", (dir / "outside").string()), ""},
        {file_entry("link/x"), "escaped"},
        {symlink_entry("up", "../outside"), ""},
        {file_entry("up/y"), "escaped"},
    });

    auto stats = archive::extract_archive(dir / "evil.tar.gz", dir / "dst");
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats->skipped, 2u);
    EXPECT_FALSE(std::filesystem::exists(dir / "outside/x"));
    EXPECT_FALSE(std::filesystem::exists(dir / "outside/y"));
    EXPECT_FALSE(std::filesystem::is_symlink(dir / "dst/link"));
    EXPECT_FALSE(std::filesystem::is_symlink(dir / "dst/up"));
    EXPECT_EQ(read_file(dir / "dst/link/x"), "escaped");
}

TEST(ExtractorTest, NothingIsWrittenThroughSymlinks)
{
    TempDir dir;
    write_file(dir / "outside/victim.txt", "original");
    std::filesystem::create_directories(dir / "dst");
    std::filesystem::create_directory_symlink(dir / "outside", dir / "dst/pre");
    std::filesystem::create_symlink(dir / "outside/victim.txt", dir / "dst/victim.txt");
    write_tar_gz(dir / "links.tar.gz", {
        {file_entry("inner/keep.txt"), "kept"},
        {symlink_entry("alias", "inner"), ""},
        {file_entry("alias/x"), "through alias"},
        {file_entry("pre/y"), "through pre"},
        {file_entry("victim.txt"), "replaced"},
    });

    auto stats = archive::extract_archive(dir / "links.tar.gz", dir / "dst");
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats->skipped, 2u);
    EXPECT_TRUE(std::filesystem::is_symlink(dir / "dst/alias"));
    EXPECT_FALSE(std::filesystem::exists(dir / "dst/inner/x"));
    EXPECT_FALSE(std::filesystem::exists(dir / "outside/y"));
    EXPECT_EQ(read_file(dir / "outside/victim.txt"), "original");
    EXPECT_FALSE(std::filesystem::is_symlink(dir / "dst/victim.txt"));
    EXPECT_EQ(read_file(dir / "dst/victim.txt"), "replaced");
}
