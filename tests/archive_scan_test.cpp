#include <gtest/gtest.h>

#include "adapters/archive/appender.hpp"
#include "adapters/archive/toc.hpp"
#include "test_support.hpp"

namespace archive = ferry::adapters::archive;
using ferry::infra::ErrorCode;
using ferry::testing::TempDir;
using ferry::testing::read_file;
using ferry::testing::write_file;

namespace {

// a.txt, b.txt as two members, optionally terminated
void build_two_members(const TempDir& dir, bool terminate) {
    write_file(dir / "src/a.txt", std::string(10, 'a'));
    write_file(dir / "src/b.txt", std::string(20, 'b'));
    auto appender = archive::ArchiveAppender::open(dir / "out.tar.gz", 0, 6);
    ASSERT_TRUE(appender.has_value());
    ASSERT_TRUE(appender->append_file(dir / "src/a.txt", "src/a.txt").has_value());
    ASSERT_TRUE(appender->append_file(dir / "src/b.txt", "src/b.txt").has_value());
    if (terminate) {
        ASSERT_TRUE(appender->append_end_of_archive().has_value());
    }
}

void append_bytes(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out << bytes;
}

void overwrite_byte(const std::filesystem::path& path, std::uint64_t offset, char value) {
    std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
    f.seekp(static_cast<std::streamoff>(offset));
    f.put(value);
}

} // namespace

TEST(ArchiveScanTest, ListsMembersAndTerminator)
{
    TempDir dir;
    build_two_members(dir, true);

    auto toc = archive::scan_archive(dir / "out.tar.gz");
    ASSERT_TRUE(toc.has_value()) << toc.error().message;
    ASSERT_EQ(toc->entries.size(), 2u);
    EXPECT_EQ(toc->entries[0].name, "src/a.txt");
    EXPECT_EQ(toc->entries[0].size, 10u);
    EXPECT_EQ(toc->entries[1].name, "src/b.txt");
    EXPECT_EQ(toc->members, 3u);
    EXPECT_EQ(toc->tail, archive::TailState::Clean);
    ASSERT_TRUE(toc->terminator_offset.has_value());
    EXPECT_EQ(*toc->terminator_offset, toc->entries[1].member_end);
    EXPECT_TRUE(toc->is_complete());
    EXPECT_EQ(toc->append_offset(), toc->entries[1].member_end);
}

TEST(ArchiveScanTest, UnterminatedArchiveIsIncomplete)
{
    TempDir dir;
    build_two_members(dir, false);

    auto toc = archive::scan_archive(dir / "out.tar.gz");
    ASSERT_TRUE(toc.has_value());
    EXPECT_EQ(toc->entries.size(), 2u);
    EXPECT_FALSE(toc->terminator_offset.has_value());
    EXPECT_FALSE(toc->is_complete());
    EXPECT_EQ(toc->append_offset(), toc->file_size);
}

TEST(ArchiveScanTest, TornLastMemberIsRecoverable)
{
    TempDir dir;
    build_two_members(dir, false);
    const auto archive_path = dir / "out.tar.gz";
    const auto full = read_file(archive_path);
    const auto committed = full.size();

    // половина первого члена: заголовок gzip есть, хвоста нет
    auto first = archive::scan_archive(archive_path);
    ASSERT_TRUE(first.has_value());
    const auto first_member = full.substr(0, first->entries[0].member_end);
    append_bytes(archive_path, first_member.substr(0, first_member.size() / 2));

    auto toc = archive::scan_archive(archive_path);
    ASSERT_TRUE(toc.has_value()) << toc.error().message;
    EXPECT_EQ(toc->entries.size(), 2u);
    EXPECT_EQ(toc->tail, archive::TailState::Torn);
    EXPECT_EQ(toc->committed_end, committed);
    EXPECT_EQ(toc->uncommitted_bytes(), first_member.size() / 2);
    EXPECT_EQ(toc->append_offset(), committed);
}

TEST(ArchiveScanTest, TrailingZerosAreRecoverable)
{
    TempDir dir;
    build_two_members(dir, false);
    const auto archive_path = dir / "out.tar.gz";
    const auto committed = std::filesystem::file_size(archive_path);
    append_bytes(archive_path, std::string(4096, '\0'));

    auto toc = archive::scan_archive(archive_path);
    ASSERT_TRUE(toc.has_value());
    EXPECT_EQ(toc->tail, archive::TailState::TrailingZeros);
    EXPECT_EQ(toc->committed_end, committed);
}

TEST(ArchiveScanTest, UndecodableLastMemberIsDamagedTail)
{
    TempDir dir;
    build_two_members(dir, false);
    const auto archive_path = dir / "out.tar.gz";
    const auto committed = std::filesystem::file_size(archive_path);
    append_bytes(archive_path, read_file(archive_path).substr(0, 30) + std::string(4096, '\0'));

    auto toc = archive::scan_archive(archive_path);
    ASSERT_TRUE(toc.has_value()) << toc.error().message;
    EXPECT_EQ(toc->tail, archive::TailState::Damaged);
    EXPECT_FALSE(toc->tail_damage.empty());
    EXPECT_EQ(toc->entries.size(), 2u);
    EXPECT_EQ(toc->committed_end, committed);
    EXPECT_EQ(toc->append_offset(), committed);
    EXPECT_FALSE(toc->is_complete());
}

TEST(ArchiveScanTest, GarbageAtMemberBoundaryIsDamagedTail)
{
    TempDir dir;
    build_two_members(dir, false);
    const auto archive_path = dir / "out.tar.gz";
    const auto committed = std::filesystem::file_size(archive_path);
    append_bytes(archive_path, "\x07garbage" + std::string(512, '\0'));

    auto toc = archive::scan_archive(archive_path);
    ASSERT_TRUE(toc.has_value()) << toc.error().message;
    EXPECT_EQ(toc->tail, archive::TailState::Damaged);
    EXPECT_EQ(toc->committed_end, committed);
}

TEST(ArchiveScanTest, BadMagicMidArchiveIsFatal)
{
    TempDir dir;
    build_two_members(dir, true);
    const auto archive_path = dir / "out.tar.gz";
    auto toc = archive::scan_archive(archive_path);
    ASSERT_TRUE(toc.has_value());
    const auto second_start = toc->entries[0].member_end;

    overwrite_byte(archive_path, second_start, 'X');

    auto res = archive::scan_archive(archive_path);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ArchiveIOFailure);
    EXPECT_NE(res.error().message.find(std::to_string(second_start)), std::string::npos);
}

TEST(ArchiveScanTest, CrcMismatchIsFatal)
{
    TempDir dir;
    build_two_members(dir, true);
    const auto archive_path = dir / "out.tar.gz";
    auto toc = archive::scan_archive(archive_path);
    ASSERT_TRUE(toc.has_value());

    // CRC32 трейлера первого члена: 8 байт до его конца
    const auto crc_offset = toc->entries[0].member_end - 8;
    const auto original = read_file(archive_path)[crc_offset];
    overwrite_byte(archive_path, crc_offset, static_cast<char>(original ^ 0x5a));

    auto res = archive::scan_archive(archive_path);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ArchiveIOFailure);
}

TEST(ArchiveScanTest, PlainFileIsNotAnArchive)
{
    TempDir dir;
    write_file(dir / "plain.tar.gz", "this is not gzip at all");

    auto res = archive::scan_archive(dir / "plain.tar.gz");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::UnsupportedFeature);
}

TEST(ArchiveScanTest, EmptyFileHasNoEntries)
{
    TempDir dir;
    write_file(dir / "empty.tar.gz", "");

    auto toc = archive::scan_archive(dir / "empty.tar.gz");
    ASSERT_TRUE(toc.has_value());
    EXPECT_TRUE(toc->entries.empty());
    EXPECT_FALSE(toc->is_complete());
    EXPECT_EQ(toc->append_offset(), 0u);
}

TEST(ArchiveAppenderTest, UnreadableSourceLeavesArchiveUnchanged)
{
    TempDir dir;
    build_two_members(dir, false);
    const auto archive_path = dir / "out.tar.gz";
    const auto size = std::filesystem::file_size(archive_path);

    auto appender = archive::ArchiveAppender::open(archive_path, size, 6);
    ASSERT_TRUE(appender.has_value());
    auto res = appender->append_file(dir / "src/missing.txt", "src/missing.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SourceUnreadable);
    EXPECT_FALSE(res.error().is_fatal());
    EXPECT_EQ(std::filesystem::file_size(archive_path), size);
    EXPECT_EQ(appender->committed_end(), size);
}

TEST(ArchiveAppenderTest, OpenTruncatesPastStartOffset)
{
    TempDir dir;
    build_two_members(dir, true);
    const auto archive_path = dir / "out.tar.gz";
    auto toc = archive::scan_archive(archive_path);
    ASSERT_TRUE(toc.has_value());

    auto appender = archive::ArchiveAppender::open(archive_path, *toc->terminator_offset, 6);
    ASSERT_TRUE(appender.has_value());
    EXPECT_EQ(std::filesystem::file_size(archive_path), *toc->terminator_offset);
}
