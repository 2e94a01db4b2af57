#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include "adapters/fs.hpp"
#include "infra/error_handler/error.hpp"

namespace ferry::adapters::archive {

struct AppendedMember {
    std::uint64_t data_bytes = 0;  // file bytes stored
    std::uint64_t end_offset = 0;  // archive size after the member was synced
};

// Appends one gzip member per tar entry at the end of the archive.
// A member counts as committed only after the archive was fsync'ed; a failed
// append is truncated back to the last committed offset.
class ArchiveAppender {
public:
    // Opens (creating if needed) the archive and cuts it to start_offset,
    // dropping a torn tail or a previous end-of-archive member.
    [[nodiscard]] static auto open(const std::filesystem::path& archive,
                                   std::uint64_t start_offset,
                                   int compression_level)
        -> std::expected<ArchiveAppender, infra::Error>;

    ArchiveAppender(ArchiveAppender&&) = default;
    ArchiveAppender& operator=(ArchiveAppender&&) = default;

    // Errors: SourceUnreadable (entry skipped, archive unchanged) or
    // ArchiveIOFailure / DiskFull (fatal).
    [[nodiscard]] auto append_file(const std::filesystem::path& source,
                                   const std::string& member_name)
        -> std::expected<AppendedMember, infra::Error>;

    // Writes the two zero blocks as their own member so a later run can drop them.
    [[nodiscard]] auto append_end_of_archive() -> std::expected<std::uint64_t, infra::Error>;

    [[nodiscard]] auto committed_end() const -> std::uint64_t { return committed_; }

private:
    ArchiveAppender(fs::UniqueFd fd, std::filesystem::path path,
                    std::uint64_t committed, int level)
        : fd_(std::move(fd)), path_(std::move(path)), committed_(committed), level_(level) {}

    auto rollback() -> std::expected<void, infra::Error>;

    fs::UniqueFd fd_;
    std::filesystem::path path_;
    std::uint64_t committed_ = 0;
    int level_ = 6;
};

} // namespace ferry::adapters::archive
