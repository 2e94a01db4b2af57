#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "tar_format.hpp"
#include "infra/error_handler/error.hpp"

namespace ferry::adapters::archive {

struct TocEntry {
    std::string name;
    std::uint64_t size = 0;
    EntryType type = EntryType::Regular;
    std::uint64_t member_end = 0;  // archive offset of the gzip member holding the entry's end
};

enum class TailState {
    Clean,          // file ends on a member boundary
    Torn,           // last member is incomplete (interrupted append)
    TrailingZeros,  // zero bytes after the last member
    Damaged,        // last member does not decode and no intact member follows it
};

// What an archive actually contains, read from the archive itself.
struct TableOfContents {
    std::vector<TocEntry> entries;
    std::uint64_t file_size = 0;
    // End of the last gzip member that closes on a tar entry boundary.
    // Everything before it is committed.
    std::uint64_t committed_end = 0;
    // Start of a trailing member holding nothing but end-of-archive blocks.
    std::optional<std::uint64_t> terminator_offset;
    TailState tail = TailState::Clean;
    std::string tail_damage;  // decoder message for a Damaged tail
    std::uint64_t members = 0;

    // Where the next member goes: the terminator (if any) and torn bytes are dropped.
    [[nodiscard]] auto append_offset() const -> std::uint64_t {
        return terminator_offset.value_or(committed_end);
    }
    [[nodiscard]] auto is_complete() const -> bool {
        return tail == TailState::Clean && terminator_offset.has_value();
    }
    [[nodiscard]] auto uncommitted_bytes() const -> std::uint64_t {
        return file_size - committed_end;
    }
};

// Scans every gzip member of the archive and lists its tar entries.
// An incomplete last member is reported as a torn tail. A member at the
// committed end that does not decode is a Damaged tail when no intact member
// follows it (an unsynced write after a crash); otherwise, and for corruption
// anywhere else, the scan fails with ArchiveIOFailure carrying the byte offset.
[[nodiscard]] auto scan_archive(const std::filesystem::path& archive)
    -> std::expected<TableOfContents, infra::Error>;

} // namespace ferry::adapters::archive
