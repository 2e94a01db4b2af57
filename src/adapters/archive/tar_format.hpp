#pragma once

// ustar/pax header encoding and a push-style tar stream parser.
// Layout follows POSIX.1-2001 (pax); GNU 'L' long names are accepted on read.

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace ferry::adapters::archive {

inline constexpr std::size_t block_size = 512;

using Block = std::array<char, block_size>;

enum class EntryType : char {
    Regular   = '0',
    HardLink  = '1',
    Symlink   = '2',
    CharDev   = '3',
    BlockDev  = '4',
    Directory = '5',
    Fifo      = '6',
    Other     = '?',
};

struct TarEntry {
    std::string name;
    std::uint64_t size = 0;
    std::uint32_t mode = 0644;
    std::uint64_t uid = 0;
    std::uint64_t gid = 0;
    std::int64_t mtime = 0;
    EntryType type = EntryType::Regular;
    std::string linkname;
};

[[nodiscard]] constexpr auto padded_size(std::uint64_t size) -> std::uint64_t {
    return (size + block_size - 1) / block_size * block_size;
}

// Headers for one entry: an optional pax 'x' header (plus its records) and the
// ustar header. The caller writes the data and padding afterwards.
[[nodiscard]] auto encode_headers(const TarEntry& entry) -> std::vector<char>;

// Two zero blocks.
[[nodiscard]] auto end_of_archive_blocks() -> std::vector<char>;

[[nodiscard]] auto is_zero_block(const char* block) -> bool;

// Receives entries and their data from TarStreamParser.
class TarReceiver {
public:
    virtual ~TarReceiver() = default;

    virtual auto on_entry(const TarEntry& entry) -> std::expected<void, infra::Error> = 0;
    virtual auto on_data(std::string_view data) -> std::expected<void, infra::Error> = 0;
    virtual auto on_entry_complete() -> std::expected<void, infra::Error> = 0;
};

// Incremental tar parser. Zero blocks are skipped instead of ending the stream,
// so concatenated tar streams read as one.
class TarStreamParser {
public:
    explicit TarStreamParser(TarReceiver& receiver) : receiver_(receiver) {}

    [[nodiscard]] auto feed(std::string_view data) -> std::expected<void, infra::Error>;

    // True when the parser is between entries (not inside a header's data,
    // not holding a pending extended header).
    [[nodiscard]] auto at_entry_boundary() const -> bool;

    [[nodiscard]] auto zero_blocks() const -> std::uint64_t { return zero_blocks_; }
    [[nodiscard]] auto entries() const -> std::uint64_t { return entries_; }

private:
    enum class State { Header, ExtendedData, EntryData, Padding };

    auto handle_header() -> std::expected<void, infra::Error>;
    auto apply_extended() -> std::expected<void, infra::Error>;

    TarReceiver& receiver_;
    State state_ = State::Header;
    Block block_{};
    std::size_t block_fill_ = 0;

    char ext_type_ = 0;
    std::string ext_data_;
    std::uint64_t ext_remaining_ = 0;

    std::optional<std::string> pending_path_;
    std::optional<std::string> pending_linkpath_;
    std::optional<std::uint64_t> pending_size_;
    std::optional<std::int64_t> pending_mtime_;

    std::uint64_t data_remaining_ = 0;
    std::uint64_t padding_remaining_ = 0;
    std::uint64_t zero_blocks_ = 0;
    std::uint64_t entries_ = 0;
};

} // namespace ferry::adapters::archive
