#pragma once

// Multimember gzip I/O. Each gzip member is an independently decodable
// stream; a file made of concatenated members is still a valid gzip file.

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <zlib.h>
#include "adapters/fs.hpp"
#include "infra/error_handler/error.hpp"

namespace ferry::adapters::archive {

// Compresses one gzip member straight into an open file descriptor.
// z_stream keeps a pointer to itself, so instances live on the heap.
class GzipMemberWriter {
public:
    [[nodiscard]] static auto open(int fd, std::filesystem::path path, int level)
        -> std::expected<std::unique_ptr<GzipMemberWriter>, infra::Error>;

    ~GzipMemberWriter();
    GzipMemberWriter(const GzipMemberWriter&) = delete;
    GzipMemberWriter& operator=(const GzipMemberWriter&) = delete;

    [[nodiscard]] auto write(const void* data, std::size_t size)
        -> std::expected<void, infra::Error>;

    // Flushes the deflate stream and writes the gzip trailer.
    [[nodiscard]] auto finish() -> std::expected<void, infra::Error>;

    [[nodiscard]] auto bytes_out() const -> std::uint64_t { return bytes_out_; }

private:
    GzipMemberWriter(int fd, std::filesystem::path path);

    auto pump(int flush) -> std::expected<void, infra::Error>;

    int fd_;
    std::filesystem::path path_;
    z_stream strm_{};
    bool initialized_ = false;
    std::vector<unsigned char> out_;
    std::uint64_t bytes_out_ = 0;
};

enum class MemberStatus {
    Complete,       // member decoded up to its trailer, CRC verified
    EndOfFile,      // no bytes left where a member would start
    Truncated,      // file ends inside the member
    TrailingZeros,  // only zero bytes from member start to end of file
    Damaged,        // bytes do not decode (bad header, deflate data or CRC)
};

struct MemberResult {
    MemberStatus status = MemberStatus::EndOfFile;
    std::uint64_t start = 0;  // byte offset of the member in the file
    std::uint64_t end = 0;    // offset just past the member (Complete only)
    std::string damage;       // zlib's complaint (Damaged only)
};

using MemberSink = std::function<std::expected<void, infra::Error>(std::string_view)>;

// Decodes a file one gzip member at a time and reports the exact compressed
// byte range of every member.
class GzipMemberReader {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> std::expected<std::unique_ptr<GzipMemberReader>, infra::Error>;

    ~GzipMemberReader();
    GzipMemberReader(const GzipMemberReader&) = delete;
    GzipMemberReader& operator=(const GzipMemberReader&) = delete;

    // Inflates the next member and passes its decompressed bytes to sink.
    // Undecodable data is reported as Damaged; the reader is unusable after that.
    // A file that does not start with a gzip header is UnsupportedFeature.
    [[nodiscard]] auto next_member(const MemberSink& sink)
        -> std::expected<MemberResult, infra::Error>;

    [[nodiscard]] auto file_size() const -> std::uint64_t { return file_size_; }

    // Positions the reader so that the next member starts at offset.
    [[nodiscard]] auto seek(std::uint64_t offset) -> std::expected<void, infra::Error>;

private:
    GzipMemberReader(fs::UniqueFd fd, std::filesystem::path path, std::uint64_t size);

    auto position() const -> std::uint64_t { return read_pos_ - strm_.avail_in; }
    auto fill(std::size_t at_least) -> std::expected<void, infra::Error>;
    auto rest_is_zero() -> std::expected<bool, infra::Error>;

    fs::UniqueFd fd_;
    std::filesystem::path path_;
    std::uint64_t file_size_ = 0;
    std::uint64_t read_pos_ = 0;
    bool eof_ = false;
    z_stream strm_{};
    bool initialized_ = false;
    std::vector<unsigned char> in_;
    std::vector<unsigned char> out_;
};

// Writes data as a single complete gzip member.
[[nodiscard]] auto write_member(int fd, const std::filesystem::path& path, int level,
                                std::string_view data)
    -> std::expected<std::uint64_t, infra::Error>;

// Offset of the first gzip member at or after `from` that decodes completely,
// or nullopt if the rest of the file holds none.
[[nodiscard]] auto find_complete_member(const std::filesystem::path& path, std::uint64_t from)
    -> std::expected<std::optional<std::uint64_t>, infra::Error>;

} // namespace ferry::adapters::archive
