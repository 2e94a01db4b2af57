#include "gzip_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <unistd.h>

namespace ferry::adapters::archive {

namespace {

constexpr int gzip_window_bits = 15 + 16;  // zlib: +16 selects the gzip wrapper
constexpr std::size_t in_buffer_size = 256 * 1024;
constexpr std::size_t out_buffer_size = 256 * 1024;

auto zlib_message(const z_stream& strm, int ret) -> std::string {
    if (strm.msg != nullptr) {
        return strm.msg;
    }
    return fmt::format("zlib error {}", ret);
}

} // namespace

// =============== GzipMemberWriter ===============

GzipMemberWriter::GzipMemberWriter(int fd, std::filesystem::path path)
    : fd_(fd)
    , path_(std::move(path))
    , out_(out_buffer_size)
{}

GzipMemberWriter::~GzipMemberWriter() {
    if (initialized_) {
        deflateEnd(&strm_);
    }
}

auto GzipMemberWriter::open(int fd, std::filesystem::path path, int level)
    -> std::expected<std::unique_ptr<GzipMemberWriter>, infra::Error>
{
    std::unique_ptr<GzipMemberWriter> writer{new GzipMemberWriter(fd, std::move(path))};
    const int ret = deflateInit2(&writer->strm_, level, Z_DEFLATED, gzip_window_bits, 8,
                                 Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("deflateInit2 failed: {}", zlib_message(writer->strm_, ret))));
    }
    writer->initialized_ = true;
    return writer;
}

auto GzipMemberWriter::pump(int flush) -> std::expected<void, infra::Error> {
    do {
        strm_.next_out = out_.data();
        strm_.avail_out = static_cast<uInt>(out_.size());
        const int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                fmt::format("deflate failed: {}", zlib_message(strm_, ret))));
        }
        const std::size_t produced = out_.size() - strm_.avail_out;
        if (produced > 0) {
            if (auto wr = fs::write_all(fd_, out_.data(), produced, path_); !wr) {
                return wr;
            }
            bytes_out_ += produced;
        }
        if (flush == Z_FINISH && ret == Z_STREAM_END) {
            break;
        }
    } while (strm_.avail_out == 0 || (flush == Z_FINISH));
    return {};
}

auto GzipMemberWriter::write(const void* data, std::size_t size)
    -> std::expected<void, infra::Error>
{
    const auto* p = static_cast<const unsigned char*>(data);
    while (size > 0) {
        // avail_in is a uInt; feed large buffers in pieces
        const auto chunk = static_cast<uInt>(std::min<std::size_t>(size, 1u << 30));
        strm_.next_in = const_cast<unsigned char*>(p);
        strm_.avail_in = chunk;
        if (auto res = pump(Z_NO_FLUSH); !res) {
            return res;
        }
        p += chunk;
        size -= chunk;
    }
    return {};
}

auto GzipMemberWriter::finish() -> std::expected<void, infra::Error> {
    strm_.next_in = nullptr;
    strm_.avail_in = 0;
    return pump(Z_FINISH);
}

auto write_member(int fd, const std::filesystem::path& path, int level, std::string_view data)
    -> std::expected<std::uint64_t, infra::Error>
{
    auto writer = GzipMemberWriter::open(fd, path, level);
    if (!writer) {
        return std::unexpected(std::move(writer.error()));
    }
    auto res = (*writer)->write(data.data(), data.size())
        .and_then([&] { return (*writer)->finish(); });
    if (!res) {
        return std::unexpected(std::move(res.error()));
    }
    return (*writer)->bytes_out();
}

// =============== GzipMemberReader ===============

GzipMemberReader::GzipMemberReader(fs::UniqueFd fd, std::filesystem::path path, std::uint64_t size)
    : fd_(std::move(fd))
    , path_(std::move(path))
    , file_size_(size)
    , in_(in_buffer_size)
    , out_(out_buffer_size)
{}

GzipMemberReader::~GzipMemberReader() {
    if (initialized_) {
        inflateEnd(&strm_);
    }
}

auto GzipMemberReader::open(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<GzipMemberReader>, infra::Error>
{
    auto fd = fs::open_read(path);
    if (!fd) {
        return std::unexpected(std::move(fd.error()));
    }
    struct stat st;
    if (::fstat(fd->get(), &st) != 0) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot stat {}", path.string())));
    }

    std::unique_ptr<GzipMemberReader> reader{
        new GzipMemberReader(std::move(*fd), path, static_cast<std::uint64_t>(st.st_size))};
    reader->strm_.next_in = reader->in_.data();
    reader->strm_.avail_in = 0;
    const int ret = inflateInit2(&reader->strm_, gzip_window_bits);
    if (ret != Z_OK) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("inflateInit2 failed: {}", zlib_message(reader->strm_, ret))));
    }
    reader->initialized_ = true;
    return reader;
}

auto GzipMemberReader::fill(std::size_t at_least) -> std::expected<void, infra::Error> {
    if (strm_.avail_in >= at_least || eof_) {
        return {};
    }
    // Сдвигаем непрочитанный хвост в начало буфера
    if (strm_.avail_in > 0 && strm_.next_in != in_.data()) {
        std::memmove(in_.data(), strm_.next_in, strm_.avail_in);
    }
    strm_.next_in = in_.data();
    while (strm_.avail_in < at_least && !eof_) {
        auto rd = fs::read_full(fd_.get(), in_.data() + strm_.avail_in,
                                in_.size() - strm_.avail_in, path_);
        if (!rd) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                rd.error().message));
        }
        if (*rd == 0) {
            eof_ = true;
            break;
        }
        strm_.avail_in += static_cast<uInt>(*rd);
        read_pos_ += *rd;
    }
    return {};
}

auto GzipMemberReader::rest_is_zero() -> std::expected<bool, infra::Error> {
    while (true) {
        const auto* begin = strm_.next_in;
        const auto* end = begin + strm_.avail_in;
        if (std::any_of(begin, end, [](unsigned char c) { return c != 0; })) {
            return false;
        }
        strm_.next_in += strm_.avail_in;
        strm_.avail_in = 0;
        if (eof_) {
            return true;
        }
        if (auto res = fill(1); !res) {
            return std::unexpected(std::move(res.error()));
        }
        if (strm_.avail_in == 0) {
            return true;
        }
    }
}

auto GzipMemberReader::next_member(const MemberSink& sink)
    -> std::expected<MemberResult, infra::Error>
{
    if (auto res = fill(2); !res) {
        return std::unexpected(std::move(res.error()));
    }

    MemberResult result;
    result.start = position();

    if (strm_.avail_in == 0) {
        result.status = MemberStatus::EndOfFile;
        return result;
    }
    if (strm_.next_in[0] != 0x1f || (strm_.avail_in >= 2 && strm_.next_in[1] != 0x8b)) {
        auto zeros = rest_is_zero();
        if (!zeros) {
            return std::unexpected(std::move(zeros.error()));
        }
        if (*zeros) {
            result.status = MemberStatus::TrailingZeros;
            return result;
        }
        if (result.start == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedFeature,
                fmt::format("{} is not a gzip-compressed archive", path_.string())));
        }
        result.status = MemberStatus::Damaged;
        result.damage = "no gzip member header";
        return result;
    }
    if (strm_.avail_in < 2) {
        // один байт магии и конец файла
        result.status = MemberStatus::Truncated;
        return result;
    }

    inflateReset(&strm_);
    while (true) {
        if (strm_.avail_in == 0) {
            if (auto res = fill(1); !res) {
                return std::unexpected(std::move(res.error()));
            }
        }
        strm_.next_out = out_.data();
        strm_.avail_out = static_cast<uInt>(out_.size());
        const int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_OK || ret == Z_STREAM_END || ret == Z_BUF_ERROR) {
            const std::size_t produced = out_.size() - strm_.avail_out;
            if (produced > 0) {
                auto delivered = sink(std::string_view(reinterpret_cast<const char*>(out_.data()), produced));
                if (!delivered) {
                    return std::unexpected(std::move(delivered.error()));
                }
            }
        }

        switch (ret) {
            case Z_STREAM_END:
                result.status = MemberStatus::Complete;
                result.end = position();
                return result;
            case Z_OK:
                if (strm_.avail_in == 0 && eof_ && strm_.avail_out != 0) {
                    result.status = MemberStatus::Truncated;
                    return result;
                }
                continue;
            case Z_BUF_ERROR:
                if (strm_.avail_in == 0 && eof_) {
                    result.status = MemberStatus::Truncated;
                    return result;
                }
                continue;
            default:
                result.status = MemberStatus::Damaged;
                result.damage = zlib_message(strm_, ret);
                return result;
        }
    }
}

auto GzipMemberReader::seek(std::uint64_t offset) -> std::expected<void, infra::Error> {
    if (::lseek(fd_.get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot seek {} to {}", path_.string(), offset)));
    }
    read_pos_ = offset;
    eof_ = false;
    strm_.next_in = in_.data();
    strm_.avail_in = 0;
    return {};
}

auto find_complete_member(const std::filesystem::path& path, std::uint64_t from)
    -> std::expected<std::optional<std::uint64_t>, infra::Error>
{
    auto fd = fs::open_read(path);
    if (!fd) {
        return std::unexpected(std::move(fd.error()));
    }
    if (::lseek(fd->get(), static_cast<off_t>(from), SEEK_SET) < 0) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot seek {} to {}", path.string(), from)));
    }

    const MemberSink discard = [](std::string_view) -> std::expected<void, infra::Error> { return {}; };
    std::vector<unsigned char> buf(in_buffer_size);
    std::size_t carry = 0;          // bytes kept from the previous chunk
    std::uint64_t buf_offset = from;  // file offset of buf[0]

    while (true) {
        auto rd = fs::read_full(fd->get(), buf.data() + carry, buf.size() - carry, path);
        if (!rd) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                rd.error().message));
        }
        const std::size_t have = carry + *rd;
        const bool last = *rd == 0 || have < buf.size();
        // 1f 8b 08: gzip magic plus the deflate method byte
        const std::size_t scan_to = last ? have : have - 2;
        for (std::size_t i = 0; i < scan_to && i + 2 < have; ++i) {
            if (buf[i] != 0x1f || buf[i + 1] != 0x8b || buf[i + 2] != 0x08) continue;

            const std::uint64_t candidate = buf_offset + i;
            auto reader = GzipMemberReader::open(path);
            if (!reader) {
                return std::unexpected(std::move(reader.error()));
            }
            if (auto moved = (*reader)->seek(candidate); !moved) {
                return std::unexpected(std::move(moved.error()));
            }
            auto member = (*reader)->next_member(discard);
            if (!member) {
                return std::unexpected(std::move(member.error()));
            }
            if (member->status == MemberStatus::Complete) {
                return candidate;
            }
        }
        if (last) {
            return std::nullopt;
        }
        // магия может попасть на границу буфера
        std::memmove(buf.data(), buf.data() + have - 2, 2);
        carry = 2;
        buf_offset += have - 2;
    }
}

} // namespace ferry::adapters::archive
