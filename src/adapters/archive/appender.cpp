#include "appender.hpp"

#include <cerrno>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "gzip_stream.hpp"
#include "tar_format.hpp"

#include <sys/stat.h>

namespace ferry::adapters::archive {

namespace {

constexpr std::size_t read_buffer_size = 1024 * 1024;

auto source_error(const std::filesystem::path& source, std::string_view what)
    -> infra::Error
{
    return infra::make_error(infra::ErrorCode::SourceUnreadable,
                             fmt::format("{}: {}", source.string(), what));
}

} // namespace

auto ArchiveAppender::open(const std::filesystem::path& archive,
                           std::uint64_t start_offset,
                           int compression_level)
    -> std::expected<ArchiveAppender, infra::Error>
{
    std::error_code ec;
    const bool existed = std::filesystem::exists(archive, ec);

    auto fd = fs::open_write(archive);
    if (!fd) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                                                 fd.error().message));
    }
    if (!existed) {
        if (auto synced = fs::sync_directory(archive.parent_path()); !synced) {
            return std::unexpected(std::move(synced.error()));
        }
    }

    auto size = fs::seek_end(fd->get(), archive);
    if (!size) {
        return std::unexpected(std::move(size.error()));
    }
    if (*size < start_offset) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("{} shrank to {} bytes, expected at least {}",
                        archive.string(), *size, start_offset)));
    }
    if (*size > start_offset) {
        spdlog::info("Dropping {} bytes past offset {} of {}",
                     *size - start_offset, start_offset, archive.string());
        auto cut = fs::truncate_fd(fd->get(), start_offset, archive)
            .and_then([&] { return fs::sync_fd(fd->get(), archive); });
        if (!cut) {
            return std::unexpected(std::move(cut.error()));
        }
    }

    return ArchiveAppender{std::move(*fd), archive, start_offset, compression_level};
}

auto ArchiveAppender::rollback() -> std::expected<void, infra::Error> {
    return fs::truncate_fd(fd_.get(), committed_, path_);
}

auto ArchiveAppender::append_file(const std::filesystem::path& source,
                                  const std::string& member_name)
    -> std::expected<AppendedMember, infra::Error>
{
    auto in = fs::open_read(source);
    if (!in) {
        return std::unexpected(source_error(source, in.error().message));
    }
    struct stat st;
    if (::fstat(in->get(), &st) != 0) {
        return std::unexpected(source_error(source, "cannot stat"));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(source_error(source, "no longer a regular file"));
    }

    TarEntry entry{
        .name = member_name,
        .size = static_cast<std::uint64_t>(st.st_size),
        .mode = static_cast<std::uint32_t>(st.st_mode & 07777),
        .uid = st.st_uid,
        .gid = st.st_gid,
        .mtime = st.st_mtim.tv_sec,
        .type = EntryType::Regular,
    };

    auto writer = GzipMemberWriter::open(fd_.get(), path_, level_);
    if (!writer) {
        return std::unexpected(std::move(writer.error()));
    }

    // Любая ошибка после начала записи: откатываемся к последней границе
    auto abort_entry = [this](infra::Error err) -> std::expected<AppendedMember, infra::Error> {
        if (auto undone = rollback(); !undone) {
            spdlog::error("Rollback of {} to offset {} failed: {}",
                          path_.string(), committed_, undone.error().message);
            return std::unexpected(std::move(undone.error()));
        }
        return std::unexpected(std::move(err));
    };

    const auto headers = encode_headers(entry);
    if (auto wr = (*writer)->write(headers.data(), headers.size()); !wr) {
        return abort_entry(std::move(wr.error()));
    }

    std::vector<char> buffer(read_buffer_size);
    std::uint64_t remaining = entry.size;
    while (remaining > 0) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        auto rd = fs::read_full(in->get(), buffer.data(), want, source);
        if (!rd) {
            return abort_entry(source_error(source, rd.error().message));
        }
        if (*rd == 0) {
            return abort_entry(source_error(source,
                fmt::format("file shrank while being read ({} of {} bytes)",
                            entry.size - remaining, entry.size)));
        }
        if (auto wr = (*writer)->write(buffer.data(), *rd); !wr) {
            return abort_entry(std::move(wr.error()));
        }
        remaining -= *rd;
    }

    const auto padding = padded_size(entry.size) - entry.size;
    if (padding > 0) {
        const std::vector<char> zeros(padding, '\0');
        if (auto wr = (*writer)->write(zeros.data(), zeros.size()); !wr) {
            return abort_entry(std::move(wr.error()));
        }
    }

    char probe = 0;
    if (auto extra = fs::read_full(in->get(), &probe, 1, source); extra && *extra > 0) {
        spdlog::warn("{} grew while being read; archived the first {} bytes",
                     source.string(), entry.size);
    }

    if (auto done = (*writer)->finish(); !done) {
        return abort_entry(std::move(done.error()));
    }
    if (auto synced = fs::sync_fd(fd_.get(), path_); !synced) {
        return abort_entry(std::move(synced.error()));
    }

    committed_ += (*writer)->bytes_out();
    return AppendedMember{.data_bytes = entry.size, .end_offset = committed_};
}

auto ArchiveAppender::append_end_of_archive() -> std::expected<std::uint64_t, infra::Error> {
    const auto blocks = end_of_archive_blocks();
    auto written = write_member(fd_.get(), path_, level_,
                                std::string_view(blocks.data(), blocks.size()));
    if (!written) {
        if (auto undone = rollback(); !undone) {
            return std::unexpected(std::move(undone.error()));
        }
        return std::unexpected(std::move(written.error()));
    }
    if (auto synced = fs::sync_fd(fd_.get(), path_); !synced) {
        return std::unexpected(std::move(synced.error()));
    }
    committed_ += *written;
    return committed_;
}

} // namespace ferry::adapters::archive
