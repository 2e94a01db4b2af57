#include "fs.hpp"

#include <cerrno>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry::adapters::fs {

namespace {

constexpr std::size_t copy_buffer_size = 1024 * 1024;

auto temp_sibling(const std::filesystem::path& path, std::string_view suffix)
    -> std::filesystem::path
{
    auto tmp = path;
    tmp += fmt::format(".{}{}", ::getpid(), suffix);
    return tmp;
}

} // namespace

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            spdlog::debug("close({}) failed: errno {}", fd_, errno);
        }
    }
    fd_ = fd;
}

auto open_read(const std::filesystem::path& path)
    -> std::expected<UniqueFd, infra::Error>
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        auto code = err == ENOENT ? infra::ErrorCode::FileNotFound
                  : err == EACCES ? infra::ErrorCode::PermissionDenied
                  : infra::ErrorCode::Unknown;
        return std::unexpected(infra::make_errno_error(
            code, err, fmt::format("Cannot open {}", path.string())));
    }
    return UniqueFd{fd};
}

auto open_write(const std::filesystem::path& path)
    -> std::expected<UniqueFd, infra::Error>
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        auto code = err == EACCES ? infra::ErrorCode::PermissionDenied
                                  : infra::ErrorCode::Unknown;
        return std::unexpected(infra::make_errno_error(
            code, err, fmt::format("Cannot open {} for writing", path.string())));
    }
    return UniqueFd{fd};
}

auto write_all(int fd, const void* data, std::size_t size,
               const std::filesystem::path& path)
    -> std::expected<void, infra::Error>
{
    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_errno_error(
                infra::ErrorCode::ArchiveIOFailure, errno,
                fmt::format("Write to {} failed", path.string())));
        }
        p += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

auto read_full(int fd, void* data, std::size_t size,
               const std::filesystem::path& path)
    -> std::expected<std::size_t, infra::Error>
{
    auto* p = static_cast<char*>(data);
    std::size_t total = 0;
    while (total < size) {
        ssize_t n = ::read(fd, p + total, size - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_errno_error(
                infra::ErrorCode::SourceUnreadable, errno,
                fmt::format("Read from {} failed", path.string())));
        }
        if (n == 0) break; // EOF
        total += static_cast<std::size_t>(n);
    }
    return total;
}

auto sync_fd(int fd, const std::filesystem::path& path)
    -> std::expected<void, infra::Error>
{
    while (::fsync(fd) != 0) {
        if (errno == EINTR) continue;
        return std::unexpected(infra::make_errno_error(
            infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("fsync of {} failed", path.string())));
    }
    return {};
}

auto sync_directory(const std::filesystem::path& dir)
    -> std::expected<void, infra::Error>
{
    const auto target = dir.empty() ? std::filesystem::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(infra::make_errno_error(
            infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot open directory {}", target.string())));
    }
    UniqueFd guard{fd};
    return sync_fd(guard.get(), target);
}

auto truncate_fd(int fd, std::uint64_t size, const std::filesystem::path& path)
    -> std::expected<void, infra::Error>
{
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return std::unexpected(infra::make_errno_error(
            infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot truncate {} to {} bytes", path.string(), size)));
    }
    if (::lseek(fd, static_cast<off_t>(size), SEEK_SET) < 0) {
        return std::unexpected(infra::make_errno_error(
            infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot seek {} to {}", path.string(), size)));
    }
    return {};
}

auto seek_end(int fd, const std::filesystem::path& path)
    -> std::expected<std::uint64_t, infra::Error>
{
    off_t pos = ::lseek(fd, 0, SEEK_END);
    if (pos < 0) {
        return std::unexpected(infra::make_errno_error(
            infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot seek to end of {}", path.string())));
    }
    return static_cast<std::uint64_t>(pos);
}

auto atomic_write_file(const std::filesystem::path& path, std::string_view contents)
    -> std::expected<void, infra::Error>
{
    const auto tmp = temp_sibling(path, ".tmp");
    {
        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            return std::unexpected(infra::make_errno_error(
                infra::ErrorCode::ArchiveIOFailure, errno,
                fmt::format("Cannot create {}", tmp.string())));
        }
        UniqueFd out{fd};
        auto written = write_all(out.get(), contents.data(), contents.size(), tmp)
            .and_then([&] { return sync_fd(out.get(), tmp); });
        if (!written) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return written;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("Cannot rename {} to {}: {}", tmp.string(), path.string(), ec.message())));
    }
    return sync_directory(path.parent_path());
}

auto copy_file_atomic(const std::filesystem::path& src, const std::filesystem::path& dst)
    -> std::expected<std::uint64_t, infra::Error>
{
    auto in = open_read(src);
    if (!in) {
        return std::unexpected(std::move(in.error()));
    }

    const auto part = temp_sibling(dst, ".part");
    int fd = ::open(part.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(infra::make_errno_error(
            infra::ErrorCode::PermissionDenied, errno,
            fmt::format("Cannot create {}", part.string())));
    }
    UniqueFd out{fd};

    auto fail = [&](infra::Error err) -> std::expected<std::uint64_t, infra::Error> {
        out.reset();
        std::error_code ec;
        std::filesystem::remove(part, ec);
        return std::unexpected(std::move(err));
    };

    std::vector<char> buffer(copy_buffer_size);
    std::uint64_t copied = 0;
    while (true) {
        auto rd = read_full(in->get(), buffer.data(), buffer.size(), src);
        if (!rd) return fail(std::move(rd.error()));
        if (*rd == 0) break;
        if (auto wr = write_all(out.get(), buffer.data(), *rd, part); !wr) {
            return fail(std::move(wr.error()));
        }
        copied += *rd;
    }
    if (auto synced = sync_fd(out.get(), part); !synced) {
        return fail(std::move(synced.error()));
    }
    out.reset();

    std::error_code ec;
    std::filesystem::rename(part, dst, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(part, ignored);
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot rename {} to {}: {}", part.string(), dst.string(), ec.message())));
    }
    if (auto synced = sync_directory(dst.parent_path()); !synced) {
        return std::unexpected(std::move(synced.error()));
    }
    return copied;
}

} // namespace ferry::adapters::fs
