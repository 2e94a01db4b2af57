#include "file_lock.hpp"

#include <cerrno>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace ferry::infra {

auto lock_path_for(const std::filesystem::path& archive) -> std::filesystem::path {
    auto path = archive;
    path += ".lock";
    return path;
}

auto FileLock::acquire(const std::filesystem::path& lock_path)
    -> std::expected<FileLock, Error>
{
    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(make_errno_error(ErrorCode::PermissionDenied, errno,
            fmt::format("Cannot open lock file {}", lock_path.string())));
    }
    adapters::fs::UniqueFd guard{fd};

    while (::flock(guard.get(), LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) continue;
        if (errno == EWOULDBLOCK) {
            return std::unexpected(make_error(ErrorCode::ConcurrentRunDetected,
                fmt::format("Another build of this archive is already in progress (lock held on {})",
                            lock_path.string())));
        }
        return std::unexpected(make_errno_error(ErrorCode::PermissionDenied, errno,
            fmt::format("Cannot lock {}", lock_path.string())));
    }

    spdlog::debug("Acquired lock {}", lock_path.string());
    return FileLock{std::move(guard), lock_path};
}

} // namespace ferry::infra
