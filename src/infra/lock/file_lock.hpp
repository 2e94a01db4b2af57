#pragma once

#include <expected>
#include <filesystem>
#include "adapters/fs.hpp"
#include "../error_handler/error.hpp"

namespace ferry::infra {

// Exclusive, non-blocking flock(2) on a lock file. Released when destroyed
// (or when the process dies). The lock file itself is left on disk.
class FileLock {
public:
    // ConcurrentRunDetected if another process (or another FileLock) holds it.
    [[nodiscard]] static auto acquire(const std::filesystem::path& lock_path)
        -> std::expected<FileLock, Error>;

    FileLock(FileLock&&) = default;
    FileLock& operator=(FileLock&&) = default;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    FileLock(adapters::fs::UniqueFd fd, std::filesystem::path path)
        : fd_(std::move(fd)), path_(std::move(path)) {}

    adapters::fs::UniqueFd fd_;
    std::filesystem::path path_;
};

// "<archive>.lock"
[[nodiscard]] auto lock_path_for(const std::filesystem::path& archive) -> std::filesystem::path;

} // namespace ferry::infra
