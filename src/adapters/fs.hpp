#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace ferry::adapters::fs {

// Владеющая обёртка над POSIX-дескриптором
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }
    explicit operator bool() const { return valid(); }

    auto release() -> int {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

[[nodiscard]] auto open_read(const std::filesystem::path& path)
    -> std::expected<UniqueFd, infra::Error>;

// O_WRONLY | O_CREAT, без O_TRUNC: позиция записи выставляется вызывающим
[[nodiscard]] auto open_write(const std::filesystem::path& path)
    -> std::expected<UniqueFd, infra::Error>;

// Writes the whole buffer, retrying on EINTR and short writes.
[[nodiscard]] auto write_all(int fd, const void* data, std::size_t size,
                             const std::filesystem::path& path)
    -> std::expected<void, infra::Error>;

// Reads up to size bytes; returns fewer only at end of file.
[[nodiscard]] auto read_full(int fd, void* data, std::size_t size,
                             const std::filesystem::path& path)
    -> std::expected<std::size_t, infra::Error>;

[[nodiscard]] auto sync_fd(int fd, const std::filesystem::path& path)
    -> std::expected<void, infra::Error>;

// fsync of the directory entry, needed after rename/create
[[nodiscard]] auto sync_directory(const std::filesystem::path& dir)
    -> std::expected<void, infra::Error>;

[[nodiscard]] auto truncate_fd(int fd, std::uint64_t size,
                               const std::filesystem::path& path)
    -> std::expected<void, infra::Error>;

[[nodiscard]] auto seek_end(int fd, const std::filesystem::path& path)
    -> std::expected<std::uint64_t, infra::Error>;

// write-temp + fsync + rename + fsync(dir)
[[nodiscard]] auto atomic_write_file(const std::filesystem::path& path,
                                     std::string_view contents)
    -> std::expected<void, infra::Error>;

// Buffered copy into "<dst>.part", fsync, then rename over dst.
[[nodiscard]] auto copy_file_atomic(const std::filesystem::path& src,
                                    const std::filesystem::path& dst)
    -> std::expected<std::uint64_t, infra::Error>;

} // namespace ferry::adapters::fs
