#include "extractor.hpp"

#include <cerrno>
#include <optional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"
#include "gzip_stream.hpp"
#include "tar_format.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry::adapters::archive {

namespace {

// Returns the cleaned relative path or nullopt if the name escapes the destination.
auto safe_relative(const std::string& name) -> std::optional<std::filesystem::path> {
    std::filesystem::path p{name};
    if (p.is_absolute()) {
        return std::nullopt;
    }
    std::filesystem::path out;
    for (const auto& part : p) {
        if (part == "..") return std::nullopt;
        if (part == "." || part.empty()) continue;
        out /= part;
    }
    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

// A link target may not leave the tree it is extracted into.
auto safe_link_target(const std::string& target) -> bool {
    std::filesystem::path p{target};
    if (target.empty() || p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

// True if any existing component of destination/rel (below destination) is a symlink.
auto crosses_symlink(const std::filesystem::path& destination, const std::filesystem::path& rel)
    -> bool
{
    auto current = destination;
    for (const auto& part : rel) {
        current /= part;
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(current, ec);
        if (ec || !std::filesystem::exists(st)) {
            return false;
        }
        if (std::filesystem::is_symlink(st)) {
            return true;
        }
    }
    return false;
}

class DiskWriter final : public TarReceiver {
public:
    explicit DiskWriter(std::filesystem::path destination)
        : destination_(std::move(destination)) {}

    auto on_entry(const TarEntry& entry) -> std::expected<void, infra::Error> override {
        current_ = entry;
        out_.reset();
        target_.clear();

        auto rel = safe_relative(entry.name);
        if (!rel) {
            spdlog::warn("Skipping unsafe member name: {}", entry.name);
            ++stats_.skipped;
            return {};
        }
        // Только родительские компоненты: сам target может быть заменён
        if (crosses_symlink(destination_, rel->parent_path())) {
            spdlog::warn("Skipping member below a symlink: {}", entry.name);
            ++stats_.skipped;
            return {};
        }
        target_ = destination_ / *rel;

        std::error_code ec;
        switch (entry.type) {
            case EntryType::Directory:
                if (std::filesystem::is_symlink(std::filesystem::symlink_status(target_, ec))) {
                    spdlog::warn("Skipping directory that is a symlink on disk: {}", entry.name);
                    ++stats_.skipped;
                    target_.clear();
                    return {};
                }
                std::filesystem::create_directories(target_, ec);
                if (ec) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                        fmt::format("Cannot create {}: {}", target_.string(), ec.message())));
                }
                ++stats_.directories;
                return {};
            case EntryType::Regular:
                return open_target();
            case EntryType::Symlink:
                if (!safe_link_target(entry.linkname)) {
                    spdlog::warn("Skipping symlink {} with unsafe target {}", entry.name, entry.linkname);
                    ++stats_.skipped;
                    target_.clear();
                    return {};
                }
                std::filesystem::create_directories(target_.parent_path(), ec);
                std::filesystem::remove(target_, ec);
                std::filesystem::create_symlink(entry.linkname, target_, ec);
                if (ec) {
                    spdlog::warn("Cannot create symlink {}: {}", target_.string(), ec.message());
                    ++stats_.skipped;
                }
                target_.clear();
                return {};
            default:
                spdlog::warn("Skipping unsupported member type '{}': {}",
                             static_cast<char>(entry.type), entry.name);
                ++stats_.skipped;
                target_.clear();
                return {};
        }
    }

    auto on_data(std::string_view data) -> std::expected<void, infra::Error> override {
        if (!out_) {
            return {};  // skipped member, drain its data
        }
        if (auto wr = fs::write_all(out_.get(), data.data(), data.size(), target_); !wr) {
            return std::unexpected(infra::make_error(
                wr.error().code == infra::ErrorCode::DiskFull ? infra::ErrorCode::DiskFull
                                                              : infra::ErrorCode::PermissionDenied,
                wr.error().message));
        }
        stats_.bytes += data.size();
        return {};
    }

    auto on_entry_complete() -> std::expected<void, infra::Error> override {
        if (!out_) {
            return {};
        }
        if (::fchmod(out_.get(), static_cast<mode_t>(current_.mode)) != 0) {
            spdlog::warn("Cannot set mode of {}: errno {}", target_.string(), errno);
        }
        const struct timespec times[2] = {
            {.tv_sec = 0, .tv_nsec = UTIME_OMIT},
            {.tv_sec = static_cast<time_t>(current_.mtime), .tv_nsec = 0},
        };
        if (::futimens(out_.get(), times) != 0) {
            spdlog::warn("Cannot set mtime of {}: errno {}", target_.string(), errno);
        }
        out_.reset();
        ++stats_.files;
        return {};
    }

    [[nodiscard]] auto stats() -> ExtractStats& { return stats_; }

private:
    auto open_target() -> std::expected<void, infra::Error> {
        std::error_code ec;
        std::filesystem::create_directories(target_.parent_path(), ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot create {}: {}", target_.parent_path().string(), ec.message())));
        }
        // существующую ссылку заменяем файлом, а не пишем сквозь неё
        if (std::filesystem::is_symlink(std::filesystem::symlink_status(target_, ec))) {
            std::filesystem::remove(target_, ec);
        }
        int fd = ::open(target_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0600);
        if (fd < 0) {
            return std::unexpected(infra::make_errno_error(infra::ErrorCode::PermissionDenied, errno,
                fmt::format("Cannot create {}", target_.string())));
        }
        out_.reset(fd);
        return {};
    }

    std::filesystem::path destination_;
    std::filesystem::path target_;
    TarEntry current_;
    fs::UniqueFd out_;
    ExtractStats stats_;
};

} // namespace

auto extract_archive(const std::filesystem::path& archive,
                     const std::filesystem::path& destination)
    -> std::expected<ExtractStats, infra::Error>
{
    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot create {}: {}", destination.string(), ec.message())));
    }

    auto reader = GzipMemberReader::open(archive);
    if (!reader) {
        return std::unexpected(std::move(reader.error()));
    }

    DiskWriter writer{destination};
    TarStreamParser parser{writer};
    const MemberSink sink = [&parser](std::string_view data) { return parser.feed(data); };

    while (true) {
        auto member = (*reader)->next_member(sink);
        if (!member) {
            return std::unexpected(std::move(member.error()));
        }
        if (member->status == MemberStatus::Complete) {
            continue;
        }
        if (member->status == MemberStatus::Truncated) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                fmt::format("{} is truncated at byte offset {}", archive.string(), member->start)));
        }
        if (member->status == MemberStatus::Damaged) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                fmt::format("{}: corrupt gzip member at byte offset {}: {}",
                            archive.string(), member->start, member->damage)));
        }
        break;  // EndOfFile или нули в хвосте
    }
    if (!parser.at_entry_boundary()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("{} ends inside a tar entry", archive.string())));
    }

    auto& stats = writer.stats();
    stats.terminated = parser.zero_blocks() >= 2;
    if (!stats.terminated) {
        spdlog::warn("{} has no end-of-archive marker; it may be an unfinished build",
                     archive.string());
    }
    return stats;
}

} // namespace ferry::adapters::archive
