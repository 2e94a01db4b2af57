#pragma once

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "adapters/fs.hpp"
#include "infra/error_handler/error.hpp"

namespace ferry::extensions {

struct ProgressEntry {
    std::uint64_t end_offset = 0;        // archive size once this entry was synced
    std::uint64_t cumulative_bytes = 0;  // file bytes committed up to and including it
    std::string path;                    // relative to the source root
};

struct ProgressRecord {
    std::vector<ProgressEntry> entries;
    bool torn_last_line = false;  // the final line had no terminator and was dropped

    [[nodiscard]] auto committed_bytes() const -> std::uint64_t {
        return entries.empty() ? 0 : entries.back().cumulative_bytes;
    }
    // Highest archive offset the record says was synced.
    [[nodiscard]] auto recorded_end() const -> std::uint64_t {
        std::uint64_t end = 0;
        for (const auto& entry : entries) end = std::max(end, entry.end_offset);
        return end;
    }
};

// "<dir>/<name>.filelist.txt" for "<dir>/<name>.tar.gz" (also .tgz, .tar)
[[nodiscard]] auto sidecar_path_for(const std::filesystem::path& archive)
    -> std::filesystem::path;

[[nodiscard]] auto format_progress_line(const ProgressEntry& entry) -> std::string;

// nullopt if the sidecar does not exist.
[[nodiscard]] auto load_progress_record(const std::filesystem::path& sidecar)
    -> std::expected<std::optional<ProgressRecord>, infra::Error>;

// Full replacement via temp file + rename.
[[nodiscard]] auto rewrite_progress_record(const std::filesystem::path& sidecar,
                                           const std::vector<ProgressEntry>& entries)
    -> std::expected<void, infra::Error>;

// Append-only writer: each line is written and fsync'ed before append() returns.
class ProgressLog {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& sidecar)
        -> std::expected<ProgressLog, infra::Error>;

    [[nodiscard]] auto append(const ProgressEntry& entry) -> std::expected<void, infra::Error>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    ProgressLog(adapters::fs::UniqueFd fd, std::filesystem::path path)
        : fd_(std::move(fd)), path_(std::move(path)) {}

    adapters::fs::UniqueFd fd_;
    std::filesystem::path path_;
};

} // namespace ferry::extensions
