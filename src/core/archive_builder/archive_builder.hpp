#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include "core/resume_planner/resume_planner.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace ferry::core {

struct BuildOptions {
    std::string member_prefix;
    int compression_level = 6;
};

struct BuildStats {
    std::uint64_t files_appended = 0;
    std::uint64_t bytes_appended = 0;
    std::uint64_t files_skipped = 0;     // SourceUnreadable
    std::uint64_t already_archived = 0;
    std::uint64_t stale_claims = 0;
    std::uint64_t recovered_tail_bytes = 0;
    std::uint64_t archive_size = 0;
    bool nothing_to_do = false;
};

// Consumes a ResumePlan: one gzip member per file, archive fsync, then the
// sidecar line. Finishes with the end-of-archive member.
class ArchiveBuilder {
public:
    ArchiveBuilder(const BuildOptions& options, infra::ProgressMonitor& monitor);

    [[nodiscard]] auto run(const ResumePlan& plan, const std::filesystem::path& archive)
        -> std::expected<BuildStats, infra::Error>;

private:
    const BuildOptions& options_;
    infra::ProgressMonitor& monitor_;
};

} // namespace ferry::core
