#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/archive_builder/archive_builder.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace ferry::core {

struct ArchiveRequest {
    std::filesystem::path source;
    std::filesystem::path archive;
};

// lock -> scan -> plan -> build -> unlock. Idempotent: rerunning after any
// interruption resumes where the durable archive ends.
class ArchiveJob {
public:
    explicit ArchiveJob(const infra::Config& config);

    [[nodiscard]] auto run(const ArchiveRequest& request)
        -> std::expected<BuildStats, infra::Error>;

private:
    const infra::Config& config_;
};

// Configured prefix, or the source directory's own name.
[[nodiscard]] auto resolve_member_prefix(const infra::Config& config,
                                         const std::filesystem::path& source) -> std::string;

} // namespace ferry::core
