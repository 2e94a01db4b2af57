#include "archive_job.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/resume_planner/resume_planner.hpp"
#include "core/source_tree/source_tree.hpp"
#include "extensions/progress_record.hpp"
#include "infra/lock/file_lock.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace ferry::core {

auto resolve_member_prefix(const infra::Config& config, const std::filesystem::path& source)
    -> std::string
{
    if (config.member_prefix) {
        return *config.member_prefix;
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(source, ec);
    auto normal = (ec ? source : absolute).lexically_normal();
    if (!normal.has_filename()) normal = normal.parent_path();
    return normal.filename().string();
}

ArchiveJob::ArchiveJob(const infra::Config& config) : config_(config) {}

auto ArchiveJob::run(const ArchiveRequest& request) -> std::expected<BuildStats, infra::Error> {
    std::error_code ec;
    if (!std::filesystem::is_directory(request.source, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Source directory does not exist: {}", request.source.string())));
    }

    const auto parent = request.archive.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot create {}: {}", parent.string(), ec.message())));
        }
    }

    const auto lock_path = infra::lock_path_for(request.archive);
    auto lock = infra::FileLock::acquire(lock_path);
    if (!lock) {
        return std::unexpected(std::move(lock.error()));
    }

    SourceScanOptions scan_options{
        .follow_symlinks = config_.follow_symlinks,
        .exclude_patterns = config_.exclude_patterns,
        .skip_paths = {request.archive, extensions::sidecar_path_for(request.archive), lock_path},
    };
    auto tree = scan_source_tree(request.source, scan_options);
    if (!tree) {
        return std::unexpected(std::move(tree.error()));
    }
    spdlog::info("Source {}: {} files ({})", request.source.string(), tree->files.size(),
                 infra::format_bytes(tree->total_bytes));

    const BuildOptions build_options{
        .member_prefix = resolve_member_prefix(config_, request.source),
        .compression_level = config_.compression_level.value_or(infra::default_compression_level),
    };

    auto plan = plan_resume(*tree, request.archive, build_options.member_prefix);
    if (!plan) {
        return std::unexpected(std::move(plan.error()));
    }

    infra::ProgressMonitor monitor{"Archiving", config_.progress && !plan->nothing_to_do(), config_.quiet};
    ArchiveBuilder builder{build_options, monitor};
    auto stats = builder.run(*plan, request.archive);
    if (stats) {
        stats->files_skipped += tree->unreadable;
    }
    return stats;
}

} // namespace ferry::core
