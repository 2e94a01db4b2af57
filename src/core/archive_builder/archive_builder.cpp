#include "archive_builder.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/archive/appender.hpp"
#include "extensions/progress_record.hpp"
#include "infra/interrupt.hpp"

namespace ferry::core {

ArchiveBuilder::ArchiveBuilder(const BuildOptions& options, infra::ProgressMonitor& monitor)
    : options_(options), monitor_(monitor) {}

auto ArchiveBuilder::run(const ResumePlan& plan, const std::filesystem::path& archive)
    -> std::expected<BuildStats, infra::Error>
{
    BuildStats stats{
        .already_archived = plan.already_archived,
        .stale_claims = plan.stale_claims,
        .recovered_tail_bytes = plan.recovered_tail_bytes,
    };

    if (plan.nothing_to_do()) {
        spdlog::info("Nothing to do: {} already holds all {} source files",
                     archive.string(), plan.already_archived);
        std::error_code ec;
        stats.archive_size = std::filesystem::file_size(archive, ec);
        stats.nothing_to_do = true;
        return stats;
    }

    auto appender = adapters::archive::ArchiveAppender::open(
        archive, plan.append_offset, options_.compression_level);
    if (!appender) {
        return std::unexpected(std::move(appender.error()));
    }

    auto progress = extensions::ProgressLog::open(extensions::sidecar_path_for(archive));
    if (!progress) {
        return std::unexpected(std::move(progress.error()));
    }

    std::uint64_t total_bytes = 0;
    for (const auto& file : plan.work_list) total_bytes += file.size;
    monitor_.set_total(plan.work_list.size(), total_bytes);

    std::uint64_t cumulative = plan.committed_bytes;
    for (const auto& file : plan.work_list) {
        if (infra::is_interrupted()) {
            spdlog::warn("Interrupted after {} of {} entries; {} stays resumable",
                         stats.files_appended, plan.work_list.size(), archive.string());
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                fmt::format("Interrupted while building {}", archive.string())));
        }

        const auto member = member_name_for(options_.member_prefix, file.relative);
        auto appended = appender->append_file(file.absolute, member);
        if (!appended) {
            if (appended.error().is_fatal()) {
                return std::unexpected(std::move(appended.error()));
            }
            (void)infra::log_and_return(std::move(appended.error()));
            ++stats.files_skipped;
            monitor_.skip(file.size);
            continue;
        }

        // архив уже синхронизирован, теперь можно фиксировать запись
        cumulative += appended->data_bytes;
        auto logged = progress->append(extensions::ProgressEntry{
            .end_offset = appended->end_offset,
            .cumulative_bytes = cumulative,
            .path = file.relative,
        });
        if (!logged) {
            return std::unexpected(std::move(logged.error()));
        }

        ++stats.files_appended;
        stats.bytes_appended += appended->data_bytes;
        monitor_.update(1, appended->data_bytes);
        spdlog::debug("Appended {} ({} bytes, archive at {})", member, appended->data_bytes,
                      appended->end_offset);
    }

    auto finished = appender->append_end_of_archive();
    if (!finished) {
        return std::unexpected(std::move(finished.error()));
    }
    stats.archive_size = *finished;

    spdlog::info("Archive {} complete: {} appended ({}), {} skipped, {} already archived",
                 archive.string(), stats.files_appended, infra::format_bytes(stats.bytes_appended),
                 stats.files_skipped, stats.already_archived);
    return stats;
}

} // namespace ferry::core
