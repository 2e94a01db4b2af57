#include "resume_planner.hpp"

#include <unordered_set>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "extensions/progress_record.hpp"

namespace ferry::core {

namespace archive = adapters::archive;

namespace {

auto trim_slashes(std::string_view name) -> std::string_view {
    while (name.starts_with("./")) name.remove_prefix(2);
    while (!name.empty() && name.front() == '/') name.remove_prefix(1);
    while (!name.empty() && name.back() == '/') name.remove_suffix(1);
    return name;
}

struct Reconciled {
    std::vector<extensions::ProgressEntry> entries;   // rebuilt from the table of contents
    std::unordered_set<std::string> archived;
    std::size_t foreign = 0;
};

auto reconcile_toc(const archive::TableOfContents& toc, const std::string& prefix) -> Reconciled {
    Reconciled out;
    std::uint64_t cumulative = 0;
    for (const auto& entry : toc.entries) {
        if (entry.type == archive::EntryType::Directory) continue;

        auto relative = relative_from_member(prefix, entry.name);
        if (relative.empty()) {
            spdlog::warn("Archive member outside '{}' left untouched: {}", prefix, entry.name);
            ++out.foreign;
            continue;
        }
        if (!out.archived.insert(relative).second) {
            spdlog::warn("Duplicate archive member: {}", entry.name);
            continue;
        }
        cumulative += entry.size;
        out.entries.push_back(extensions::ProgressEntry{
            .end_offset = entry.member_end, .cumulative_bytes = cumulative, .path = std::move(relative)});
    }
    return out;
}

auto same_entries(const std::vector<extensions::ProgressEntry>& a,
                  const std::vector<extensions::ProgressEntry>& b) -> bool
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].path != b[i].path || a[i].end_offset != b[i].end_offset ||
            a[i].cumulative_bytes != b[i].cumulative_bytes) {
            return false;
        }
    }
    return true;
}

// Sidecar is subordinate: drop what the archive does not back, adopt what it missed.
auto sync_sidecar(const std::filesystem::path& sidecar,
                  const std::optional<extensions::ProgressRecord>& loaded,
                  const Reconciled& reconciled,
                  ResumePlan& plan) -> std::expected<void, infra::Error>
{
    std::unordered_set<std::string> claimed;
    bool torn = false;
    if (loaded) {
        const auto& record = *loaded;
        torn = record.torn_last_line;
        for (const auto& entry : record.entries) {
            claimed.insert(entry.path);
            if (!reconciled.archived.contains(entry.path)) {
                (void)infra::log_and_return(infra::make_error(infra::ErrorCode::ReconciliationMismatch,
                    fmt::format("{} claims '{}' but the archive does not contain it; claim discarded",
                                sidecar.string(), entry.path)));
                ++plan.stale_claims;
            }
        }
        if (torn) {
            spdlog::warn("Discarded interrupted last line of {}", sidecar.string());
        }
    }
    for (const auto& entry : reconciled.entries) {
        if (!claimed.contains(entry.path)) {
            spdlog::debug("Adopting unrecorded archive member {}", entry.path);
            ++plan.adopted;
        }
    }
    if (plan.adopted > 0) {
        spdlog::info("Adopted {} archived entries missing from {}", plan.adopted, sidecar.string());
    }

    const bool up_to_date = loaded && !torn && same_entries(loaded->entries, reconciled.entries);
    if (up_to_date) {
        return {};
    }
    if (!loaded && !plan.archive_exists) {
        // свежая сборка: sidecar создаст builder
        return {};
    }

    auto rewritten = extensions::rewrite_progress_record(sidecar, reconciled.entries);
    if (!rewritten) {
        return std::unexpected(std::move(rewritten.error()));
    }
    plan.sidecar_rewritten = true;
    spdlog::debug("Rewrote {} with {} entries", sidecar.string(), reconciled.entries.size());
    return {};
}

// A damaged last member is only dropped when the sidecar proves it was never synced.
auto check_damaged_tail(const std::filesystem::path& archive_path,
                        const std::filesystem::path& sidecar,
                        const archive::TableOfContents& toc,
                        const std::optional<extensions::ProgressRecord>& loaded)
    -> std::expected<void, infra::Error>
{
    if (!loaded) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("{}: corrupt gzip member at byte offset {}: {}; without {} it cannot be "
                        "told apart from damage to committed data",
                        archive_path.string(), toc.committed_end, toc.tail_damage, sidecar.string())));
    }
    if (loaded->recorded_end() > toc.committed_end) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("{}: corrupt gzip member at byte offset {}: {}; {} records data synced up to byte {}",
                        archive_path.string(), toc.committed_end, toc.tail_damage, sidecar.string(),
                        loaded->recorded_end())));
    }
    spdlog::warn("{}: unsynced member at byte offset {} does not decode ({}); treating it as an interrupted append",
                 archive_path.string(), toc.committed_end, toc.tail_damage);
    return {};
}

} // namespace

auto member_name_for(const std::string& prefix, const std::string& relative) -> std::string {
    auto clean_prefix = trim_slashes(prefix);
    if (clean_prefix.empty()) return relative;
    return fmt::format("{}/{}", clean_prefix, relative);
}

auto relative_from_member(const std::string& prefix, const std::string& member) -> std::string {
    const auto name = trim_slashes(member);
    const auto clean_prefix = trim_slashes(prefix);
    if (clean_prefix.empty()) return std::string{name};
    if (name.size() <= clean_prefix.size() + 1 || !name.starts_with(clean_prefix) ||
        name[clean_prefix.size()] != '/') {
        return {};
    }
    return std::string{name.substr(clean_prefix.size() + 1)};
}

auto plan_resume(const SourceTree& tree,
                 const std::filesystem::path& archive_path,
                 const std::string& member_prefix)
    -> std::expected<ResumePlan, infra::Error>
{
    ResumePlan plan;

    std::error_code ec;
    plan.archive_exists = std::filesystem::exists(archive_path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            fmt::format("Cannot stat archive {}: {}", archive_path.string(), ec.message())));
    }

    const auto sidecar = extensions::sidecar_path_for(archive_path);
    auto loaded = extensions::load_progress_record(sidecar);
    if (!loaded) {
        return std::unexpected(std::move(loaded.error()));
    }

    archive::TableOfContents toc;
    if (plan.archive_exists) {
        auto scanned = archive::scan_archive(archive_path);
        if (!scanned) {
            return std::unexpected(std::move(scanned.error()));
        }
        toc = std::move(*scanned);

        if (toc.tail == archive::TailState::Damaged) {
            if (auto checked = check_damaged_tail(archive_path, sidecar, toc, *loaded); !checked) {
                return std::unexpected(std::move(checked.error()));
            }
        }
        if (toc.tail != archive::TailState::Clean) {
            plan.recovered_tail_bytes = toc.uncommitted_bytes();
            spdlog::warn("{}: {} uncommitted bytes after offset {} will be discarded",
                         archive_path.string(), plan.recovered_tail_bytes, toc.committed_end);
        }
        plan.archive_complete = toc.is_complete();
        plan.append_offset = toc.append_offset();
    }

    auto reconciled = reconcile_toc(toc, member_prefix);
    plan.archived_members = reconciled.entries.size();
    plan.foreign_members = reconciled.foreign;
    plan.committed_bytes = reconciled.entries.empty() ? 0 : reconciled.entries.back().cumulative_bytes;

    auto synced = sync_sidecar(sidecar, *loaded, reconciled, plan);
    if (!synced) {
        return std::unexpected(std::move(synced.error()));
    }

    for (const auto& file : tree.files) {
        if (reconciled.archived.contains(file.relative)) {
            ++plan.already_archived;
        } else {
            plan.work_list.push_back(file);
        }
    }

    spdlog::info("Plan for {}: {} to append, {} already archived{}",
                 archive_path.string(), plan.work_list.size(), plan.already_archived,
                 plan.archive_exists ? "" : " (fresh build)");
    return plan;
}

} // namespace ferry::core
