#include "toc.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "gzip_stream.hpp"

namespace ferry::adapters::archive {

namespace {

// Collects entries; they stay pending until the gzip member they end in is complete.
class TocCollector final : public TarReceiver {
public:
    auto on_entry(const TarEntry& entry) -> std::expected<void, infra::Error> override {
        current_ = TocEntry{.name = entry.name, .size = entry.size, .type = entry.type};
        return {};
    }
    auto on_data(std::string_view) -> std::expected<void, infra::Error> override {
        return {};
    }
    auto on_entry_complete() -> std::expected<void, infra::Error> override {
        pending_.push_back(std::move(current_));
        return {};
    }

    void commit(std::vector<TocEntry>& out, std::uint64_t member_end) {
        for (auto& entry : pending_) {
            entry.member_end = member_end;
            out.push_back(std::move(entry));
        }
        pending_.clear();
    }
    [[nodiscard]] auto pending() const -> std::size_t { return pending_.size(); }

private:
    TocEntry current_;
    std::vector<TocEntry> pending_;
};

} // namespace

auto scan_archive(const std::filesystem::path& archive)
    -> std::expected<TableOfContents, infra::Error>
{
    auto reader = GzipMemberReader::open(archive);
    if (!reader) {
        return std::unexpected(std::move(reader.error()));
    }

    TableOfContents toc;
    toc.file_size = (*reader)->file_size();

    TocCollector collector;
    TarStreamParser parser{collector};
    std::optional<std::uint64_t> zero_member_start;

    const MemberSink sink = [&parser](std::string_view data) { return parser.feed(data); };

    while (true) {
        const bool started_on_boundary = parser.at_entry_boundary();
        const auto entries_before = parser.entries();
        const auto zeros_before = parser.zero_blocks();

        auto member = (*reader)->next_member(sink);
        if (!member) {
            return std::unexpected(std::move(member.error()));
        }

        switch (member->status) {
            case MemberStatus::Complete: {
                ++toc.members;
                if (!parser.at_entry_boundary()) {
                    // tar entry continues in the next member
                    zero_member_start.reset();
                    continue;
                }
                collector.commit(toc.entries, member->end);
                toc.committed_end = member->end;
                const bool only_zero_blocks = started_on_boundary &&
                                              parser.entries() == entries_before &&
                                              parser.zero_blocks() > zeros_before;
                if (only_zero_blocks) {
                    if (!zero_member_start) zero_member_start = member->start;
                } else {
                    zero_member_start.reset();
                }
                continue;
            }
            case MemberStatus::EndOfFile:
                if (!parser.at_entry_boundary() || member->start != toc.committed_end) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                        fmt::format("{}: archive ends inside a tar entry (last complete entry ends at byte offset {})",
                                    archive.string(), toc.committed_end)));
                }
                toc.tail = TailState::Clean;
                break;
            case MemberStatus::Truncated:
            case MemberStatus::TrailingZeros:
                if (member->start != toc.committed_end) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                        fmt::format("{}: truncated tar entry spans several gzip members (from byte offset {} to {})",
                                    archive.string(), toc.committed_end, toc.file_size)));
                }
                toc.tail = member->status == MemberStatus::Truncated ? TailState::Torn
                                                                     : TailState::TrailingZeros;
                break;
            case MemberStatus::Damaged: {
                const auto corrupt = [&](std::string_view detail) {
                    return infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                        fmt::format("{}: corrupt gzip member at byte offset {}: {}{}",
                                    archive.string(), member->start, member->damage, detail));
                };
                if (member->start != toc.committed_end) {
                    return std::unexpected(corrupt(""));
                }
                auto follower = find_complete_member(archive, member->start + 1);
                if (!follower) {
                    return std::unexpected(std::move(follower.error()));
                }
                if (*follower) {
                    return std::unexpected(corrupt(
                        fmt::format(" (an intact member follows at byte offset {})", **follower)));
                }
                toc.tail = TailState::Damaged;
                toc.tail_damage = member->damage;
                break;
            }
        }
        break;
    }

    toc.terminator_offset = zero_member_start;
    spdlog::debug("Scanned {}: {} members, {} entries, committed up to byte {} of {}",
                  archive.string(), toc.members, toc.entries.size(), toc.committed_end, toc.file_size);
    return toc;
}

} // namespace ferry::adapters::archive
