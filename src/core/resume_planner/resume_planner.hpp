#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include "adapters/archive/toc.hpp"
#include "core/source_tree/source_tree.hpp"
#include "infra/error_handler/error.hpp"

namespace ferry::core {

struct ResumePlan {
    std::vector<SourceFile> work_list;   // source order, not yet in the archive
    bool archive_exists = false;
    bool archive_complete = false;       // ends with an end-of-archive member, clean tail
    std::uint64_t append_offset = 0;     // where the builder starts writing
    std::uint64_t recovered_tail_bytes = 0;
    std::uint64_t committed_bytes = 0;   // file bytes of the archived members under the prefix

    std::size_t already_archived = 0;    // source files found in the archive
    std::size_t archived_members = 0;    // regular members under the prefix
    std::size_t foreign_members = 0;     // members outside the prefix
    std::size_t stale_claims = 0;        // sidecar lines the archive does not back
    std::size_t adopted = 0;             // archive members the sidecar missed
    bool sidecar_rewritten = false;

    [[nodiscard]] auto nothing_to_do() const -> bool {
        return archive_complete && work_list.empty();
    }
};

// "<prefix>/<relative>" or just "<relative>" for an empty prefix
[[nodiscard]] auto member_name_for(const std::string& prefix, const std::string& relative)
    -> std::string;

// Inverse of member_name_for; empty when the member lies outside the prefix.
[[nodiscard]] auto relative_from_member(const std::string& prefix, const std::string& member)
    -> std::string;

// Reconciles the source tree against the archive's own table of contents and
// brings the sidecar in line with it. Must run under the archive lock.
[[nodiscard]] auto plan_resume(const SourceTree& tree,
                               const std::filesystem::path& archive,
                               const std::string& member_prefix)
    -> std::expected<ResumePlan, infra::Error>;

} // namespace ferry::core
