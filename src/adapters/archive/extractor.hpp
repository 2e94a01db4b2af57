#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace ferry::adapters::archive {

struct ExtractStats {
    std::uint64_t files = 0;
    std::uint64_t directories = 0;
    std::uint64_t bytes = 0;
    std::uint64_t skipped = 0;
    bool terminated = false;  // end-of-archive blocks were present
};

// Unpacks a (multimember) .tar.gz under destination.
// Absolute member names and names containing ".." are skipped, as are symlinks
// pointing outside the tree and members that would be written through a symlink.
[[nodiscard]] auto extract_archive(const std::filesystem::path& archive,
                                   const std::filesystem::path& destination)
    -> std::expected<ExtractStats, infra::Error>;

} // namespace ferry::adapters::archive
