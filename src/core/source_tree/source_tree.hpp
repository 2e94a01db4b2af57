#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace ferry::core {

struct SourceFile {
    std::string relative;             // '/'-separated, relative to the root
    std::filesystem::path absolute;
    std::uint64_t size = 0;
};

struct SourceTree {
    std::filesystem::path root;
    std::vector<SourceFile> files;   // sorted by relative path
    std::uint64_t total_bytes = 0;
    std::uint64_t unreadable = 0;    // entries skipped during the walk
};

struct SourceScanOptions {
    bool follow_symlinks = false;
    std::vector<std::string> exclude_patterns;    // regex, matched against the file name
    std::vector<std::filesystem::path> skip_paths; // never enumerated (archive, sidecar, lock)
};

// Regular files under root, walked fresh every time. Unreadable directories
// and files are logged and skipped; a missing or non-directory root is fatal.
[[nodiscard]] auto scan_source_tree(const std::filesystem::path& root,
                                    const SourceScanOptions& options)
    -> std::expected<SourceTree, infra::Error>;

} // namespace ferry::core
