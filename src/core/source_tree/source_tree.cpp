#include "source_tree.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace ferry::core {

namespace {

class Walker {
public:
    Walker(const std::filesystem::path& root, const SourceScanOptions& options)
        : root_(root), options_(options)
    {
        for (const auto& pattern : options.exclude_patterns) {
            try {
                excludes_.emplace_back(pattern);
            } catch (const std::regex_error& e) {
                spdlog::warn("Invalid exclude pattern '{}': {}", pattern, e.what());
            }
        }
        for (const auto& p : options.skip_paths) {
            std::error_code ec;
            auto canonical = std::filesystem::weakly_canonical(p, ec);
            const auto& resolved = ec ? p : canonical;
            skip_.push_back(SkipPath{.dir = resolved.parent_path(), .name = resolved.filename().string()});
        }
    }

    void walk(const std::filesystem::path& dir, SourceTree& tree) {
        // каталог канонизируем один раз, файлы сравниваем по имени
        std::vector<std::string> skip_here;
        if (!skip_.empty()) {
            std::error_code cec;
            auto canonical = std::filesystem::weakly_canonical(dir, cec);
            const auto& here = cec ? dir : canonical;
            for (const auto& skip : skip_) {
                if (skip.dir == here) skip_here.push_back(skip.name);
            }
        }

        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            (void)infra::log_and_return(infra::make_error(infra::ErrorCode::SourceUnreadable,
                fmt::format("Cannot read directory {}: {}", dir.string(), ec.message())));
            ++tree.unreadable;
            return;
        }

        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const auto& entry = *it;
            const auto& path = entry.path();

            if (is_excluded(path, skip_here)) continue;

            std::error_code st_ec;
            const auto link_status = entry.symlink_status(st_ec);
            if (st_ec) {
                skip_unreadable(path, st_ec, tree);
                continue;
            }

            if (std::filesystem::is_symlink(link_status)) {
                if (!options_.follow_symlinks) {
                    spdlog::debug("Skipping symlink {}", path.string());
                    continue;
                }
                const auto target = entry.status(st_ec);
                if (st_ec) {
                    skip_unreadable(path, st_ec, tree);
                    continue;
                }
                // каталоги по ссылкам не обходим: риск циклов
                if (std::filesystem::is_regular_file(target)) {
                    add_file(path, tree);
                }
                continue;
            }

            if (std::filesystem::is_directory(link_status)) {
                walk(path, tree);
            } else if (std::filesystem::is_regular_file(link_status)) {
                add_file(path, tree);
            } else {
                spdlog::debug("Skipping special file {}", path.string());
            }
        }
        if (ec) {
            (void)infra::log_and_return(infra::make_error(infra::ErrorCode::SourceUnreadable,
                fmt::format("Error while reading directory {}: {}", dir.string(), ec.message())));
            ++tree.unreadable;
        }
    }

private:
    struct SkipPath {
        std::filesystem::path dir;
        std::string name;
    };

    auto is_excluded(const std::filesystem::path& path, const std::vector<std::string>& skip_here) const
        -> bool
    {
        const auto name = path.filename().string();
        if (std::find(skip_here.begin(), skip_here.end(), name) != skip_here.end()) return true;
        for (const auto& re : excludes_) {
            if (std::regex_match(name, re)) return true;
        }
        return false;
    }

    void skip_unreadable(const std::filesystem::path& path, const std::error_code& ec, SourceTree& tree) {
        (void)infra::log_and_return(infra::make_error(infra::ErrorCode::SourceUnreadable,
            fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
        ++tree.unreadable;
    }

    void add_file(const std::filesystem::path& path, SourceTree& tree) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            skip_unreadable(path, ec, tree);
            return;
        }
        auto relative = path.lexically_relative(root_).generic_string();
        tree.files.push_back(SourceFile{.relative = std::move(relative), .absolute = path, .size = size});
        tree.total_bytes += size;
    }

    const std::filesystem::path& root_;
    const SourceScanOptions& options_;
    std::vector<std::regex> excludes_;
    std::vector<SkipPath> skip_;
};

} // namespace

auto scan_source_tree(const std::filesystem::path& root, const SourceScanOptions& options)
    -> std::expected<SourceTree, infra::Error>
{
    std::error_code ec;
    const auto status = std::filesystem::status(root, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Source does not exist: {}", root.string())));
    }
    if (!std::filesystem::is_directory(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Source is not a directory: {}", root.string())));
    }

    SourceTree tree;
    tree.root = root;
    Walker walker{root, options};
    walker.walk(root, tree);

    std::sort(tree.files.begin(), tree.files.end(),
              [](const SourceFile& a, const SourceFile& b) { return a.relative < b.relative; });

    spdlog::debug("Source tree {}: {} files, {} bytes, {} unreadable",
                  root.string(), tree.files.size(), tree.total_bytes, tree.unreadable);
    return tree;
}

} // namespace ferry::core
