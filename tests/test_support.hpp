#pragma once

#include <gtest/gtest.h>

#include <stdexcept>
#include <stdlib.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "adapters/archive/toc.hpp"

namespace ferry::testing {

// mkdtemp-backed scratch directory, removed with everything in it.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "ferry-test-XXXXXX").string();
        if (::mkdtemp(tmpl.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline auto read_lines(const std::filesystem::path& path) -> std::vector<std::string> {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

// Member names in archive order; fails the test on a scan error.
inline auto toc_names(const std::filesystem::path& archive) -> std::vector<std::string> {
    auto toc = adapters::archive::scan_archive(archive);
    EXPECT_TRUE(toc.has_value()) << (toc ? "" : toc.error().message);
    std::vector<std::string> names;
    if (toc) {
        for (const auto& e : toc->entries) names.push_back(e.name);
    }
    return names;
}

// Drops the end-of-archive member, leaving the archive as a killed run would.
inline void strip_terminator(const std::filesystem::path& archive) {
    auto toc = adapters::archive::scan_archive(archive);
    ASSERT_TRUE(toc.has_value());
    ASSERT_TRUE(toc->terminator_offset.has_value());
    std::filesystem::resize_file(archive, *toc->terminator_offset);
}

} // namespace ferry::testing
