#include "progress_record.hpp"

#include <cerrno>
#include <charconv>
#include <fstream>
#include <sstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

namespace ferry::extensions {

namespace {

auto escape_path(std::string_view path) -> std::string {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

auto unescape_path(std::string_view text) -> std::optional<std::string> {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            out += text[i];
            continue;
        }
        if (++i == text.size()) return std::nullopt;
        switch (text[i]) {
            case '\\': out += '\\'; break;
            case 't':  out += '\t'; break;
            case 'n':  out += '\n'; break;
            default:   return std::nullopt;
        }
    }
    return out;
}

auto parse_u64(std::string_view text) -> std::optional<std::uint64_t> {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

auto parse_line(std::string_view line) -> std::optional<ProgressEntry> {
    const auto t1 = line.find('\t');
    if (t1 == std::string_view::npos) return std::nullopt;
    const auto t2 = line.find('\t', t1 + 1);
    if (t2 == std::string_view::npos) return std::nullopt;

    auto offset = parse_u64(line.substr(0, t1));
    auto bytes = parse_u64(line.substr(t1 + 1, t2 - t1 - 1));
    auto path = unescape_path(line.substr(t2 + 1));
    if (!offset || !bytes || !path || path->empty()) return std::nullopt;
    return ProgressEntry{.end_offset = *offset, .cumulative_bytes = *bytes, .path = std::move(*path)};
}

} // namespace

auto sidecar_path_for(const std::filesystem::path& archive) -> std::filesystem::path {
    std::string name = archive.filename().string();
    for (std::string_view suffix : {".tar.gz", ".tgz", ".tar"}) {
        if (name.size() > suffix.size() && name.ends_with(suffix)) {
            name.resize(name.size() - suffix.size());
            break;
        }
    }
    return archive.parent_path() / (name + ".filelist.txt");
}

auto format_progress_line(const ProgressEntry& entry) -> std::string {
    return fmt::format("{}\t{}\t{}\n", entry.end_offset, entry.cumulative_bytes, escape_path(entry.path));
}

auto load_progress_record(const std::filesystem::path& sidecar)
    -> std::expected<std::optional<ProgressRecord>, infra::Error>
{
    if (!std::filesystem::exists(sidecar)) {
        return std::nullopt;
    }

    std::ifstream in(sidecar, std::ios::binary);
    if (!in) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot read progress record {}", sidecar.string())));
    }
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string content = ss.str();

    ProgressRecord record;
    std::string_view rest = content;
    std::size_t line_no = 0;
    while (!rest.empty()) {
        ++line_no;
        const auto nl = rest.find('\n');
        if (nl == std::string_view::npos) {
            // запись прервана посреди строки
            record.torn_last_line = true;
            spdlog::warn("Progress record {} ends with an incomplete line; ignoring it", sidecar.string());
            break;
        }
        const auto line = rest.substr(0, nl);
        rest.remove_prefix(nl + 1);
        if (line.empty()) continue;

        auto entry = parse_line(line);
        if (!entry) {
            spdlog::warn("Progress record {}:{} is malformed; ignoring it", sidecar.string(), line_no);
            continue;
        }
        record.entries.push_back(std::move(*entry));
    }
    return record;
}

auto rewrite_progress_record(const std::filesystem::path& sidecar,
                             const std::vector<ProgressEntry>& entries)
    -> std::expected<void, infra::Error>
{
    std::string content;
    for (const auto& entry : entries) {
        content += format_progress_line(entry);
    }
    return adapters::fs::atomic_write_file(sidecar, content);
}

auto ProgressLog::open(const std::filesystem::path& sidecar)
    -> std::expected<ProgressLog, infra::Error>
{
    std::error_code ec;
    const bool existed = std::filesystem::exists(sidecar, ec);

    int fd = ::open(sidecar.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::ArchiveIOFailure, errno,
            fmt::format("Cannot open progress record {}", sidecar.string())));
    }
    adapters::fs::UniqueFd guard{fd};
    // новый sidecar должен пережить сбой раньше первого члена архива
    if (!existed) {
        if (auto synced = adapters::fs::sync_directory(sidecar.parent_path()); !synced) {
            return std::unexpected(std::move(synced.error()));
        }
    }
    return ProgressLog{std::move(guard), sidecar};
}

auto ProgressLog::append(const ProgressEntry& entry) -> std::expected<void, infra::Error> {
    const auto line = format_progress_line(entry);
    return adapters::fs::write_all(fd_.get(), line.data(), line.size(), path_)
        .and_then([&] { return adapters::fs::sync_fd(fd_.get(), path_); });
}

} // namespace ferry::extensions
