#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <thread>

namespace ferry::infra {

auto format_bytes(std::uint64_t bytes) -> std::string {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", value, units[unit]);
}

ProgressMonitor::ProgressMonitor(std::string label, bool enabled, bool quiet)
    : label_(std::move(label))
    , enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
        render_thread_.reset(); // join
    }
    if (enabled_ && total_files_.load() > 0) {
        render_();
        std::fputs("\n", stderr); // финальный перенос
    }
}

void ProgressMonitor::set_total(std::uint64_t files, std::uint64_t bytes) {
    total_files_ = files;
    total_bytes_ = bytes;
}

void ProgressMonitor::update(std::uint64_t files, std::uint64_t bytes) {
    processed_files_ += files;
    processed_bytes_ += bytes;
}

void ProgressMonitor::skip(std::uint64_t bytes) {
    ++skipped_files_;
    skipped_bytes_ += bytes;
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_.load(),
        .processed_files = processed_files_.load(),
        .skipped_files = skipped_files_.load(),
        .total_bytes = total_bytes_.load(),
        .processed_bytes = processed_bytes_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested() && !shutdown_.load()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    shutdown_.store(true);
    if (render_thread_) {
        render_thread_->request_stop();
    }
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    auto stats = get_stats();
    if (stats.total_files == 0) return;

    const std::uint64_t done_bytes = stats.processed_bytes + skipped_bytes_.load();
    double fraction = stats.total_bytes > 0
        ? static_cast<double>(done_bytes) / static_cast<double>(stats.total_bytes)
        : static_cast<double>(stats.processed_files + stats.skipped_files) / stats.total_files;
    fraction = std::min(fraction, 1.0);
    const int bar_width = 20;
    const int filled = static_cast<int>(fraction * bar_width);

    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double bytes_per_sec = elapsed_sec > 0 ? stats.processed_bytes / elapsed_sec : 0.0;

    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && stats.total_bytes > done_bytes) {
        eta_sec = static_cast<double>(stats.total_bytes - done_bytes) / bytes_per_sec;
    }

    std::string eta_str = "--:--";
    if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) bar += i < filled ? "█" : "░";

    // \033[K: очистить строку
    fmt::print(stderr, "\r\033[K{} [{}] {:5.1f}% | {}/s | ETA: {} | {}/{} files",
               label_, bar, fraction * 100.0,
               format_bytes(static_cast<std::uint64_t>(bytes_per_sec)), eta_str,
               stats.processed_files, stats.total_files);
    if (stats.skipped_files > 0) {
        fmt::print(stderr, " | {} skipped", stats.skipped_files);
    }
    std::fflush(stderr);
}

} // namespace ferry::infra
