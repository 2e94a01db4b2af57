#include <cstdio>
#include <filesystem>
#include <fmt/core.h>

#include "adapters/archive/extractor.hpp"
#include "adapters/archive/toc.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/archive_job/archive_job.hpp"
#include "core/transfer/transfer.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "transport/local_object_store.hpp"
#include <build_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = ferry::build_info::GitInfo;
using ARGS = ferry::args_parser::CLIArgs;
using ferry::args_parser::Command;

constexpr auto load_from_cli = ferry::infra::config_from_cli;
constexpr auto load_config_file = ferry::infra::load_config_from_file;
constexpr auto args_parser = ferry::args_parser::parse_args;
constexpr auto git = ferry::build_info::get_git_info();

static auto
out_build_info(const GIT& git)
-> void {
    spdlog::debug("ferry {} ({}@{}{}, built {})", ferry::build_info::version, git.branch,
                  git.commit_short, git.dirty ? "-dirty" : "", git.timestamp);
}

static auto
fail(ferry::infra::Error&& err)
-> int {
    const auto code = err.to_exit_code();
    (void)ferry::infra::log_and_return(std::move(err));
    return code;
}

static auto
run_pack(const ARGS& args, const ferry::infra::Config& config)
-> int {
    ferry::core::ArchiveJob job{config};
    auto result = job.run({.source = args.source, .archive = args.archive});
    if (!result) return fail(std::move(result.error()));

    const auto& stats = *result;
    if (stats.nothing_to_do) {
        spdlog::info("Nothing to do");
    } else {
        spdlog::info("Appended {} files ({}), skipped {}, archive size {}", stats.files_appended,
                     ferry::infra::format_bytes(stats.bytes_appended), stats.files_skipped,
                     ferry::infra::format_bytes(stats.archive_size));
    }
    return 0;
}

static auto
run_list(const ARGS& args)
-> int {
    auto toc = ferry::adapters::archive::scan_archive(args.archive);
    if (!toc) return fail(std::move(toc.error()));

    for (const auto& entry : toc->entries) {
        fmt::print("{}\n", entry.name);
    }
    std::fflush(stdout);
    if (toc->tail == ferry::adapters::archive::TailState::Damaged) {
        spdlog::warn("{}: {} bytes after offset {} do not decode ({})", args.archive,
                     toc->uncommitted_bytes(), toc->committed_end, toc->tail_damage);
    }
    if (!toc->is_complete()) {
        spdlog::warn("{} is incomplete: resume it with `ferry pack`", args.archive);
    }
    spdlog::info("{} entries, {} gzip members, {}", toc->entries.size(), toc->members,
                 ferry::infra::format_bytes(toc->file_size));
    return 0;
}

static auto
run_extract(const ARGS& args)
-> int {
    auto stats = ferry::adapters::archive::extract_archive(args.archive, args.destination);
    if (!stats) return fail(std::move(stats.error()));
    spdlog::info("Extracted {} files ({}) and {} directories into {}", stats->files,
                 ferry::infra::format_bytes(stats->bytes), stats->directories, args.destination);
    return 0;
}

static auto
store_root(const ferry::infra::Config& config)
-> std::filesystem::path {
    return config.store_root.value_or(std::filesystem::current_path().string());
}

static auto
run_upload(const ARGS& args, const ferry::infra::Config& config)
-> int {
    auto ref = ferry::transport::ObjectRef::parse(args.destination);
    if (!ref) return fail(std::move(ref.error()));

    ferry::transport::LocalObjectStore store{store_root(config)};
    const auto temp_dir = config.temp_path.value_or(std::filesystem::current_path().string());
    auto result = ferry::core::upload(config, store, {
        .source = args.source,
        .destination = *ref,
        .temp_dir = temp_dir,
        .overwrite = args.overwrite,
    });
    if (!result) return fail(std::move(result.error()));

    spdlog::info("Uploaded {} to {} ({})", result->archive.string(), result->object.to_string(),
                 ferry::infra::format_bytes(result->stored.size));
    return 0;
}

static auto
run_download(const ARGS& args, const ferry::infra::Config& config)
-> int {
    auto ref = ferry::transport::ObjectRef::parse(args.source);
    if (!ref) return fail(std::move(ref.error()));

    ferry::transport::LocalObjectStore store{store_root(config)};
    auto result = ferry::core::download(store, {
        .source = *ref,
        .destination = args.destination,
        .extract = args.extract,
        .delete_remote = args.delete_remote,
        .overwrite = args.overwrite,
    });
    if (!result) return fail(std::move(result.error()));

    spdlog::info("Downloaded {} to {}", ref->to_string(), result->local.string());
    if (result->extracted) {
        spdlog::info("Extracted {} files into {}", result->extracted->files, args.destination);
    }
    return 0;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        ferry::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }
        out_build_info(git);

        if (auto env = ferry::infra::check_required_env(config); !env) {
            return fail(std::move(env.error()));
        }

        auto start_time = std::chrono::steady_clock::now();
        spdlog::debug("Running '{}'", ferry::args_parser::to_string(args.command));

        int rc = 1;
        switch (args.command) {
            case Command::Pack:     rc = run_pack(args, config); break;
            case Command::List:     rc = run_list(args); break;
            case Command::Extract:  rc = run_extract(args); break;
            case Command::Upload:   rc = run_upload(args, config); break;
            case Command::Download: rc = run_download(args, config); break;
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        spdlog::debug("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
        return rc;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
