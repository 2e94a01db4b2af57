#include "transfer.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/archive_job/archive_job.hpp"

namespace ferry::core {

namespace {

auto archive_name_for(const std::filesystem::path& source) -> std::string {
    auto normal = source.lexically_normal();
    if (!normal.has_filename()) normal = normal.parent_path();
    return normal.filename().string() + ".tar.gz";
}

} // namespace

auto upload(const infra::Config& config, transport::ObjectStore& store, const UploadRequest& request)
    -> std::expected<UploadResult, infra::Error>
{
    UploadResult result;
    result.archive = request.temp_dir / archive_name_for(request.source);
    result.object = request.destination;
    if (result.object.key.empty() || result.object.key.ends_with('/')) {
        result.object.key += result.archive.filename().string();
    }

    // проверяем заранее, чтобы не собирать архив впустую
    auto present = store.exists(result.object);
    if (!present) {
        return std::unexpected(std::move(present.error()));
    }
    if (*present && !request.overwrite) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
            fmt::format("Object {} already exists (use --overwrite)", result.object.to_string())));
    }

    ArchiveJob job{config};
    auto built = job.run(ArchiveRequest{.source = request.source, .archive = result.archive});
    if (!built) {
        return std::unexpected(std::move(built.error()));
    }
    result.build = *built;

    if (*present) {
        spdlog::warn("Overwriting {}", result.object.to_string());
    }
    auto stored = store.put(result.archive, result.object);
    if (!stored) {
        return std::unexpected(std::move(stored.error()));
    }
    result.stored = *stored;

    auto visible = store.exists(result.object);
    if (!visible) {
        return std::unexpected(std::move(visible.error()));
    }
    if (!*visible) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
            fmt::format("Upload validation failed: {} not found after put", result.object.to_string())));
    }
    return result;
}

auto download(transport::ObjectStore& store, const DownloadRequest& request)
    -> std::expected<DownloadResult, infra::Error>
{
    auto present = store.exists(request.source);
    if (!present) {
        return std::unexpected(std::move(present.error()));
    }
    if (!*present) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Object {} does not exist", request.source.to_string())));
    }

    std::error_code ec;
    std::filesystem::create_directories(request.destination, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot create {}: {}", request.destination.string(), ec.message())));
    }

    DownloadResult result;
    result.local = request.destination / request.source.basename();
    if (std::filesystem::exists(result.local, ec) && !request.overwrite) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
            fmt::format("{} already exists (use --overwrite)", result.local.string())));
    }

    auto fetched = store.get(request.source, result.local);
    if (!fetched) {
        return std::unexpected(std::move(fetched.error()));
    }
    result.fetched = *fetched;

    if (request.extract) {
        spdlog::info("Extracting {} into {}", result.local.string(), request.destination.string());
        auto extracted = adapters::archive::extract_archive(result.local, request.destination);
        if (!extracted) {
            return std::unexpected(std::move(extracted.error()));
        }
        result.extracted = *extracted;
    }

    // удаляем удалённую копию только после успешной выгрузки (и распаковки)
    if (request.delete_remote) {
        auto removed = store.remove(request.source);
        if (!removed) {
            return std::unexpected(std::move(removed.error()));
        }
        result.remote_deleted = true;
    }
    return result;
}

} // namespace ferry::core
