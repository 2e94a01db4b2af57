#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include "adapters/archive/extractor.hpp"
#include "core/archive_builder/archive_builder.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "transport/object_store.hpp"

namespace ferry::core {

struct UploadRequest {
    std::filesystem::path source;
    transport::ObjectRef destination;     // empty key or "dir/" gets the archive name appended
    std::filesystem::path temp_dir;       // where "<source name>.tar.gz" is built
    bool overwrite = false;
};

struct UploadResult {
    std::filesystem::path archive;
    transport::ObjectRef object;
    BuildStats build;
    transport::ObjectInfo stored;
};

struct DownloadRequest {
    transport::ObjectRef source;
    std::filesystem::path destination;    // directory
    bool extract = false;
    bool delete_remote = false;
    bool overwrite = false;
};

struct DownloadResult {
    std::filesystem::path local;
    transport::ObjectInfo fetched;
    std::optional<adapters::archive::ExtractStats> extracted;
    bool remote_deleted = false;
};

// Resumable build into temp_dir, then put + verify. A rerun after a kill
// resumes the build instead of starting over.
[[nodiscard]] auto upload(const infra::Config& config,
                          transport::ObjectStore& store,
                          const UploadRequest& request)
    -> std::expected<UploadResult, infra::Error>;

// get + verify, optional extraction next to the file, then optional remote deletion.
[[nodiscard]] auto download(transport::ObjectStore& store, const DownloadRequest& request)
    -> std::expected<DownloadResult, infra::Error>;

} // namespace ferry::core
