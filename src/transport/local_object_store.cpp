#include "local_object_store.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"
#include "infra/hash/xxhash_verifier.hpp"

namespace ferry::transport {

namespace {

auto is_safe_relative(const std::filesystem::path& p) -> bool {
    if (p.empty() || p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

auto ObjectRef::parse(std::string_view text) -> std::expected<ObjectRef, infra::Error> {
    const auto colon = text.find(':');
    ObjectRef ref;
    ref.bucket = std::string{text.substr(0, colon)};
    if (colon != std::string_view::npos) {
        ref.key = std::string{text.substr(colon + 1)};
    }
    while (!ref.key.empty() && ref.key.front() == '/') ref.key.erase(0, 1);

    if (ref.bucket.empty() || ref.bucket.find('/') != std::string::npos || ref.bucket == "..") {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Invalid bucket in '{}', expected bucket:key", text)));
    }
    return ref;
}

auto ObjectRef::to_string() const -> std::string {
    return fmt::format("{}:{}", bucket, key);
}

auto ObjectRef::basename() const -> std::string {
    return std::filesystem::path(key).filename().string();
}

LocalObjectStore::LocalObjectStore(std::filesystem::path root) : root_(std::move(root)) {}

auto LocalObjectStore::object_path(const ObjectRef& ref) const
    -> std::expected<std::filesystem::path, infra::Error>
{
    const std::filesystem::path key{ref.key};
    if (!is_safe_relative(key) || ref.key.ends_with('/')) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Invalid object key '{}'", ref.key)));
    }
    return root_ / ref.bucket / key;
}

auto LocalObjectStore::exists(const ObjectRef& ref) -> std::expected<bool, infra::Error> {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_ / ref.bucket, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Bucket '{}' does not exist under {}", ref.bucket, root_.string())));
    }
    auto path = object_path(ref);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }
    return std::filesystem::is_regular_file(*path, ec);
}

auto LocalObjectStore::put(const std::filesystem::path& local, const ObjectRef& ref)
    -> std::expected<ObjectInfo, infra::Error>
{
    auto path = object_path(ref);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_ / ref.bucket, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Bucket '{}' does not exist under {}", ref.bucket, root_.string())));
    }
    std::filesystem::create_directories(path->parent_path(), ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot create {}: {}", path->parent_path().string(), ec.message())));
    }

    auto copied = adapters::fs::copy_file_atomic(local, *path);
    if (!copied) {
        return std::unexpected(std::move(copied.error()));
    }
    auto hash = infra::XXHashVerifier::verify_copy(local, *path);
    if (!hash) {
        return std::unexpected(std::move(hash.error()));
    }

    spdlog::info("Stored {} as {} ({} bytes, xxh64 {})", local.string(), ref.to_string(), *copied,
                 infra::XXHashVerifier::to_hex(*hash));
    return ObjectInfo{.size = *copied, .xxh64 = *hash};
}

auto LocalObjectStore::get(const ObjectRef& ref, const std::filesystem::path& local)
    -> std::expected<ObjectInfo, infra::Error>
{
    auto path = object_path(ref);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*path, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Object {} does not exist", ref.to_string())));
    }

    auto copied = adapters::fs::copy_file_atomic(*path, local);
    if (!copied) {
        return std::unexpected(std::move(copied.error()));
    }
    auto hash = infra::XXHashVerifier::verify_copy(*path, local);
    if (!hash) {
        return std::unexpected(std::move(hash.error()));
    }

    spdlog::info("Fetched {} to {} ({} bytes)", ref.to_string(), local.string(), *copied);
    return ObjectInfo{.size = *copied, .xxh64 = *hash};
}

auto LocalObjectStore::remove(const ObjectRef& ref) -> std::expected<void, infra::Error> {
    auto path = object_path(ref);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }
    std::error_code ec;
    if (!std::filesystem::remove(*path, ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot delete {}: {}", ref.to_string(), ec.message())));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Object {} does not exist", ref.to_string())));
    }
    auto synced = adapters::fs::sync_directory(path->parent_path());
    if (!synced) {
        return std::unexpected(std::move(synced.error()));
    }
    spdlog::info("Deleted {}", ref.to_string());
    return {};
}

} // namespace ferry::transport
