#pragma once

#include <filesystem>
#include "object_store.hpp"

namespace ferry::transport {

// Buckets are directories under root, keys are relative paths inside them.
// Suited to a shared filesystem mounted on both hosts.
class LocalObjectStore final : public ObjectStore {
public:
    explicit LocalObjectStore(std::filesystem::path root);

    auto exists(const ObjectRef& ref) -> std::expected<bool, infra::Error> override;
    auto put(const std::filesystem::path& local, const ObjectRef& ref)
        -> std::expected<ObjectInfo, infra::Error> override;
    auto get(const ObjectRef& ref, const std::filesystem::path& local)
        -> std::expected<ObjectInfo, infra::Error> override;
    auto remove(const ObjectRef& ref) -> std::expected<void, infra::Error> override;

    [[nodiscard]] auto object_path(const ObjectRef& ref) const
        -> std::expected<std::filesystem::path, infra::Error>;

private:
    std::filesystem::path root_;
};

} // namespace ferry::transport
