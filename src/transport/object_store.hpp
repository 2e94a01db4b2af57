#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace ferry::transport {

// "bucket:key"; the key may be empty.
struct ObjectRef {
    std::string bucket;
    std::string key;

    [[nodiscard]] static auto parse(std::string_view text) -> std::expected<ObjectRef, infra::Error>;
    [[nodiscard]] auto to_string() const -> std::string;
    // Last path component of the key
    [[nodiscard]] auto basename() const -> std::string;
};

struct ObjectInfo {
    std::uint64_t size = 0;
    std::uint64_t xxh64 = 0;
};

// What the transfer workflows need from a bucket. Implementations verify
// every copy they make and report ChecksumMismatch when it differs.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    [[nodiscard]] virtual auto exists(const ObjectRef& ref) -> std::expected<bool, infra::Error> = 0;
    [[nodiscard]] virtual auto put(const std::filesystem::path& local, const ObjectRef& ref)
        -> std::expected<ObjectInfo, infra::Error> = 0;
    [[nodiscard]] virtual auto get(const ObjectRef& ref, const std::filesystem::path& local)
        -> std::expected<ObjectInfo, infra::Error> = 0;
    [[nodiscard]] virtual auto remove(const ObjectRef& ref) -> std::expected<void, infra::Error> = 0;
};

} // namespace ferry::transport
