#pragma once

#include <filesystem>
#include <expected>
#include <string>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace ferry::infra {

class XXHashVerifier {
public:
    // Вычисляет xxHash64 для файла
    static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

    // Hashes both files; ChecksumMismatch if they differ.
    static auto verify_copy(const std::filesystem::path& src,
                            const std::filesystem::path& dst)
        -> std::expected<XXH64_hash_t, Error>;

    // 16 lowercase hex digits
    static auto to_hex(XXH64_hash_t hash) -> std::string;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace ferry::infra
