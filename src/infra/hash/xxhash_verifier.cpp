#include "xxhash_verifier.hpp"
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"

namespace ferry::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    auto fd = adapters::fs::open_read(path);
    if (!fd) {
        return std::unexpected(std::move(fd.error()));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state{XXH64_createState()};
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }
    XXH64_reset(state.get(), 0); // seed = 0

    std::vector<char> buffer(BUFFER_SIZE);
    while (true) {
        auto got = adapters::fs::read_full(fd->get(), buffer.data(), buffer.size(), path);
        if (!got) {
            return std::unexpected(std::move(got.error()));
        }
        if (*got == 0) break;
        XXH64_update(state.get(), buffer.data(), *got);
        if (*got < buffer.size()) break;
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::verify_copy(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> std::expected<XXH64_hash_t, Error>
{
    auto src_hash = hash_file(src);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }

    auto dst_hash = hash_file(dst);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    if (*src_hash != *dst_hash) {
        return std::unexpected(make_error(ErrorCode::ChecksumMismatch,
            fmt::format("Hash mismatch: {} (src: {}) vs {} (dst: {})",
                        src.string(), to_hex(*src_hash), dst.string(), to_hex(*dst_hash))));
    }

    spdlog::debug("Verified {} -> {} (xxh64 {})", src.string(), dst.string(), to_hex(*dst_hash));
    return *dst_hash;
}

auto XXHashVerifier::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", static_cast<unsigned long long>(hash));
}

} // namespace ferry::infra
