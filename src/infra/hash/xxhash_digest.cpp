#include "xxhash_digest.hpp"
#include <fmt/core.h>

namespace parcp::infra {

auto StreamingDigest::create() -> Result<StreamingDigest> {
    XXH64_state_t* state = XXH64_createState();
    if (!state) {
        return std::unexpected(make_error(ErrorCode::IOError, "Failed to create XXH64 state"));
    }
    XXH64_reset(state, 0); // seed = 0
    return StreamingDigest{state};
}

void StreamingDigest::update(std::span<const std::byte> data) {
    XXH64_update(state_.get(), data.data(), data.size());
}

auto StreamingDigest::digest() const -> XXH64_hash_t {
    return XXH64_digest(state_.get());
}

auto to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", hash);
}

} // namespace parcp::infra
