#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <xxhash.h>
#include "../error_handler/error.hpp"

namespace parcp::infra {

// Потоковый XXH64 (seed = 0). Владеет XXH64_state_t.
class StreamingDigest {
public:
    [[nodiscard]] static auto create() -> Result<StreamingDigest>;

    void update(std::span<const std::byte> data);
    [[nodiscard]] auto digest() const -> XXH64_hash_t;

private:
    struct StateDeleter {
        void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
    };

    explicit StreamingDigest(XXH64_state_t* state) : state_(state) {}

    std::unique_ptr<XXH64_state_t, StateDeleter> state_;
};

// 16 hex-символов, как в выводе xxhsum
[[nodiscard]] auto to_hex(XXH64_hash_t hash) -> std::string;

} // namespace parcp::infra
