#include "verifier.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/hash/xxhash_digest.hpp"

namespace parcp::core {

namespace {

auto open_for_compare(const std::filesystem::path& path) -> infra::Result<std::ifstream> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IOError,
                               fmt::format("Cannot open file for verification: {}", path.string())));
    }
    return file;
}

// Читает до chunk байт; короче только на конце файла
auto read_chunk(std::ifstream& file, std::vector<char>& buffer,
                const std::filesystem::path& path) -> infra::Result<std::size_t>
{
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IOError,
                               fmt::format("Error reading file: {}", path.string())));
    }
    return static_cast<std::size_t>(file.gcount());
}

} // namespace

auto verify_copy(const std::filesystem::path& src,
                 const std::filesystem::path& dst,
                 std::size_t chunk_size)
    -> infra::Result<VerificationOutcome>
{
    spdlog::info("Verifying '{}' and '{}' are the same after copy", src.string(), dst.string());

    auto in1 = open_for_compare(src);
    if (!in1) return std::unexpected(std::move(in1.error()));
    auto in2 = open_for_compare(dst);
    if (!in2) return std::unexpected(std::move(in2.error()));

    auto digest = infra::StreamingDigest::create();
    if (!digest) return std::unexpected(std::move(digest.error()));

    chunk_size = std::max<std::size_t>(chunk_size, 1);
    std::vector<char> buffer1(chunk_size);
    std::vector<char> buffer2(chunk_size);

    VerificationOutcome outcome;
    std::uint64_t offset = 0;

    for (;;) {
        auto n1 = read_chunk(*in1, buffer1, src);
        if (!n1) return std::unexpected(std::move(n1.error()));
        auto n2 = read_chunk(*in2, buffer2, dst);
        if (!n2) return std::unexpected(std::move(n2.error()));

        const std::size_t common = std::min(*n1, *n2);
        const auto [diff, _] = std::mismatch(buffer1.begin(), buffer1.begin() + common, buffer2.begin());
        if (diff != buffer1.begin() + common) {
            outcome.mismatch_chunk_offset = offset;
            outcome.mismatch_offset = offset + static_cast<std::uint64_t>(diff - buffer1.begin());
            outcome.bytes_compared += static_cast<std::uint64_t>(diff - buffer1.begin());
            return outcome;
        }

        if (*n1 != *n2) {
            spdlog::warn("Uneven reads during verification at offset {}: {} vs {} bytes",
                         offset, *n1, *n2);
            outcome.mismatch_chunk_offset = offset;
            outcome.mismatch_offset = offset + common;
            outcome.length_mismatch = true;
            outcome.bytes_compared += common;
            return outcome;
        }

        digest->update(std::as_bytes(std::span(buffer1.data(), *n1)));
        outcome.bytes_compared += *n1;
        offset += *n1;

        if (*n1 < chunk_size) {
            break; // оба файла кончились
        }
    }

    outcome.digest = digest->digest();
    return outcome;
}

auto mismatch_error(const VerificationOutcome& outcome,
                    const std::filesystem::path& src,
                    const std::filesystem::path& dst) -> infra::Error
{
    if (outcome.length_mismatch) {
        return infra::make_error(infra::ErrorCode::ContentMismatch,
            fmt::format("Files {} and {} differ in length: one ends at byte {} (chunk starting {})",
                        src.string(), dst.string(),
                        outcome.mismatch_offset.value_or(0), outcome.mismatch_chunk_offset.value_or(0)));
    }
    return infra::make_error(infra::ErrorCode::ContentMismatch,
        fmt::format("Files {} and {} differ at range starting {} bytes (first differing byte {})",
                    src.string(), dst.string(),
                    outcome.mismatch_chunk_offset.value_or(0), outcome.mismatch_offset.value_or(0)));
}

} // namespace parcp::core
