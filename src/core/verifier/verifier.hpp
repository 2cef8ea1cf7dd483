#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <xxhash.h>
#include "infra/error_handler/error.hpp"

namespace parcp::core {

struct VerificationOutcome {
    // Заполнены только при расхождении
    std::optional<std::uint64_t> mismatch_chunk_offset;   // начало первого различающегося чанка
    std::optional<std::uint64_t> mismatch_offset;         // первый различающийся байт
    bool length_mismatch = false;                         // чтения вернули разную длину

    std::uint64_t bytes_compared = 0;
    std::optional<XXH64_hash_t> digest;                   // XXH64 содержимого, только при совпадении

    [[nodiscard]] auto identical() const -> bool { return !mismatch_offset.has_value(); }
};

/// Побайтное сравнение двух файлов синхронными чанками по chunk_size байт.
/// Файлы открываются заново, дескрипторы копии не используются.
/// Первый различающийся чанк прерывает проверку. Разная длина чтений - тоже расхождение.
/// Ошибка (Error) - только если файл не открылся или чтение сломалось.
[[nodiscard]] auto verify_copy(const std::filesystem::path& src,
                               const std::filesystem::path& dst,
                               std::size_t chunk_size)
    -> infra::Result<VerificationOutcome>;

/// ContentMismatch для провалившейся проверки
[[nodiscard]] auto mismatch_error(const VerificationOutcome& outcome,
                                  const std::filesystem::path& src,
                                  const std::filesystem::path& dst) -> infra::Error;

} // namespace parcp::core
