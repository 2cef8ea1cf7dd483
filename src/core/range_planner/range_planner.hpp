#pragma once

#include <cstdint>
#include <vector>

namespace parcp::core {

// Полуоткрытый интервал [start, end), принадлежит ровно одному воркеру
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    [[nodiscard]] auto length() const -> std::uint64_t { return end - start; }
    [[nodiscard]] auto empty() const -> bool { return start == end; }

    bool operator==(const ByteRange&) const = default;
};

/// Число воркеров для файла: не меньше 1, ровно 1 ниже small_file_threshold.
[[nodiscard]] auto effective_workers(std::uint64_t size,
                                     std::uint32_t requested,
                                     std::uint64_t small_file_threshold) -> std::uint32_t;

/// Делит [0, size) на `workers` смежных диапазонов по size / workers байт.
/// Последний диапазон забирает остаток от деления. При size == 0 все диапазоны пустые.
[[nodiscard]] auto plan_ranges(std::uint64_t size, std::uint32_t workers) -> std::vector<ByteRange>;

} // namespace parcp::core
