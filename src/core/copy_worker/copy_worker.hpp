#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include "adapters/fs.hpp"
#include "core/range_planner/range_planner.hpp"
#include "infra/cancellation.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace parcp::core {

using infra::ProgressCounter;

struct RangeReport {
    std::uint64_t bytes = 0;
    std::uint64_t reads = 0;    // вызовов pread
    std::uint64_t writes = 0;   // вызовов write_all_at
};

// Всё, что воркеры делят между собой. Дескрипторы: источник только читается,
// назначение только пишется, диапазоны не пересекаются - блокировок нет.
struct WorkerContext {
    const adapters::fs::FileHandle& source;
    const adapters::fs::FileHandle& destination;
    std::size_t buffer_size;
    ProgressCounter& progress;
    const infra::CancellationToken& cancel;
    std::chrono::milliseconds io_timeout{0};   // 0 = без лимита
};

/// Копирует один диапазон циклом pread -> pwrite по одному и тому же смещению.
/// Буфер принадлежит вызову. Отмена проверяется перед каждой итерацией.
/// Ошибки: ShortRead (pread вернул 0 раньше конца диапазона), IOError, Timeout, Cancelled.
[[nodiscard]] auto copy_range(const ByteRange& range, const WorkerContext& ctx)
    -> infra::Result<RangeReport>;

} // namespace parcp::core
