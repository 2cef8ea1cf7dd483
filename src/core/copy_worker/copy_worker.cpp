#include "copy_worker.hpp"

#include <algorithm>
#include <span>
#include <vector>
#include <fmt/core.h>

namespace parcp::core {

namespace {

auto check_timeout(std::chrono::steady_clock::time_point started,
                   std::chrono::milliseconds limit,
                   std::string_view what,
                   std::uint64_t offset) -> infra::VoidResult
{
    if (limit.count() == 0) return {};

    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (took > limit) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Timeout,
                               fmt::format("{} at offset {} took {} ms (limit {} ms)",
                                           what, offset, took.count(), limit.count())));
    }
    return {};
}

} // namespace

auto copy_range(const ByteRange& range, const WorkerContext& ctx)
    -> infra::Result<RangeReport>
{
    RangeReport report;
    if (range.empty()) {
        return report;
    }

    std::vector<std::byte> buffer(std::max<std::size_t>(ctx.buffer_size, 1));
    std::uint64_t cursor = range.start;

    while (cursor < range.end) {
        if (ctx.cancel.is_cancelled()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Cancelled,
                                   fmt::format("Range [{}, {}) cancelled at offset {}",
                                               range.start, range.end, cursor)));
        }

        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), range.end - cursor));

        auto started = std::chrono::steady_clock::now();
        auto got = adapters::fs::read_at(ctx.source, std::span(buffer.data(), want), cursor);
        ++report.reads;
        if (!got) {
            return std::unexpected(std::move(got.error()));
        }
        if (auto late = check_timeout(started, ctx.io_timeout, "pread", cursor); !late) {
            return std::unexpected(std::move(late.error()));
        }
        if (*got == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ShortRead,
                                   fmt::format("Source {} ended at offset {}, expected data up to {}",
                                               ctx.source.path().string(), cursor, range.end)));
        }

        started = std::chrono::steady_clock::now();
        auto written = adapters::fs::write_all_at(ctx.destination,
                                                  std::span<const std::byte>(buffer.data(), *got),
                                                  cursor);
        ++report.writes;
        if (!written) {
            return std::unexpected(std::move(written.error()));
        }
        if (auto late = check_timeout(started, ctx.io_timeout, "pwrite", cursor); !late) {
            return std::unexpected(std::move(late.error()));
        }

        cursor += *got;
        report.bytes += *got;
        ctx.progress.fetch_add(*got, std::memory_order_relaxed);
    }

    return report;
}

} // namespace parcp::core
