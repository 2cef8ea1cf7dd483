#include "copy_engine.hpp"
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <fmt/core.h>
#include <sys/stat.h>
#include <spdlog/spdlog.h>
#include "infra/thread_pool/thread_pool.hpp"
#include "infra/timing/stopwatch.hpp"
#include "infra/hash/xxhash_digest.hpp"

namespace parcp::core {

namespace {

auto resolve_destination(const std::filesystem::path& src,
                         const std::filesystem::path& dst) -> std::filesystem::path
{
    std::error_code ec;
    if (std::filesystem::is_directory(dst, ec)) {
        return dst / src.filename();
    }
    return dst;
}

} // namespace

auto make_job(std::filesystem::path source,
              std::filesystem::path destination,
              std::uint64_t total_size,
              const infra::Config& config) -> CopyJob
{
    return CopyJob{
        .source = std::move(source),
        .destination = std::move(destination),
        .total_size = total_size,
        .workers = effective_workers(total_size, config.worker_count(), config.small_file_limit())
    };
}

CopyEngine::CopyEngine(const infra::Config& config, infra::ProgressSink progress_sink)
    : config_(config), progress_sink_(std::move(progress_sink)) {}

auto CopyEngine::copy_file(const std::filesystem::path& src,
                           const std::filesystem::path& dst)
    -> std::expected<CopyReport, infra::Error>
{
    const auto target = resolve_destination(src, dst);

    auto source = adapters::fs::open_source(src);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    auto source_id = adapters::fs::identify(*source);
    if (!source_id) {
        return std::unexpected(std::move(source_id.error()));
    }
    if (!S_ISREG(source_id->mode)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               fmt::format("Not a regular file: {}", src.string())));
    }

    // O_TRUNC на самом источнике уничтожил бы данные
    std::error_code ec;
    if (std::filesystem::exists(target, ec) && std::filesystem::equivalent(src, target, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               fmt::format("{} and {} are the same file", src.string(), target.string())));
    }

    auto destination = adapters::fs::create_destination(target, source_id->mode & 0777);
    if (!destination) {
        return std::unexpected(std::move(destination.error()));
    }

    const auto job = make_job(src, target, source_id->size, config_);

    // Длина назначения фиксируется до старта любого воркера
    if (auto sized = adapters::fs::set_length(*destination, job.total_size, config_.reserve_blocks); !sized) {
        return std::unexpected(std::move(sized.error()));
    }

    const auto ranges = plan_ranges(job.total_size, job.workers);
    spdlog::info("Copying {} -> {}. Size: {}, with workers {}",
                 job.source.string(), job.destination.string(), job.total_size, job.workers);

    infra::Stopwatch stopwatch;
    auto copied = run_workers_(job, ranges, *source, *destination);
    if (!copied) {
        spdlog::error("Copy of {} failed; the partial copy at {} was left in place, remove it manually",
                      job.source.string(), job.destination.string());
        return std::unexpected(std::move(copied.error()));
    }

    CopyReport report{
        .source = job.source,
        .destination = job.destination,
        .bytes_copied = copied->bytes,
        .workers = job.workers,
        .read_ops = copied->reads,
        .write_ops = copied->writes
    };
    log_throughput_(job, report, stopwatch.elapsed_seconds());

    if (config_.preserve_metadata) {
        auto metadata_res = adapters::fs::copy_metadata(*source, *destination);
        if (!metadata_res) {
            spdlog::warn("Failed to copy metadata for {}: {}",
                         job.destination.string(), metadata_res.error().message);
        }
    }

    if (config_.verify) {
        auto outcome = verify_copy(job.source, job.destination, config_.verify_chunk());
        if (!outcome) {
            return std::unexpected(std::move(outcome.error()));
        }
        report.verification = *outcome;
        if (!outcome->identical()) {
            // Удалять не пытаемся: процесс может не иметь на это прав
            spdlog::error("Go clean up the invalid copy at {}", job.destination.string());
            return std::unexpected(mismatch_error(*outcome, job.source, job.destination));
        }
        spdlog::info("Verified files are identical ({} bytes, xxh64 {})",
                     outcome->bytes_compared, infra::to_hex(outcome->digest.value_or(0)));
    }

    return report;
}

auto CopyEngine::run_workers_(const CopyJob& job,
                              const std::vector<ByteRange>& ranges,
                              const adapters::fs::FileHandle& source,
                              const adapters::fs::FileHandle& destination)
    -> std::expected<RangeReport, infra::Error>
{
    infra::ProgressCounter progress{0};
    infra::CancellationToken cancel;

    std::mutex first_error_mutex;
    std::optional<infra::Error> first_error;

    const WorkerContext ctx{
        .source = source,
        .destination = destination,
        .buffer_size = config_.transfer_buffer_size(),
        .progress = progress,
        .cancel = cancel,
        .io_timeout = config_.io_timeout()
    };

    infra::ProgressAggregator aggregator(progress, job.total_size, config_.progress_interval(), progress_sink_);
    if (config_.progress && !config_.quiet) {
        aggregator.start();
    }

    std::vector<std::future<infra::Result<RangeReport>>> futures;
    futures.reserve(ranges.size());
    {
        infra::ThreadPool pool{ranges.size()};

        for (const auto& range : ranges) {
            futures.push_back(pool.submit([&, range]() -> infra::Result<RangeReport> {
                infra::Result<RangeReport> res = [&]() -> infra::Result<RangeReport> {
                    try {
                        return copy_range_(range, ctx);
                    } catch (const std::exception& e) {
                        return std::unexpected(infra::make_error(infra::ErrorCode::IOError,
                                               fmt::format("Worker for [{}, {}) failed: {}",
                                                           range.start, range.end, e.what())));
                    }
                }();

                if (!res) {
                    {
                        std::lock_guard lock(first_error_mutex);
                        if (!first_error) first_error = res.error();
                    }
                    if (config_.fail_fast) {
                        cancel.request_cancel();
                    }
                }
                return res;
            }));
        }

        pool.wait();
    }

    // Барьер join: все задачи завершены
    RangeReport total;
    for (auto& future : futures) {
        auto res = future.get();
        if (res) {
            total.bytes += res->bytes;
            total.reads += res->reads;
            total.writes += res->writes;
        } else {
            spdlog::debug("Worker failed: {}: {}", infra::to_string(res.error().code), res.error().message);
        }
    }
    aggregator.stop();

    if (first_error) {
        return std::unexpected(std::move(*first_error));
    }
    return total;
}

auto CopyEngine::copy_range_(const ByteRange& range, const WorkerContext& ctx)
    -> infra::Result<RangeReport>
{
    return copy_range(range, ctx);
}

void CopyEngine::log_throughput_(const CopyJob& job, CopyReport& report,
                                 const infra::Result<double>& elapsed) const
{
    if (!elapsed) {
        // Часы сломались - копия от этого не хуже, только без замера
        (void)infra::log_and_return(infra::Error{elapsed.error()});
        return;
    }
    report.elapsed_seconds = *elapsed;

    const double seconds = *elapsed;
    const double gbits = seconds > 0 ? static_cast<double>(job.total_size) / seconds * 8.0 / 1e9 : 0.0;
    spdlog::info("Finished! {} bytes written in {:.1f} seconds = {:.3f} Gbits/s",
                 job.total_size, seconds, gbits);
}

} // namespace parcp::core
