#pragma once

#include <filesystem>
#include <optional>
#include <vector>
#include <expected>
#include "adapters/fs.hpp"
#include "core/copy_worker/copy_worker.hpp"
#include "core/range_planner/range_planner.hpp"
#include "core/verifier/verifier.hpp"
#include "infra/cancellation.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace parcp::core {

// Одно копирование файла. Создаётся на старте и дальше не меняется.
struct CopyJob {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::uint64_t total_size = 0;   // снят один раз с метаданных источника
    std::uint32_t workers = 1;      // >= 1, ровно 1 для маленьких файлов
};

[[nodiscard]] auto make_job(std::filesystem::path source,
                            std::filesystem::path destination,
                            std::uint64_t total_size,
                            const infra::Config& config) -> CopyJob;

struct CopyReport {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::uint64_t bytes_copied = 0;
    std::uint32_t workers = 0;
    std::uint64_t read_ops = 0;
    std::uint64_t write_ops = 0;
    std::optional<double> elapsed_seconds;          // пусто при ClockError
    std::optional<VerificationOutcome> verification; // только если проверка запрошена
};

class CopyEngine {
public:
    explicit CopyEngine(const infra::Config& config,
                        infra::ProgressSink progress_sink = infra::render_to_terminal);
    virtual ~CopyEngine() = default;

    CopyEngine(const CopyEngine&) = delete;
    CopyEngine& operator=(const CopyEngine&) = delete;

    /// Копирует один обычный файл. Если dst - существующий каталог, пишет в dst / src.filename().
    /// Длина назначения выставляется до старта воркеров; при ошибке файл назначения не удаляется.
    [[nodiscard]] auto copy_file(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
        -> std::expected<CopyReport, infra::Error>;

protected:
    // Тело одного воркера; по умолчанию core::copy_range
    [[nodiscard]] virtual auto copy_range_(const ByteRange& range, const WorkerContext& ctx)
        -> infra::Result<RangeReport>;

private:
    // Пул воркеров + агрегатор прогресса; возвращается после барьера join
    [[nodiscard]] auto run_workers_(const CopyJob& job,
                                    const std::vector<ByteRange>& ranges,
                                    const adapters::fs::FileHandle& source,
                                    const adapters::fs::FileHandle& destination)
        -> std::expected<RangeReport, infra::Error>;

    void log_throughput_(const CopyJob& job, CopyReport& report,
                         const infra::Result<double>& elapsed) const;

    const infra::Config& config_;
    infra::ProgressSink progress_sink_;
};

} // namespace parcp::core
