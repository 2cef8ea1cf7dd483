#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace parcp::infra {

// Общий счётчик скопированных байт: воркеры делают fetch_add, агрегатор - relaxed load
using ProgressCounter = std::atomic<std::uint64_t>;

struct ProgressSnapshot {
    std::uint64_t processed_bytes = 0;
    std::uint64_t total_bytes = 0;
    double fraction = 0.0;          // processed / total, 1.0 для пустого файла
    double bytes_per_sec = 0.0;
    double eta_sec = 0.0;
    bool final = false;             // последний отчёт этого задания
};

using ProgressSink = std::function<void(const ProgressSnapshot&)>;

// Однострочный вывод в stderr: "\r[progress] 42.0% | 812.3 MB/s | ETA 00:07"
void render_to_terminal(const ProgressSnapshot& snapshot);

/// Фоновый наблюдатель за ProgressCounter.
/// Опрашивает счётчик раз в interval и отдаёт снимок в sink. На воркеров не влияет:
/// только relaxed load, никаких блокировок на их пути.
/// Завершается, когда счётчик дошёл до total, или по stop() (барьер join пройден).
class ProgressAggregator {
public:
    ProgressAggregator(const ProgressCounter& counter,
                       std::uint64_t total_bytes,
                       std::chrono::milliseconds interval,
                       ProgressSink sink = render_to_terminal);
    ~ProgressAggregator();

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void start();
    // Идемпотентно; после возврата поток остановлен и финальный снимок отдан
    void stop();

    [[nodiscard]] auto snapshot() const -> ProgressSnapshot;
    [[nodiscard]] auto samples() const -> std::uint64_t { return samples_.load(); }
    [[nodiscard]] auto running() const -> bool { return running_.load(); }

private:
    void run_(std::stop_token st);
    void emit_(const ProgressSnapshot& snapshot);

    const ProgressCounter& counter_;
    const std::uint64_t total_bytes_;
    const std::chrono::milliseconds interval_;
    ProgressSink sink_;
    std::chrono::steady_clock::time_point start_time_;

    std::atomic<std::uint64_t> samples_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> final_emitted_{false};
    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    std::unique_ptr<std::jthread> thread_;
};

} // namespace parcp::infra
