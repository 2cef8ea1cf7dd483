#include "monitoring.hpp"
#include <fmt/core.h>
#include <cmath>
#include <cstdio>
#include <string>

namespace parcp::infra {

void render_to_terminal(const ProgressSnapshot& snapshot) {
    // Форматирование скорости
    const char* unit = "B/s";
    double speed = snapshot.bytes_per_sec;
    if (speed > 1024*1024*1024) { speed /= 1024*1024*1024; unit = "GB/s"; }
    else if (speed > 1024*1024) { speed /= 1024*1024; unit = "MB/s"; }
    else if (speed > 1024) { speed /= 1024; unit = "KB/s"; }

    // Форматирование ETA
    std::string eta_str = "--:--";
    if (std::isfinite(snapshot.eta_sec) && snapshot.eta_sec > 0) {
        int seconds = static_cast<int>(snapshot.eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    // \033[K: очистить остаток строки
    fmt::print(stderr, "\r\033[K[progress] {:.1f}% | {:.1f} {} | ETA {}",
               snapshot.fraction * 100.0, speed, unit, eta_str);
    if (snapshot.final) {
        fmt::print(stderr, "\n");
    }
    std::fflush(stderr);
}

ProgressAggregator::ProgressAggregator(const ProgressCounter& counter,
                                       std::uint64_t total_bytes,
                                       std::chrono::milliseconds interval,
                                       ProgressSink sink)
    : counter_(counter)
    , total_bytes_(total_bytes)
    , interval_(interval)
    , sink_(std::move(sink))
    , start_time_(std::chrono::steady_clock::now())
{}

ProgressAggregator::~ProgressAggregator() {
    stop();
}

void ProgressAggregator::start() {
    if (thread_) return;
    start_time_ = std::chrono::steady_clock::now();
    running_.store(true);
    thread_ = std::make_unique<std::jthread>([this](std::stop_token st) { run_(st); });
}

void ProgressAggregator::stop() {
    if (!thread_) return;
    thread_->request_stop();
    wake_cv_.notify_all();
    thread_->join();
    thread_.reset();

    // Барьер пройден раньше, чем счётчик дошёл до total (ошибка или отмена)
    if (!final_emitted_.load()) {
        auto last = snapshot();
        last.final = true;
        emit_(last);
    }
}

auto ProgressAggregator::snapshot() const -> ProgressSnapshot {
    const auto processed = counter_.load(std::memory_order_relaxed);

    ProgressSnapshot snap;
    snap.processed_bytes = processed;
    snap.total_bytes = total_bytes_;
    snap.fraction = total_bytes_ == 0 ? 1.0
                                      : static_cast<double>(processed) / static_cast<double>(total_bytes_);

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    snap.bytes_per_sec = elapsed > 0 ? static_cast<double>(processed) / elapsed : 0.0;
    if (snap.bytes_per_sec > 0 && processed < total_bytes_) {
        snap.eta_sec = static_cast<double>(total_bytes_ - processed) / snap.bytes_per_sec;
    }
    snap.final = processed >= total_bytes_;
    return snap;
}

void ProgressAggregator::run_(std::stop_token st) {
    while (!st.stop_requested()) {
        auto snap = snapshot();
        emit_(snap);
        if (snap.final) {
            break;
        }

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, st, interval_, [] { return false; });
    }
    running_.store(false);
}

void ProgressAggregator::emit_(const ProgressSnapshot& snapshot) {
    samples_.fetch_add(1);
    if (snapshot.final) {
        final_emitted_.store(true);
    }
    if (sink_) {
        sink_(snapshot);
    }
}

} // namespace parcp::infra
