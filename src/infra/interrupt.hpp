#pragma once

#include <atomic>
#include <csignal>

namespace parcp::infra {

extern std::atomic<bool> g_interrupted;
extern std::atomic<int> g_interrupt_signal;

// SIGINT/SIGTERM выставляют флаг; воркеры проверяют его на каждой итерации.
// Первый сигнал пишет одну строку в stderr через write(2).
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Номер сигнала, который прервал работу, 0 если не было
inline int interrupt_signal() {
    return g_interrupt_signal.load(std::memory_order_relaxed);
}

// Для тестов и программной отмены
inline void clear_interrupt() {
    g_interrupt_signal.store(0, std::memory_order_relaxed);
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace parcp::infra
