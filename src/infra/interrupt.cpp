#include "interrupt.hpp"
#include <unistd.h>

namespace parcp::infra {

std::atomic<bool> g_interrupted{false};
std::atomic<int> g_interrupt_signal{0};

namespace {

constexpr char kShutdownNotice[] = "\nReceived interrupt signal. Stopping workers...\n";

// Внутри обработчика только async-signal-safe вызовы: atomic и write(2)
void signal_handler(int sig) {
    if (sig != SIGINT && sig != SIGTERM) return;

    g_interrupt_signal.store(sig, std::memory_order_relaxed);
    if (!g_interrupted.exchange(true, std::memory_order_relaxed)) {
        const auto written = ::write(STDERR_FILENO, kShutdownNotice, sizeof(kShutdownNotice) - 1);
        (void)written;
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace parcp::infra
