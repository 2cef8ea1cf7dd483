#include "stopwatch.hpp"
#include <cerrno>
#include <ctime>

namespace parcp::infra {

auto monotonic_seconds() -> Result<double> {
    timespec ts{};
    if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
        return std::unexpected(make_errno_error(ErrorCode::ClockError,
                                                "clock_gettime failed", errno));
    }
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
}

Stopwatch::Stopwatch()
    : start_(monotonic_seconds())
{}

auto Stopwatch::elapsed_seconds() const -> Result<double> {
    if (!start_) {
        return std::unexpected(start_.error());
    }
    auto now = monotonic_seconds();
    if (!now) {
        return std::unexpected(std::move(now.error()));
    }
    return *now - *start_;
}

} // namespace parcp::infra
