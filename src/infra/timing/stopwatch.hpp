#pragma once

#include "../error_handler/error.hpp"

namespace parcp::infra {

/// Монотонное время в секундах (clock_gettime(CLOCK_MONOTONIC)).
/// Ошибка часов -> ErrorCode::ClockError, на саму копию не влияет.
[[nodiscard]] auto monotonic_seconds() -> Result<double>;

class Stopwatch {
public:
    Stopwatch();

    // Секунды с момента создания; ClockError, если старт или финиш не удалось снять
    [[nodiscard]] auto elapsed_seconds() const -> Result<double>;

private:
    Result<double> start_;
};

} // namespace parcp::infra
