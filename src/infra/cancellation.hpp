#pragma once

#include <stop_token>
#include "interrupt.hpp"

namespace parcp::infra {

// Общий токен отмены одного задания: явный запрос (fail_fast) или сигнал процесса
class CancellationToken {
public:
    void request_cancel() noexcept { source_.request_stop(); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return source_.stop_requested() || is_interrupted();
    }

    [[nodiscard]] auto stop_token() const noexcept -> std::stop_token {
        return source_.get_token();
    }

private:
    std::stop_source source_;
};

} // namespace parcp::infra
