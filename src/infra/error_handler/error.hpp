#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace parcp::infra {

enum class ErrorCode {
    // Ошибки задания (копия не выполнена)
    InputNotFound,
    OutputCreateFailed,
    InvalidArgument,

    // Ошибки воркеров
    ShortRead,       // источник укоротился или изменился во время копии
    IOError,
    Timeout,
    Cancelled,

    // Проверка после копии
    ContentMismatch,

    // Не влияет на саму копию
    ClockError,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    // Фатальная = задание считается проваленным
    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Ошибка из errno: сообщение дополняется текстом errno
[[nodiscard]] auto make_errno_error(
    ErrorCode code,
    std::string_view message,
    int err,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace parcp::infra
