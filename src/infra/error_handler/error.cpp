#include "error.hpp"
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>

namespace parcp::infra {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InputNotFound:      return "InputNotFound";
        case ErrorCode::OutputCreateFailed: return "OutputCreateFailed";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::ShortRead:          return "ShortRead";
        case ErrorCode::IOError:            return "IOError";
        case ErrorCode::Timeout:            return "Timeout";
        case ErrorCode::Cancelled:          return "Cancelled";
        case ErrorCode::ContentMismatch:    return "ContentMismatch";
        case ErrorCode::ClockError:         return "ClockError";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    return code != ErrorCode::ClockError;
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::ClockError: return EXIT_SUCCESS;
        case ErrorCode::Cancelled:  return 130; // SIGINT
        default:                    return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_errno_error(ErrorCode code, std::string_view message, int err,
                       const std::source_location& loc) {
    return Error{code, fmt::format("{}: {}", message, std::strerror(err)), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace parcp::infra
