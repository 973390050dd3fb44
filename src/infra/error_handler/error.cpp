#include "error.hpp"
#include <fmt/core.h>

namespace pcopy::infra {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceNotFound:       return "SourceNotFound";
        case ErrorCode::DestinationConflict:  return "DestinationConflict";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::AlreadyExists:        return "AlreadyExists";
        case ErrorCode::CrossDevice:          return "CrossDevice";
        case ErrorCode::UnsupportedOperation: return "UnsupportedOperation";
        case ErrorCode::TraversalError:       return "TraversalError";
        case ErrorCode::IoFailure:            return "IoFailure";
        case ErrorCode::HashMismatch:         return "HashMismatch";
        case ErrorCode::Interrupted:          return "Interrupted";
        case ErrorCode::Unknown:              break;
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SourceNotFound:
        case ErrorCode::InvalidArgument:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::Interrupted:         return EXIT_INTERRUPTED;
        case ErrorCode::SourceNotFound:
        case ErrorCode::DestinationConflict:
        case ErrorCode::InvalidArgument:     return EXIT_ABORTED;
        default:                             return EXIT_RUN_HAD_FAILURES;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_system_error(ErrorCode code, std::string_view operation,
                        std::string_view path, int err,
                        const std::source_location& loc) {
    return Error{code,
                 fmt::format("{} '{}': {}", operation, path,
                             std::generic_category().message(err)),
                 loc};
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

} // namespace pcopy::infra
