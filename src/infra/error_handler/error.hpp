#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace pcopy::infra {

enum class ErrorCode {
    // Plan-time: the whole operation is aborted before any transfer
    SourceNotFound,
    DestinationConflict,
    InvalidArgument,

    // Unit-level: the unit fails, the run continues
    AlreadyExists,
    CrossDevice,
    UnsupportedOperation,
    TraversalError,
    IoFailure,
    HashMismatch,
    Interrupted,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

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

// Builds an error from errno (or any std::error_code value) with the failing
// operation and path in the message.
[[nodiscard]] auto make_system_error(
    ErrorCode code,
    std::string_view operation,
    std::string_view path,
    int err,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto log_and_return(Error&& err) -> Error;

// Exit codes of the pcopy process
inline constexpr int EXIT_RUN_OK = 0;
inline constexpr int EXIT_RUN_HAD_FAILURES = 1;
inline constexpr int EXIT_ABORTED = 2;
inline constexpr int EXIT_INTERRUPTED = 130;

} // namespace pcopy::infra
