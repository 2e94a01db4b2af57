#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace ferry::infra {

enum class ErrorCode {
    // Фатальные ошибки (программа завершается)
    FileNotFound,
    PermissionDenied,
    InvalidPath,
    UnsupportedFeature,
    AlreadyExists,
    ArchiveIOFailure,       // запись/чтение архива, порча архива
    ConcurrentRunDetected,  // архив уже собирается другим процессом
    PreconditionFailed,     // окружение не готово (required_env)

    // Восстанавливаемые (пропускаем и продолжаем)
    SourceUnreadable,
    ReconciliationMismatch,

    // Фатальные, но со своим кодом выхода
    DiskFull,
    ChecksumMismatch,
    Interrupted,

    // Системные
    Unknown,
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

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// errno -> Error, with the failing path and operation in the message
[[nodiscard]] auto make_errno_error(
    ErrorCode code,
    int err,
    std::string_view what,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace ferry::infra
