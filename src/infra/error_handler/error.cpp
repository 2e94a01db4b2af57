#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>

namespace ferry::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::FileNotFound:           return "FileNotFound";
        case ErrorCode::PermissionDenied:       return "PermissionDenied";
        case ErrorCode::InvalidPath:            return "InvalidPath";
        case ErrorCode::UnsupportedFeature:     return "UnsupportedFeature";
        case ErrorCode::AlreadyExists:          return "AlreadyExists";
        case ErrorCode::ArchiveIOFailure:       return "ArchiveIOFailure";
        case ErrorCode::ConcurrentRunDetected:  return "ConcurrentRunDetected";
        case ErrorCode::PreconditionFailed:     return "PreconditionFailed";
        case ErrorCode::SourceUnreadable:       return "SourceUnreadable";
        case ErrorCode::ReconciliationMismatch: return "ReconciliationMismatch";
        case ErrorCode::DiskFull:               return "DiskFull";
        case ErrorCode::ChecksumMismatch:       return "ChecksumMismatch";
        case ErrorCode::Interrupted:            return "Interrupted";
        case ErrorCode::Unknown:                return "Unknown";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SourceUnreadable:
        case ErrorCode::ReconciliationMismatch:
            return false;
        default:
            return true;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::DiskFull:              return 20;
        case ErrorCode::ConcurrentRunDetected: return 21;
        case ErrorCode::ChecksumMismatch:      return 22;
        case ErrorCode::Interrupted:           return 130; // SIGINT
        default:                               return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_errno_error(ErrorCode code, int err, std::string_view what,
                       const std::source_location& loc) {
    // ENOSPC всегда считаем нехваткой места, независимо от контекста
    if (err == ENOSPC || err == EDQUOT) {
        code = ErrorCode::DiskFull;
    }
    return Error{code, fmt::format("{}: {}", what, std::strerror(err)), loc};
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

} // namespace ferry::infra
