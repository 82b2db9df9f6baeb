/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the session lifecycle core and its boundary
 *
 * Core components report failures by throwing one of the SandkeepError
 * subclasses below. The boundary (SessionService) catches them and hands the
 * caller an Outcome<T>: either the success payload or a tagged Error whose
 * kind is stable across releases, so the outer layer can pick a status code
 * without re-deriving semantics.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace sandkeep {
namespace core {

/**
 * @enum ErrorKind
 * @brief Stable failure categories visible at the boundary
 */
enum class ErrorKind {
    VALIDATION,           ///< Malformed request, rejected before touching the registry
    AUTH,                 ///< Bad or missing credentials
    RESOURCE_EXHAUSTED,   ///< Session ceiling reached, nothing provisioned
    PROVISION,            ///< Daemon or image failure while creating a sandbox
    SANDBOX_UNAVAILABLE,  ///< Sandbox vanished and could not be recreated
    EXECUTION_TIMEOUT,    ///< Deadline elapsed (normally reported as a result)
    FILE_NOT_FOUND,       ///< Unknown, stale-generation or cross-session file id
    INTERNAL              ///< Anything else
};

/// Stable snake_case code for an error kind ("validation_error", ...)
const char* ErrorCode(ErrorKind kind);

/// HTTP status the outer layer is expected to use for an error kind
int HttpStatusHint(ErrorKind kind);

/**
 * @class SandkeepError
 * @brief Base of every exception thrown by the core
 */
class SandkeepError : public std::runtime_error {
public:
    SandkeepError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public SandkeepError {
public:
    explicit ValidationError(const std::string& message)
        : SandkeepError(ErrorKind::VALIDATION, message) {}
};

class AuthError : public SandkeepError {
public:
    explicit AuthError(const std::string& message)
        : SandkeepError(ErrorKind::AUTH, message) {}
};

class ResourceExhausted : public SandkeepError {
public:
    explicit ResourceExhausted(const std::string& message)
        : SandkeepError(ErrorKind::RESOURCE_EXHAUSTED, message) {}
};

class ProvisionError : public SandkeepError {
public:
    explicit ProvisionError(const std::string& message)
        : SandkeepError(ErrorKind::PROVISION, message) {}
};

class SandboxUnavailable : public SandkeepError {
public:
    explicit SandboxUnavailable(const std::string& message)
        : SandkeepError(ErrorKind::SANDBOX_UNAVAILABLE, message) {}
};

class ExecutionTimeout : public SandkeepError {
public:
    explicit ExecutionTimeout(const std::string& message)
        : SandkeepError(ErrorKind::EXECUTION_TIMEOUT, message) {}
};

class FileNotFound : public SandkeepError {
public:
    explicit FileNotFound(const std::string& message)
        : SandkeepError(ErrorKind::FILE_NOT_FOUND, message) {}
};

/**
 * @struct Error
 * @brief Tagged failure returned across the boundary
 */
struct Error {
    ErrorKind kind{ErrorKind::INTERNAL};  ///< Failure category
    std::string message;                  ///< Human-readable detail
};

/**
 * @brief Success payload or tagged error
 *
 * @code
 * auto outcome = service.Upload("s1", bytes, "image.png");
 * if (auto* uploaded = std::get_if<UploadResponse>(&outcome)) {
 *     spdlog::info("uploaded {}", uploaded->file.id);
 * } else {
 *     const auto& err = std::get<Error>(outcome);
 * }
 * @endcode
 */
template <typename T>
using Outcome = std::variant<T, Error>;

template <typename T>
bool IsOk(const Outcome<T>& outcome) {
    return std::holds_alternative<T>(outcome);
}

/// Convert a caught core exception into a boundary error
inline Error ToError(const SandkeepError& e) {
    return Error{e.Kind(), e.what()};
}

} // namespace core
} // namespace sandkeep
