/**
 * @file errors.cpp
 * @brief Error kinds, codes and status hints
 *
 * @date 2025
 */

#include "sandkeep/core/errors.hpp"

namespace sandkeep {
namespace core {

const char* ErrorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation_error";
        case ErrorKind::AUTH: return "auth_error";
        case ErrorKind::RESOURCE_EXHAUSTED: return "resource_exhausted";
        case ErrorKind::PROVISION: return "provision_error";
        case ErrorKind::SANDBOX_UNAVAILABLE: return "sandbox_unavailable";
        case ErrorKind::EXECUTION_TIMEOUT: return "execution_timeout";
        case ErrorKind::FILE_NOT_FOUND: return "file_not_found";
        case ErrorKind::INTERNAL: return "internal_error";
    }
    return "internal_error";
}

int HttpStatusHint(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return 400;
        case ErrorKind::AUTH: return 401;
        case ErrorKind::RESOURCE_EXHAUSTED: return 503;
        case ErrorKind::PROVISION: return 500;
        case ErrorKind::SANDBOX_UNAVAILABLE: return 502;
        case ErrorKind::EXECUTION_TIMEOUT: return 200;
        case ErrorKind::FILE_NOT_FOUND: return 404;
        case ErrorKind::INTERNAL: return 500;
    }
    return 500;
}

} // namespace core
} // namespace sandkeep
