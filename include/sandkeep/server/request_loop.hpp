/**
 * @file request_loop.hpp
 * @brief JSON-lines front end for SessionService
 *
 * One request object per input line, one response object per output line.
 * The HTTP layer (or an operator with a shell) drives the service through
 * this loop.
 *
 * **Requests**:
 * ```
 * {"op":"execute",  "api_key":"...", "session_id":"...", "code":"...", "lang":"python", "timeout":10}
 * {"op":"upload",   "api_key":"...", "session_id":"...", "file_name":"a.csv", "data":"<base64>"}
 * {"op":"files",    "api_key":"...", "session_id":"..."}
 * {"op":"download", "api_key":"...", "session_id":"...", "file_id":"..."}
 * {"op":"terminate","api_key":"...", "session_id":"..."}
 * {"op":"health"}
 * ```
 * An optional `"id"` is echoed back. With more than one worker, responses
 * are written as requests finish and may come out of order; clients match
 * them by `"id"`. Requests for the same session still run one at a time.
 *
 * **Responses**:
 * ```
 * {"ok":true,  "op":"execute", "result":{...}}
 * {"ok":false, "op":"execute", "error":{"code":"validation_error","message":"...","status":400}}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/session_service.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

namespace sandkeep {
namespace server {

/**
 * @class RequestLoop
 * @brief Parses, authenticates and dispatches JSON-lines requests
 */
class RequestLoop {
public:
    /**
     * @param service Session service to dispatch to
     * @param api_key Required `api_key` value (empty disables the check)
     * @param workers Requests handled concurrently by Run (at least 1)
     */
    RequestLoop(core::SessionService& service, std::string api_key, std::size_t workers = 1);

    /**
     * @brief Handle one parsed request
     * @return Response object; never throws for a bad request
     */
    nlohmann::json Handle(const nlohmann::json& request);

    /// Parse one line and handle it
    std::string HandleLine(const std::string& line);

    /**
     * @brief Serve until end of input or until `stop` becomes true
     *
     * Requests already read are answered before returning.
     *
     * @return Number of requests answered
     */
    std::size_t Run(std::istream& in, std::ostream& out,
                    const std::atomic<bool>* stop = nullptr);

    /// Error response body for a failure
    static nlohmann::json ErrorResponse(const std::string& op, const core::Error& error);

    /**
     * @brief Read a request's `timeout` field
     * @throws core::ValidationError if present and not a finite number
     */
    static std::optional<std::chrono::seconds> ParseTimeout(const nlohmann::json& request);

private:
    core::SessionService& service_;
    std::string api_key_;
    std::size_t workers_;

    bool Authorized(const nlohmann::json& request) const;
};

} // namespace server
} // namespace sandkeep
