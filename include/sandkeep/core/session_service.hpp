/**
 * @file session_service.hpp
 * @brief Boundary façade over the session core
 *
 * Every method returns an Outcome: the payload or a tagged Error. No core
 * exception escapes this class.
 *
 * **Session references**: callers may pass their own key or the 21-char
 * external id a previous response returned. A known external id maps to its
 * session; anything else is sanitized to `[A-Za-z0-9_-]` and used as the
 * key. Responses always carry the external id.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/errors.hpp"
#include "sandkeep/core/execution_dispatcher.hpp"
#include "sandkeep/core/session_registry.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @struct FileView
 * @brief A file as presented to clients
 */
struct FileView {
    std::string id;     ///< 21-char file id
    std::string name;   ///< Base name
    std::string url;    ///< Download URL
    std::string type;   ///< Content type
};

struct ExecuteResponse {
    std::string session_id;               ///< External session id
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
    bool timed_out{false};
    std::chrono::milliseconds duration{0};
    std::vector<FileView> files;
};

struct UploadResponse {
    std::string session_id;
    FileView file;
};

struct DownloadResponse {
    std::string bytes;
    std::string file_name;
    std::string content_type;
    bool is_inline{false};   ///< Render in browser (images, PDF) rather than attach
};

struct TerminateResponse {
    std::string session_id;
    bool existed{false};
};

struct HealthResponse {
    std::string status;      ///< "ok" or "degraded"
    std::size_t active_sessions{0};
    std::size_t max_sessions{0};
    bool runtime_available{false};
};

/**
 * @struct ServiceOptions
 * @brief Boundary settings
 */
struct ServiceOptions {
    std::string public_base_url{"http://localhost:8000"};
    std::size_t max_upload_bytes{50 * 1024 * 1024};
};

/**
 * @class SessionService
 * @brief execute / upload / listFiles / download / terminate / health
 *
 * **Usage Example**:
 * @code
 * SessionService service(registry, dispatcher, options);
 *
 * auto uploaded = service.Upload("", csv_bytes, "data.csv");
 * const auto& file = std::get<UploadResponse>(uploaded);
 *
 * auto ran = service.Execute(file.session_id,
 *                            "import pandas as pd\npd.read_csv('data.csv').shape",
 *                            "python", std::nullopt);
 * @endcode
 */
class SessionService {
public:
    SessionService(SessionRegistry& registry,
                   ExecutionDispatcher& dispatcher,
                   ServiceOptions options);

    Outcome<ExecuteResponse> Execute(const std::string& session_ref,
                                     const std::string& code,
                                     const std::string& lang,
                                     const std::optional<std::chrono::seconds>& timeout);

    /**
     * @brief Store a file in a session, creating the session if needed
     *
     * An empty session reference starts a new session with a generated id.
     */
    Outcome<UploadResponse> Upload(const std::string& session_ref,
                                   const std::string& bytes,
                                   const std::string& file_name);

    /// Files of a session; an unknown session has none (nothing is provisioned)
    Outcome<std::vector<FileView>> ListFiles(const std::string& session_ref);

    Outcome<DownloadResponse> Download(const std::string& session_ref,
                                       const std::string& file_id);

    /// Explicit termination; terminating an unknown session succeeds
    Outcome<TerminateResponse> Terminate(const std::string& session_ref);

    Outcome<HealthResponse> Health();

    /// `<public_base_url>/download/<session external id>/<file id>`
    std::string DownloadUrl(const std::string& session_external_id,
                            const std::string& file_id) const;

private:
    SessionRegistry& registry_;
    ExecutionDispatcher& dispatcher_;
    ServiceOptions options_;

    std::string ResolveKey(const std::string& session_ref, bool allow_generate) const;
    FileView ToView(const FileRecord& record, const std::string& session_external_id) const;

    template <typename T, typename Fn>
    Outcome<T> Guard(const char* operation, Fn&& fn);
};

} // namespace core
} // namespace sandkeep
