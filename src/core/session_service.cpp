/**
 * @file session_service.cpp
 * @brief Boundary operations and exception-to-Outcome conversion
 *
 * @date 2025
 */

#include "sandkeep/core/session_service.hpp"
#include "sandkeep/utils/id_utils.hpp"
#include "sandkeep/utils/mime_types.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <utility>
#include <variant>

namespace sandkeep {
namespace core {

using utils::IdUtils;
using utils::StringUtils;

SessionService::SessionService(SessionRegistry& registry,
                               ExecutionDispatcher& dispatcher,
                               ServiceOptions options)
    : registry_(registry)
    , dispatcher_(dispatcher)
    , options_(std::move(options)) {
    while (StringUtils::EndsWith(options_.public_base_url, "/")) {
        options_.public_base_url.pop_back();
    }
}

// ============================================================================
// HELPERS
// ============================================================================

template <typename T, typename Fn>
Outcome<T> SessionService::Guard(const char* operation, Fn&& fn) {
    try {
        return Outcome<T>(std::in_place_index<0>, fn());
    }
    catch (const SandkeepError& e) {
        switch (e.Kind()) {
            case ErrorKind::VALIDATION:
            case ErrorKind::FILE_NOT_FOUND:
            case ErrorKind::AUTH:
                spdlog::warn("{} rejected: {}", operation, e.what());
                break;
            default:
                spdlog::error("{} failed: {}", operation, e.what());
                break;
        }
        return Outcome<T>(std::in_place_index<1>, ToError(e));
    }
    catch (const std::exception& e) {
        spdlog::error("{} failed: {}", operation, e.what());
        return Outcome<T>(std::in_place_index<1>,
                          Error{ErrorKind::INTERNAL, "An internal error occurred"});
    }
}

std::string SessionService::ResolveKey(const std::string& session_ref, bool allow_generate) const {
    const auto ref = StringUtils::Trim(session_ref);
    if (ref.empty()) {
        if (!allow_generate) {
            throw ValidationError("session_id is required");
        }
        return IdUtils::GenerateId();
    }

    if (auto key = registry_.KeyForExternalId(ref)) {
        return *key;
    }

    auto key = IdUtils::SanitizeId(ref);
    if (key.empty()) {
        throw ValidationError("session_id contains no usable characters");
    }
    return key;
}

std::string SessionService::DownloadUrl(const std::string& session_external_id,
                                        const std::string& file_id) const {
    return options_.public_base_url + "/download/" + session_external_id + "/" + file_id;
}

FileView SessionService::ToView(const FileRecord& record,
                                const std::string& session_external_id) const {
    FileView view;
    view.id = record.external_id;
    view.name = record.FileName();
    view.url = DownloadUrl(session_external_id, record.external_id);
    view.type = record.content_type;
    return view;
}

// ============================================================================
// OPERATIONS
// ============================================================================

Outcome<ExecuteResponse> SessionService::Execute(
    const std::string& session_ref,
    const std::string& code,
    const std::string& lang,
    const std::optional<std::chrono::seconds>& timeout) {

    return Guard<ExecuteResponse>("execute", [&]() {
        ExecutionRequest request;
        request.session_key = ResolveKey(session_ref, true);
        request.code = code;
        request.lang = lang.empty() ? "python" : lang;
        request.timeout = timeout;

        auto result = dispatcher_.Execute(request);

        ExecuteResponse response;
        response.session_id = result.external_id;
        response.stdout_output = std::move(result.stdout_output);
        response.stderr_output = std::move(result.stderr_output);
        response.exit_code = result.exit_code;
        response.timed_out = result.timed_out;
        response.duration = result.duration;
        for (const auto& record : result.files) {
            response.files.push_back(ToView(record, result.external_id));
        }
        return response;
    });
}

Outcome<UploadResponse> SessionService::Upload(const std::string& session_ref,
                                               const std::string& bytes,
                                               const std::string& file_name) {
    return Guard<UploadResponse>("upload", [&]() {
        if (bytes.size() > options_.max_upload_bytes) {
            throw ValidationError("File exceeds the upload limit of " +
                                  std::to_string(options_.max_upload_bytes) + " bytes");
        }
        const auto name = IdUtils::SanitizeFileName(file_name);
        if (name.empty()) {
            throw ValidationError("Invalid file name: '" + file_name + "'");
        }

        const auto key = ResolveKey(session_ref, true);
        auto lease = registry_.Resolve(key);

        const auto relative = registry_.Workspace().WriteFile(lease.Key(), name, bytes);
        const auto id = lease.Files().Register(relative, utils::MimeTypes::Guess(relative));
        lease.Touch();

        spdlog::info("Uploaded {} ({} bytes) to session {} as {}",
                     name, bytes.size(), lease.Key(), id);

        UploadResponse response;
        response.session_id = lease.ExternalId();
        response.file = ToView(lease.Files().Resolve(lease.Key(), id), lease.ExternalId());
        return response;
    });
}

Outcome<std::vector<FileView>> SessionService::ListFiles(const std::string& session_ref) {
    return Guard<std::vector<FileView>>("files", [&]() {
        std::vector<FileView> views;
        const auto key = ResolveKey(session_ref, false);

        auto lease = registry_.Acquire(key);
        if (!lease) {
            return views;
        }

        auto& workspace = registry_.Workspace();
        auto& files = lease->Files();
        std::set<std::filesystem::path> existing;
        for (const auto& [path, stamp] : workspace.Scan(key)) {
            existing.insert(path);
            if (SessionWorkspace::IsVisible(path) && !files.Find(path)) {
                files.Register(path, utils::MimeTypes::Guess(path));
            }
        }
        files.Prune(existing);

        for (const auto& record : files.List()) {
            views.push_back(ToView(record, lease->ExternalId()));
        }
        return views;
    });
}

Outcome<DownloadResponse> SessionService::Download(const std::string& session_ref,
                                                   const std::string& file_id) {
    return Guard<DownloadResponse>("download", [&]() {
        if (!IdUtils::IsExternalId(file_id)) {
            throw FileNotFound("File not found: " + file_id);
        }
        const auto key = ResolveKey(session_ref, false);

        auto lease = registry_.Acquire(key);
        if (!lease) {
            throw FileNotFound("File not found: " + file_id);
        }

        const auto record = lease->Files().Resolve(key, file_id);

        DownloadResponse response;
        response.bytes = registry_.Workspace().ReadFile(key, record.relative_path);
        response.file_name = record.FileName();
        response.content_type = record.content_type;
        response.is_inline = utils::MimeTypes::IsInline(record.content_type);
        return response;
    });
}

Outcome<TerminateResponse> SessionService::Terminate(const std::string& session_ref) {
    return Guard<TerminateResponse>("terminate", [&]() {
        const auto key = ResolveKey(session_ref, false);
        TerminateResponse response;
        response.session_id = registry_.ExternalIdForKey(key).value_or(StringUtils::Trim(session_ref));
        response.existed = registry_.Terminate(key);
        return response;
    });
}

Outcome<HealthResponse> SessionService::Health() {
    return Guard<HealthResponse>("health", [&]() {
        HealthResponse response;
        response.runtime_available = registry_.Controller().IsRuntimeAvailable();
        response.status = response.runtime_available ? "ok" : "degraded";
        response.active_sessions = registry_.Size();
        response.max_sessions = registry_.MaxSessions();
        return response;
    });
}

} // namespace core
} // namespace sandkeep
