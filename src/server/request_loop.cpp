/**
 * @file request_loop.cpp
 * @brief JSON-lines request handling
 *
 * @date 2025
 */

#include "sandkeep/server/request_loop.hpp"
#include "sandkeep/server/stop_signals.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <openssl/crypto.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

using json = nlohmann::json;

namespace sandkeep {
namespace server {

namespace {

using core::Error;
using core::ErrorKind;
using utils::StringUtils;

constexpr double kTimeoutCeilingSeconds = 24.0 * 60 * 60;

std::string StringField(const json& request, const char* key) {
    if (!request.contains(key) || request[key].is_null()) {
        return {};
    }
    if (!request[key].is_string()) {
        throw core::ValidationError(std::string("'") + key + "' must be a string");
    }
    return request[key].get<std::string>();
}

json FileToJson(const core::FileView& file) {
    return json{
        {"id", file.id},
        {"name", file.name},
        {"url", file.url},
        {"type", file.type}
    };
}

json ToJson(const core::ExecuteResponse& r) {
    json files = json::array();
    for (const auto& file : r.files) {
        files.push_back(FileToJson(file));
    }
    return json{
        {"session_id", r.session_id},
        {"stdout", r.stdout_output},
        {"stderr", r.stderr_output},
        {"exit_code", r.exit_code},
        {"timed_out", r.timed_out},
        {"duration_ms", r.duration.count()},
        {"files", files}
    };
}

json ToJson(const core::UploadResponse& r) {
    auto body = FileToJson(r.file);
    body["session_id"] = r.session_id;
    return body;
}

json ToJson(const std::vector<core::FileView>& files) {
    json list = json::array();
    for (const auto& file : files) {
        list.push_back(FileToJson(file));
    }
    return list;
}

json ToJson(const core::DownloadResponse& r) {
    return json{
        {"file_name", r.file_name},
        {"content_type", r.content_type},
        {"inline", r.is_inline},
        {"size", r.bytes.size()},
        {"data", StringUtils::ToBase64(r.bytes)}
    };
}

json ToJson(const core::TerminateResponse& r) {
    return json{
        {"session_id", r.session_id},
        {"existed", r.existed}
    };
}

json ToJson(const core::HealthResponse& r) {
    return json{
        {"status", r.status},
        {"active_sessions", r.active_sessions},
        {"max_sessions", r.max_sessions},
        {"runtime_available", r.runtime_available}
    };
}

template <typename T>
json Respond(const std::string& op, const core::Outcome<T>& outcome) {
    if (const auto* error = std::get_if<Error>(&outcome)) {
        return RequestLoop::ErrorResponse(op, *error);
    }
    return json{
        {"ok", true},
        {"op", op},
        {"result", ToJson(std::get<T>(outcome))}
    };
}

} // anonymous namespace

RequestLoop::RequestLoop(core::SessionService& service, std::string api_key, std::size_t workers)
    : service_(service)
    , api_key_(std::move(api_key))
    , workers_(workers == 0 ? 1 : workers) {
}

json RequestLoop::ErrorResponse(const std::string& op, const Error& error) {
    return json{
        {"ok", false},
        {"op", op},
        {"error", {
            {"code", core::ErrorCode(error.kind)},
            {"message", error.message},
            {"status", core::HttpStatusHint(error.kind)}
        }}
    };
}

std::optional<std::chrono::seconds> RequestLoop::ParseTimeout(const json& request) {
    if (!request.contains("timeout") || request["timeout"].is_null()) {
        return std::nullopt;
    }
    const auto& value = request["timeout"];
    if (!value.is_number()) {
        throw core::ValidationError("'timeout' must be a number of seconds");
    }
    const double seconds = value.get<double>();
    if (!std::isfinite(seconds)) {
        throw core::ValidationError("'timeout' must be a finite number of seconds");
    }
    // The dispatcher applies the configured bounds; this only keeps the cast defined
    const double clamped = std::min(std::max(seconds, 0.0), kTimeoutCeilingSeconds);
    return std::chrono::seconds(static_cast<long long>(clamped));
}

bool RequestLoop::Authorized(const json& request) const {
    if (api_key_.empty()) {
        return true;
    }
    if (!request.contains("api_key") || !request["api_key"].is_string()) {
        return false;
    }
    const auto& presented = request["api_key"].get_ref<const std::string&>();
    return presented.size() == api_key_.size() &&
           CRYPTO_memcmp(presented.data(), api_key_.data(), api_key_.size()) == 0;
}

// ============================================================================
// DISPATCH
// ============================================================================

json RequestLoop::Handle(const json& request) {
    if (!request.is_object()) {
        return ErrorResponse("", Error{ErrorKind::VALIDATION, "Request must be a JSON object"});
    }

    std::string op;
    json response;
    try {
        op = StringField(request, "op");

        if (op == "health") {
            response = Respond(op, service_.Health());
        } else if (op != "execute" && op != "upload" && op != "files" &&
                   op != "download" && op != "terminate") {
            response = ErrorResponse(op, Error{ErrorKind::VALIDATION, "Unknown op: '" + op + "'"});
        } else if (!Authorized(request)) {
            spdlog::warn("Rejected {} request with invalid API key", op);
            response = ErrorResponse(op, Error{ErrorKind::AUTH, "Invalid API Key"});
        } else if (op == "execute") {
            const auto timeout = ParseTimeout(request);
            response = Respond(op, service_.Execute(StringField(request, "session_id"),
                                                    StringField(request, "code"),
                                                    StringField(request, "lang"),
                                                    timeout));
        } else if (op == "upload") {
            std::string bytes;
            try {
                bytes = StringUtils::FromBase64(StringField(request, "data"));
            }
            catch (const std::invalid_argument& e) {
                throw core::ValidationError(std::string("'data' is not valid base64: ") + e.what());
            }
            response = Respond(op, service_.Upload(StringField(request, "session_id"),
                                                   bytes,
                                                   StringField(request, "file_name")));
        } else if (op == "files") {
            response = Respond(op, service_.ListFiles(StringField(request, "session_id")));
        } else if (op == "download") {
            response = Respond(op, service_.Download(StringField(request, "session_id"),
                                                     StringField(request, "file_id")));
        } else {
            response = Respond(op, service_.Terminate(StringField(request, "session_id")));
        }
    }
    catch (const core::SandkeepError& e) {
        response = ErrorResponse(op, core::ToError(e));
    }
    catch (const std::exception& e) {
        spdlog::error("Request {} failed: {}", op, e.what());
        response = ErrorResponse(op, Error{ErrorKind::INTERNAL, "An internal error occurred"});
    }

    if (request.contains("id")) {
        response["id"] = request["id"];
    }
    return response;
}

std::string RequestLoop::HandleLine(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    }
    catch (const json::parse_error& e) {
        return ErrorResponse("", Error{ErrorKind::VALIDATION,
                                       std::string("Malformed JSON: ") + e.what()})
            .dump(-1, ' ', false, json::error_handler_t::replace);
    }
    // Program output is not guaranteed to be valid UTF-8
    return Handle(request).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::size_t RequestLoop::Run(std::istream& in, std::ostream& out, const std::atomic<bool>* stop) {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<std::string> pending;
    bool no_more = false;
    std::mutex out_mutex;
    std::atomic<std::size_t> handled{0};

    auto answer = [&](const std::string& line) {
        const auto response = HandleLine(line);
        std::lock_guard<std::mutex> lock(out_mutex);
        out << response << '\n';
        out.flush();
        ++handled;
    };

    auto worker = [&]() {
        for (;;) {
            std::string line;
            {
                std::unique_lock<std::mutex> lock(mutex);
                ready.wait(lock, [&] { return no_more || !pending.empty(); });
                if (pending.empty()) {
                    return;
                }
                line = std::move(pending.front());
                pending.pop_front();
            }
            answer(line);
        }
    };

    std::vector<std::thread> workers;
    if (workers_ > 1) {
        StopSignals::Blocked blocked;
        workers.reserve(workers_);
        for (std::size_t i = 0; i < workers_; ++i) {
            workers.emplace_back(worker);
        }
    }

    std::string line;
    while ((stop == nullptr || !stop->load()) && std::getline(in, line)) {
        if (StringUtils::Trim(line).empty()) {
            continue;
        }
        if (workers.empty()) {
            answer(line);
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.push_back(std::move(line));
        }
        ready.notify_one();
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        no_more = true;
    }
    ready.notify_all();
    for (auto& thread : workers) {
        thread.join();
    }

    spdlog::info("Request loop finished after {} request(s)", handled.load());
    return handled.load();
}

} // namespace server
} // namespace sandkeep
