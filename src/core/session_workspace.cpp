/**
 * @file session_workspace.cpp
 * @brief Session directory management
 *
 * @date 2025
 */

#include "sandkeep/core/session_workspace.hpp"
#include "sandkeep/core/errors.hpp"
#include "sandkeep/utils/id_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace sandkeep {
namespace core {

namespace {

void RequireKey(const std::string& session_key) {
    if (session_key.empty() || utils::IdUtils::SanitizeId(session_key) != session_key) {
        throw ValidationError("Invalid session key: '" + session_key + "'");
    }
}

bool IsWithin(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++cand_it) {
        // Trailing separator yields an empty element
        if (root_it->empty()) {
            continue;
        }
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

SessionWorkspace::SessionWorkspace(fs::path host_root,
                                   fs::path internal_root,
                                   fs::path sandbox_mount)
    : host_root_(std::move(host_root))
    , internal_root_(std::move(internal_root))
    , sandbox_mount_(std::move(sandbox_mount)) {
    if (internal_root_.empty()) {
        internal_root_ = host_root_;
    }
    spdlog::debug("Workspace roots: host={} internal={} sandbox={}",
                  host_root_.string(), internal_root_.string(), sandbox_mount_.string());
}

// ============================================================================
// PATH TRANSLATION
// ============================================================================

fs::path SessionWorkspace::HostDir(const std::string& session_key) const {
    RequireKey(session_key);
    return host_root_ / session_key;
}

fs::path SessionWorkspace::InternalDir(const std::string& session_key) const {
    RequireKey(session_key);
    return internal_root_ / session_key;
}

fs::path SessionWorkspace::ResolveInternal(const std::string& session_key,
                                           const fs::path& relative_path) const {
    if (relative_path.empty() || relative_path.is_absolute()) {
        throw FileNotFound("Invalid file path: " + relative_path.string());
    }

    std::error_code ec;
    const auto dir = fs::weakly_canonical(InternalDir(session_key), ec);
    if (ec) {
        throw FileNotFound("Session storage unavailable: " + ec.message());
    }
    const auto candidate = fs::weakly_canonical(dir / relative_path, ec);
    if (ec || !IsWithin(dir, candidate) || candidate == dir) {
        spdlog::warn("Rejected path outside session {}: {}", session_key, relative_path.string());
        throw FileNotFound("File not found: " + relative_path.string());
    }
    return candidate;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void SessionWorkspace::Prepare(const std::string& session_key) const {
    const auto dir = InternalDir(session_key);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create session directory " + dir.string() + ": " + ec.message());
    }
    // The sandbox user is not necessarily the owner
    fs::permissions(dir, fs::perms::all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Cannot set permissions on {}: {}", dir.string(), ec.message());
    }
}

bool SessionWorkspace::Wipe(const std::string& session_key) const {
    const auto dir = InternalDir(session_key);
    std::error_code ec;
    const auto removed = fs::remove_all(dir, ec);
    if (ec) {
        spdlog::error("Failed to wipe session directory {}: {}", dir.string(), ec.message());
        return false;
    }
    if (removed > 0) {
        spdlog::debug("Wiped {} entries from {}", removed, dir.string());
    }
    return true;
}

// ============================================================================
// SCANNING
// ============================================================================

WorkspaceSnapshot SessionWorkspace::Scan(const std::string& session_key) const {
    WorkspaceSnapshot snapshot;
    const auto dir = InternalDir(session_key);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return snapshot;
    }

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", dir.string(), ec.message());
        return snapshot;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Scan of {} interrupted: {}", dir.string(), ec.message());
            break;
        }
        const auto status = it->symlink_status(ec);
        if (ec || !fs::is_regular_file(status)) {
            continue;
        }

        FileStamp stamp;
        stamp.size = it->file_size(ec);
        if (ec) {
            continue;
        }
        stamp.modified = it->last_write_time(ec);
        if (ec) {
            continue;
        }

        snapshot.emplace(it->path().lexically_relative(dir), stamp);
        if (snapshot.size() >= max_scan_entries_) {
            spdlog::warn("Session {} has more than {} files, scan truncated",
                         session_key, max_scan_entries_);
            break;
        }
    }
    return snapshot;
}

bool SessionWorkspace::IsVisible(const fs::path& relative_path) {
    for (const auto& part : relative_path) {
        const auto name = part.string();
        if (name.empty() || name.front() == '.' || name == "__pycache__") {
            return false;
        }
    }
    return !relative_path.empty();
}

std::vector<fs::path> SessionWorkspace::Changed(const WorkspaceSnapshot& before,
                                                const WorkspaceSnapshot& after) {
    std::vector<fs::path> changed;
    for (const auto& [path, stamp] : after) {
        auto previous = before.find(path);
        if (previous == before.end() || previous->second != stamp) {
            changed.push_back(path);
        }
    }
    return changed;
}

// ============================================================================
// FILE ACCESS
// ============================================================================

fs::path SessionWorkspace::WriteFile(const std::string& session_key,
                                     const std::string& file_name,
                                     const std::string& bytes) const {
    if (file_name.empty() || fs::path(file_name).filename() != fs::path(file_name)) {
        throw ValidationError("Invalid file name: '" + file_name + "'");
    }

    Prepare(session_key);
    const auto dir = InternalDir(session_key);
    const auto target = dir / file_name;
    const auto temp = dir / ("." + file_name + "." + utils::IdUtils::GenerateId(8) + ".part");

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + temp.string() + " for writing");
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw std::runtime_error("Failed writing " + temp.string());
        }
    }

    std::error_code ec;
    // Replacing a symlink left by sandboxed code must not write through it
    if (fs::is_symlink(fs::symlink_status(target, ec))) {
        fs::remove(target, ec);
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw std::runtime_error("Cannot move upload into place: " + ec.message());
    }
    fs::permissions(target,
                    fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::group_write |
                    fs::perms::others_read | fs::perms::others_write,
                    fs::perm_options::replace, ec);

    return fs::path(file_name);
}

std::string SessionWorkspace::ReadFile(const std::string& session_key,
                                       const fs::path& relative_path) const {
    const auto path = ResolveInternal(session_key, relative_path);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFound("File not found: " + relative_path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFound("File not readable: " + relative_path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace core
} // namespace sandkeep
