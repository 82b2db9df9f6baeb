/**
 * @file session_workspace.hpp
 * @brief Service-side access to each session's writable area
 *
 * One directory per session, bind-mounted into that session's sandbox and
 * nowhere else. The same directory has up to three names:
 *
 * | View              | Example                           | Used for                   |
 * |-------------------|-----------------------------------|----------------------------|
 * | host (daemon)     | /srv/sandkeep/sessions/<key>      | `-v` bind-mount source     |
 * | internal (us)     | /data/sessions/<key>              | every read and write here  |
 * | sandbox           | /mnt/data                         | code running in the sandbox|
 *
 * The host and internal views differ when this service itself runs in a
 * container with the data root mounted at another path. The sandbox path is
 * never used for file access on the service side.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @struct FileStamp
 * @brief Size and modification time of one file
 */
struct FileStamp {
    std::uintmax_t size{0};
    std::filesystem::file_time_type modified;

    bool operator==(const FileStamp& other) const {
        return size == other.size && modified == other.modified;
    }
    bool operator!=(const FileStamp& other) const { return !(*this == other); }
};

/// Regular files of a writable area keyed by relative path
using WorkspaceSnapshot = std::map<std::filesystem::path, FileStamp>;

/**
 * @class SessionWorkspace
 * @brief Path translation and safe file access for session directories
 *
 * Every path handed in from outside is checked to stay inside the session's
 * directory after symlinks are resolved. A symlink written by sandboxed code
 * that points outside the area is never followed.
 */
class SessionWorkspace {
public:
    /**
     * @param host_root Root as the container daemon sees it
     * @param internal_root Root as this process sees it
     * @param sandbox_mount Mount point inside sandboxes
     */
    SessionWorkspace(std::filesystem::path host_root,
                     std::filesystem::path internal_root,
                     std::filesystem::path sandbox_mount);

    /// Bind-mount source for a session
    std::filesystem::path HostDir(const std::string& session_key) const;

    /// Directory this process reads and writes for a session
    std::filesystem::path InternalDir(const std::string& session_key) const;

    const std::filesystem::path& SandboxMount() const { return sandbox_mount_; }

    /**
     * @brief Create the session directory (world-writable for the sandbox user)
     * @throws std::runtime_error if it cannot be created
     */
    void Prepare(const std::string& session_key) const;

    /**
     * @brief Delete the session directory and everything in it
     * @return false if something could not be removed (logged)
     */
    bool Wipe(const std::string& session_key) const;

    /**
     * @brief List regular files below the session directory
     *
     * Symlinks and special files are skipped. A missing directory yields an
     * empty snapshot.
     */
    WorkspaceSnapshot Scan(const std::string& session_key) const;

    /**
     * @brief Whether a relative path is a user-facing artifact
     *
     * Hidden components (leading dot) and `__pycache__` are not.
     */
    static bool IsVisible(const std::filesystem::path& relative_path);

    /**
     * @brief Paths that are new or modified in `after` compared to `before`
     */
    static std::vector<std::filesystem::path> Changed(const WorkspaceSnapshot& before,
                                                      const WorkspaceSnapshot& after);

    /**
     * @brief Write a file at the top of the session directory
     * @param file_name Already sanitized base name
     * @param bytes File content
     * @return Path relative to the session directory
     * @throws std::runtime_error on I/O failure
     */
    std::filesystem::path WriteFile(const std::string& session_key,
                                    const std::string& file_name,
                                    const std::string& bytes) const;

    /**
     * @brief Read a file of the session
     * @throws FileNotFound if missing, not a regular file, or outside the area
     */
    std::string ReadFile(const std::string& session_key,
                         const std::filesystem::path& relative_path) const;

    /**
     * @brief Internal path of a session file, checked for containment
     * @throws FileNotFound if the path escapes the session directory
     */
    std::filesystem::path ResolveInternal(const std::string& session_key,
                                          const std::filesystem::path& relative_path) const;

private:
    std::filesystem::path host_root_;       ///< Daemon's view of the data root
    std::filesystem::path internal_root_;   ///< Our view of the data root
    std::filesystem::path sandbox_mount_;   ///< Mount point inside sandboxes
    std::size_t max_scan_entries_{10000};   ///< Scan stops after this many files
};

} // namespace core
} // namespace sandkeep
