/**
 * @file file_identity_map.hpp
 * @brief Bidirectional mapping between external file ids and session paths
 *
 * Files are never addressed by name at the boundary. Each artifact gets a
 * random 21-character id; the map translates it back to the session and the
 * path relative to the session's writable area.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @struct FileRecord
 * @brief One artifact visible at the boundary
 */
struct FileRecord {
    std::string external_id;                ///< 21-char boundary id
    std::string session_key;                ///< Owning session
    std::uint64_t generation{0};            ///< Session generation at registration
    std::filesystem::path relative_path;    ///< Path inside the writable area
    std::string content_type;               ///< Guessed MIME type
    std::chrono::system_clock::time_point created_at;

    std::string FileName() const { return relative_path.filename().string(); }
};

/**
 * @class FileIdentityMap
 * @brief Per-session external id ↔ path bijection
 *
 * Owned by a session entry and accessed only while its lock is held, so the
 * map does no locking of its own.
 *
 * **Usage Example**:
 * @code
 * FileIdentityMap files("s1", 3);
 * auto id = files.Register("plot.png", "image/png");
 * auto same = files.Register("plot.png", "image/png");   // same == id
 * auto record = files.Resolve("s1", id);
 * files.Resolve("s2", id);                               // throws FileNotFound
 * @endcode
 */
class FileIdentityMap {
public:
    FileIdentityMap(std::string session_key, std::uint64_t generation);

    /**
     * @brief Assign an external id to a path, or return the existing one
     * @param relative_path Path relative to the writable area
     * @param content_type MIME type recorded for downloads
     * @return External id
     */
    std::string Register(const std::filesystem::path& relative_path,
                         const std::string& content_type);

    /**
     * @brief Look up an external id
     * @throws FileNotFound if the id is unknown, belongs to another session
     *         or to an earlier generation
     */
    FileRecord Resolve(const std::string& session_key, const std::string& external_id) const;

    /// External id of a path, if registered
    std::optional<std::string> Find(const std::filesystem::path& relative_path) const;

    /// All records ordered by creation time
    std::vector<FileRecord> List() const;

    /**
     * @brief Drop records whose path is not in the given set
     * @return Number of records removed
     */
    std::size_t Prune(const std::set<std::filesystem::path>& existing);

    void Clear();

    std::size_t Size() const { return by_id_.size(); }
    std::uint64_t Generation() const { return generation_; }

private:
    std::string session_key_;
    std::uint64_t generation_;
    std::map<std::string, FileRecord> by_id_;                    ///< id -> record
    std::map<std::filesystem::path, std::string> by_path_;       ///< path -> id
};

} // namespace core
} // namespace sandkeep
