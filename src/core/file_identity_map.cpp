/**
 * @file file_identity_map.cpp
 * @brief Path to file-id bookkeeping for one session generation
 *
 * @date 2025
 */

#include "sandkeep/core/file_identity_map.hpp"
#include "sandkeep/core/errors.hpp"
#include "sandkeep/utils/id_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sandkeep {
namespace core {

FileIdentityMap::FileIdentityMap(std::string session_key, std::uint64_t generation)
    : session_key_(std::move(session_key))
    , generation_(generation) {
}

std::string FileIdentityMap::Register(const std::filesystem::path& relative_path,
                                      const std::string& content_type) {
    const auto normalized = relative_path.lexically_normal();

    auto existing = by_path_.find(normalized);
    if (existing != by_path_.end()) {
        by_id_[existing->second].content_type = content_type;
        return existing->second;
    }

    std::string id;
    do {
        id = utils::IdUtils::GenerateId();
    } while (by_id_.count(id) != 0);

    FileRecord record;
    record.external_id = id;
    record.session_key = session_key_;
    record.generation = generation_;
    record.relative_path = normalized;
    record.content_type = content_type;
    record.created_at = std::chrono::system_clock::now();

    by_id_.emplace(id, std::move(record));
    by_path_.emplace(normalized, id);

    spdlog::debug("Registered file {} as {} in session {}", normalized.string(), id, session_key_);
    return id;
}

FileRecord FileIdentityMap::Resolve(const std::string& session_key,
                                    const std::string& external_id) const {
    auto it = by_id_.find(external_id);
    if (it == by_id_.end() ||
        it->second.session_key != session_key ||
        it->second.generation != generation_) {
        throw FileNotFound("File not found: " + external_id);
    }
    return it->second;
}

std::optional<std::string> FileIdentityMap::Find(const std::filesystem::path& relative_path) const {
    auto it = by_path_.find(relative_path.lexically_normal());
    if (it == by_path_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileRecord> FileIdentityMap::List() const {
    std::vector<FileRecord> records;
    records.reserve(by_id_.size());
    for (const auto& [id, record] : by_id_) {
        records.push_back(record);
    }
    std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.relative_path < b.relative_path;
    });
    return records;
}

std::size_t FileIdentityMap::Prune(const std::set<std::filesystem::path>& existing) {
    std::size_t removed = 0;
    for (auto it = by_path_.begin(); it != by_path_.end();) {
        if (existing.count(it->first) == 0) {
            by_id_.erase(it->second);
            it = by_path_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void FileIdentityMap::Clear() {
    by_id_.clear();
    by_path_.clear();
}

} // namespace core
} // namespace sandkeep
