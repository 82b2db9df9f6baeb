/**
 * @file session_registry.cpp
 * @brief Session table, leases and sandbox provisioning
 *
 * **Provisioning under contention**:
 * ```
 * caller A: FindOrInsert(k) → lock(k) → no handle → Provision → Ready → lease
 * caller B: FindOrInsert(k) → lock(k) ......(waits)...... → handle → lease
 * ```
 * If A's provisioning fails the entry is retired with the failure attached;
 * B wakes, sees the retired entry and receives the same error.
 *
 * @date 2025
 */

#include "sandkeep/core/session_registry.hpp"
#include "sandkeep/core/errors.hpp"
#include "sandkeep/utils/id_utils.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace sandkeep {
namespace core {

using SteadyClock = std::chrono::steady_clock;

/**
 * @struct SessionEntry
 * @brief One row of the registry
 *
 * `lock` is the session lock. Fields marked (lock) change only while it is
 * held; fields marked (meta) are additionally guarded by `meta` so that
 * Snapshot() can read them without waiting for a running execution.
 */
struct SessionEntry {
    SessionEntry(std::string session_key, std::string external)
        : key(std::move(session_key))
        , external_id(std::move(external))
        , created_at(std::chrono::system_clock::now())
        , last_access(SteadyClock::now().time_since_epoch().count()) {}

    const std::string key;
    const std::string external_id;

    std::mutex lock;
    mutable std::mutex meta;

    SessionState state{SessionState::PROVISIONING};     // (meta)
    std::optional<SandboxHandle> handle;                // (lock, meta)
    std::uint64_t generation{0};                        // (lock, meta)
    std::chrono::system_clock::time_point created_at;   // (lock, meta)
    std::unique_ptr<FileIdentityMap> files;             // (lock)
    bool retired{false};                                // (lock)
    std::exception_ptr failure;                         // (lock)

    std::atomic<SteadyClock::rep> last_access;

    void Touch() {
        last_access.store(SteadyClock::now().time_since_epoch().count());
    }

    SteadyClock::duration Idle() const {
        return SteadyClock::now().time_since_epoch() - SteadyClock::duration(last_access.load());
    }

    void SetState(SessionState next) {
        std::lock_guard<std::mutex> guard(meta);
        state = next;
    }
};

const char* SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::PROVISIONING: return "provisioning";
        case SessionState::READY: return "ready";
        case SessionState::EXECUTING: return "executing";
        case SessionState::TERMINATED: return "terminated";
    }
    return "unknown";
}

// ============================================================================
// SESSION LEASE
// ============================================================================

SessionLease::SessionLease(std::shared_ptr<SessionEntry> entry,
                           std::unique_lock<std::mutex> lock,
                           bool fresh)
    : entry_(std::move(entry))
    , lock_(std::move(lock))
    , fresh_(fresh) {
}

SessionLease::SessionLease(SessionLease&&) noexcept = default;
SessionLease& SessionLease::operator=(SessionLease&&) noexcept = default;
SessionLease::~SessionLease() = default;

const std::string& SessionLease::Key() const {
    return entry_->key;
}

const std::string& SessionLease::ExternalId() const {
    return entry_->external_id;
}

std::uint64_t SessionLease::Generation() const {
    return entry_->generation;
}

const SandboxHandle& SessionLease::Handle() const {
    if (!entry_->handle) {
        throw SandboxUnavailable("Session " + entry_->key + " has no sandbox");
    }
    return *entry_->handle;
}

FileIdentityMap& SessionLease::Files() {
    if (!entry_->files) {
        entry_->files = std::make_unique<FileIdentityMap>(entry_->key, entry_->generation);
    }
    return *entry_->files;
}

void SessionLease::MarkExecuting() {
    entry_->SetState(SessionState::EXECUTING);
}

void SessionLease::MarkReady() {
    entry_->SetState(SessionState::READY);
}

void SessionLease::Touch() {
    entry_->Touch();
}

SteadyClock::duration SessionLease::Idle() const {
    return entry_->Idle();
}

// ============================================================================
// PROVISION GATE
// ============================================================================

void SessionRegistry::ProvisionGate::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return available_ > 0; });
    --available_;
}

void SessionRegistry::ProvisionGate::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    released_.notify_one();
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

SessionRegistry::SessionRegistry(SandboxController& controller,
                                 SessionWorkspace& workspace,
                                 RegistryOptions options)
    : controller_(controller)
    , workspace_(workspace)
    , options_(std::move(options))
    , gate_(options_.max_concurrent_provisions == 0 ? 1 : options_.max_concurrent_provisions) {
    spdlog::debug("Session registry: max {} sessions, {} concurrent provisions",
                  options_.max_sessions, options_.max_concurrent_provisions);
}

// ============================================================================
// LOOKUP
// ============================================================================

std::shared_ptr<SessionEntry> SessionRegistry::Find(const std::string& session_key) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    auto it = sessions_.find(session_key);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionEntry> SessionRegistry::FindOrInsert(const std::string& session_key) {
    if (auto existing = Find(session_key)) {
        return existing;
    }

    std::unique_lock<std::shared_mutex> lock(table_mutex_);
    auto it = sessions_.find(session_key);
    if (it != sessions_.end()) {
        return it->second;
    }

    if (sessions_.size() >= options_.max_sessions) {
        spdlog::warn("Rejecting new session {}: {} of {} sessions in use",
                     session_key, sessions_.size(), options_.max_sessions);
        throw ResourceExhausted("Server is at capacity, try again later");
    }

    auto entry = std::make_shared<SessionEntry>(session_key, AllocateExternalId(session_key));
    sessions_.emplace(session_key, entry);
    aliases_[entry->external_id] = session_key;
    return entry;
}

std::string SessionRegistry::AllocateExternalId(const std::string& session_key) const {
    if (utils::IdUtils::IsExternalId(session_key) && aliases_.count(session_key) == 0) {
        return session_key;
    }
    std::string id;
    do {
        id = utils::IdUtils::GenerateId();
    } while (aliases_.count(id) != 0);
    return id;
}

std::optional<std::string> SessionRegistry::KeyForExternalId(const std::string& external_id) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    auto it = aliases_.find(external_id);
    if (it == aliases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> SessionRegistry::ExternalIdForKey(const std::string& session_key) const {
    auto entry = Find(session_key);
    if (!entry) {
        return std::nullopt;
    }
    return entry->external_id;
}

std::size_t SessionRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return sessions_.size();
}

// ============================================================================
// RESOLVE / ACQUIRE
// ============================================================================

SessionLease SessionRegistry::Resolve(const std::string& session_key) {
    if (session_key.empty() || utils::IdUtils::SanitizeId(session_key) != session_key) {
        throw ValidationError("Invalid session key: '" + session_key + "'");
    }

    while (true) {
        auto entry = FindOrInsert(session_key);
        std::unique_lock<std::mutex> lock(entry->lock);

        if (entry->retired) {
            if (entry->failure) {
                std::rethrow_exception(entry->failure);
            }
            continue;
        }

        if (entry->handle && !entry->handle->running) {
            spdlog::warn("Sandbox {} of session {} is not running, replacing it",
                         entry->handle->name, session_key);
            try {
                TerminateLocked(*entry);
            }
            catch (const std::exception& e) {
                spdlog::error("Error cleaning up session {}: {}", session_key, e.what());
            }
            continue;
        }

        bool fresh = false;
        if (!entry->handle) {
            Provision(*entry);
            fresh = true;
        }

        entry->Touch();
        return SessionLease(entry, std::move(lock), fresh);
    }
}

std::optional<SessionLease> SessionRegistry::Acquire(const std::string& session_key) {
    while (true) {
        auto entry = Find(session_key);
        if (!entry) {
            return std::nullopt;
        }
        std::unique_lock<std::mutex> lock(entry->lock);
        if (entry->retired) {
            continue;
        }
        entry->Touch();
        return SessionLease(entry, std::move(lock), false);
    }
}

std::optional<SessionLease> SessionRegistry::TryAcquire(const std::string& session_key) {
    auto entry = Find(session_key);
    if (!entry) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(entry->lock, std::try_to_lock);
    if (!lock.owns_lock() || entry->retired) {
        return std::nullopt;
    }
    return SessionLease(entry, std::move(lock), false);
}

void SessionRegistry::Touch(const std::string& session_key) {
    if (auto entry = Find(session_key)) {
        entry->Touch();
    }
}

// ============================================================================
// PROVISIONING
// ============================================================================

void SessionRegistry::Provision(SessionEntry& entry) {
    entry.SetState(SessionState::PROVISIONING);

    SandboxSpec spec = options_.sandbox;
    spec.mount_source = workspace_.HostDir(entry.key);
    spec.mount_target = workspace_.SandboxMount();
    spec.external_id = entry.external_id;
    spec.generation = next_generation_.fetch_add(1);

    SandboxHandle handle;
    try {
        workspace_.Prepare(entry.key);
        gate_.Acquire();
        try {
            handle = controller_.Provision(entry.key, spec);
        }
        catch (...) {
            gate_.Release();
            throw;
        }
        gate_.Release();
    }
    catch (const std::exception& e) {
        spdlog::error("Provisioning failed for session {}: {}", entry.key, e.what());
        entry.retired = true;
        entry.failure = dynamic_cast<const SandkeepError*>(&e) != nullptr
            ? std::current_exception()
            : std::make_exception_ptr(ProvisionError(e.what()));
        entry.SetState(SessionState::TERMINATED);
        workspace_.Wipe(entry.key);
        Erase(entry);
        std::rethrow_exception(entry.failure);
    }

    {
        std::lock_guard<std::mutex> guard(entry.meta);
        entry.handle = handle;
        entry.generation = spec.generation;
        entry.created_at = std::chrono::system_clock::now();
        entry.state = SessionState::READY;
    }
    entry.files = std::make_unique<FileIdentityMap>(entry.key, spec.generation);

    spdlog::info("Session {} ready: sandbox {} (generation {})",
                 entry.key, handle.name, spec.generation);
}

bool SessionRegistry::Adopt(const SandboxHandle& handle) {
    if (handle.session_key.empty() ||
        utils::IdUtils::SanitizeId(handle.session_key) != handle.session_key) {
        throw ValidationError("Container " + handle.container_id + " has no usable session label");
    }

    std::unique_lock<std::shared_mutex> lock(table_mutex_);
    if (sessions_.count(handle.session_key) != 0) {
        return false;
    }

    const std::string external_id =
        (utils::IdUtils::IsExternalId(handle.external_id) && aliases_.count(handle.external_id) == 0)
            ? handle.external_id
            : AllocateExternalId(handle.session_key);

    auto entry = std::make_shared<SessionEntry>(handle.session_key, external_id);
    const std::uint64_t generation =
        handle.generation != 0 ? handle.generation : next_generation_.fetch_add(1);

    auto current = next_generation_.load();
    while (current <= generation &&
           !next_generation_.compare_exchange_weak(current, generation + 1)) {
    }

    entry->handle = handle;
    entry->generation = generation;
    entry->state = SessionState::READY;
    if (handle.started_at.time_since_epoch().count() > 0) {
        entry->created_at = handle.started_at;
    }
    entry->files = std::make_unique<FileIdentityMap>(handle.session_key, generation);

    if (sessions_.size() >= options_.max_sessions) {
        spdlog::warn("Adopting session {} beyond the limit of {} sessions",
                     handle.session_key, options_.max_sessions);
    }
    sessions_.emplace(handle.session_key, entry);
    aliases_[external_id] = handle.session_key;

    spdlog::info("Adopted sandbox {} for session {} (generation {}, {})",
                 handle.name, handle.session_key, generation,
                 handle.running ? "running" : "stopped");
    return true;
}

// ============================================================================
// TERMINATION
// ============================================================================

void SessionRegistry::Erase(const SessionEntry& entry) {
    std::unique_lock<std::shared_mutex> lock(table_mutex_);
    auto it = sessions_.find(entry.key);
    if (it != sessions_.end() && it->second.get() == &entry) {
        sessions_.erase(it);
    }
    auto alias = aliases_.find(entry.external_id);
    if (alias != aliases_.end() && alias->second == entry.key) {
        aliases_.erase(alias);
    }
}

void SessionRegistry::TerminateLocked(SessionEntry& entry) {
    entry.retired = true;
    entry.SetState(SessionState::TERMINATED);

    std::string failure;
    if (entry.handle) {
        try {
            controller_.Terminate(*entry.handle);
        }
        catch (const std::exception& e) {
            failure = e.what();
        }
    }

    // Wipe before the key becomes free so a successor never sees old files
    workspace_.Wipe(entry.key);
    if (entry.files) {
        entry.files->Clear();
    }
    {
        std::lock_guard<std::mutex> guard(entry.meta);
        entry.handle.reset();
    }
    Erase(entry);

    spdlog::info("Session {} terminated (generation {})", entry.key, entry.generation);

    if (!failure.empty()) {
        throw std::runtime_error("Failed to remove sandbox of session " + entry.key + ": " + failure);
    }
}

bool SessionRegistry::Terminate(const std::string& session_key) {
    auto entry = Find(session_key);
    if (!entry) {
        return false;
    }
    std::unique_lock<std::mutex> lock(entry->lock);
    if (entry->retired) {
        return false;
    }
    TerminateLocked(*entry);
    return true;
}

void SessionRegistry::Terminate(SessionLease&& lease) {
    auto entry = std::move(lease.entry_);
    auto lock = std::move(lease.lock_);
    if (!entry || !lock.owns_lock() || entry->retired) {
        return;
    }
    TerminateLocked(*entry);
}

// ============================================================================
// SNAPSHOT
// ============================================================================

std::vector<SessionInfo> SessionRegistry::Snapshot() const {
    std::vector<std::shared_ptr<SessionEntry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(table_mutex_);
        entries.reserve(sessions_.size());
        for (const auto& [key, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::vector<SessionInfo> infos;
    infos.reserve(entries.size());
    for (const auto& entry : entries) {
        SessionInfo info;
        info.key = entry->key;
        info.external_id = entry->external_id;
        {
            std::lock_guard<std::mutex> guard(entry->meta);
            info.generation = entry->generation;
            info.state = entry->state;
            info.created_at = entry->created_at;
            if (entry->handle) {
                info.container_id = entry->handle->container_id;
                info.container_name = entry->handle->name;
            }
        }
        info.idle = entry->Idle();
        infos.push_back(std::move(info));
    }
    return infos;
}

} // namespace core
} // namespace sandkeep
