/**
 * @file session_registry.hpp
 * @brief Authoritative in-process table of sessions and their sandboxes
 *
 * **State Machine**:
 * ```
 * Absent → Provisioning → Ready ⇄ Executing
 *              │            │
 *              ↓            ↓
 *           Absent      Terminated → Absent
 * ```
 *
 * **Locking**:
 * - The table is guarded by a reader/writer lock; Snapshot() only reads.
 * - Every session has its own lock, held by a SessionLease for the whole of
 *   an operation (resolve, run, register artifacts). Provisioning happens
 *   under it, so concurrent first use of a key creates exactly one sandbox.
 * - A session lock is always taken before the table lock, never after.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/file_identity_map.hpp"
#include "sandkeep/core/sandbox_controller.hpp"
#include "sandkeep/core/session_workspace.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @enum SessionState
 * @brief Lifecycle state of a session entry
 */
enum class SessionState {
    PROVISIONING,  ///< Sandbox being created
    READY,         ///< Sandbox idle and usable
    EXECUTING,     ///< Code running
    TERMINATED     ///< Torn down; entry no longer in the table
};

const char* SessionStateToString(SessionState state);

/**
 * @struct SessionInfo
 * @brief Read-only view of one session
 */
struct SessionInfo {
    std::string key;
    std::string external_id;
    std::uint64_t generation{0};
    SessionState state{SessionState::PROVISIONING};
    std::string container_id;
    std::string container_name;
    std::chrono::system_clock::time_point created_at;
    std::chrono::steady_clock::duration idle{0};  ///< Time since last access
};

/**
 * @struct RegistryOptions
 * @brief Capacity and sandbox template for a registry
 */
struct RegistryOptions {
    std::size_t max_sessions{10};               ///< Ceiling on live entries
    std::size_t max_concurrent_provisions{4};   ///< Global provisioning gate width
    SandboxSpec sandbox;                        ///< Template; mount source and labels filled per session
};

struct SessionEntry;
class SessionRegistry;

/**
 * @class SessionLease
 * @brief Exclusive access to one live session for the duration of an operation
 *
 * Holds the session lock. Releasing the lease (destruction or move-out)
 * releases the lock.
 */
class SessionLease {
public:
    SessionLease(SessionLease&&) noexcept;
    SessionLease& operator=(SessionLease&&) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    ~SessionLease();

    const std::string& Key() const;
    const std::string& ExternalId() const;
    std::uint64_t Generation() const;
    const SandboxHandle& Handle() const;
    FileIdentityMap& Files();

    /// Whether this lease's Resolve created the sandbox
    bool Fresh() const { return fresh_; }

    /// Mark the session Executing until MarkReady()
    void MarkExecuting();
    void MarkReady();

    /// Refresh last-access time
    void Touch();

    /// Time since last access
    std::chrono::steady_clock::duration Idle() const;

private:
    friend class SessionRegistry;

    SessionLease(std::shared_ptr<SessionEntry> entry,
                 std::unique_lock<std::mutex> lock,
                 bool fresh);

    std::shared_ptr<SessionEntry> entry_;
    std::unique_lock<std::mutex> lock_;
    bool fresh_{false};
};

/**
 * @class SessionRegistry
 * @brief Maps session keys to sandboxes with per-session serialization
 *
 * **Usage Example**:
 * @code
 * SessionRegistry registry(controller, workspace, options);
 * {
 *     auto lease = registry.Resolve("s1");     // provisions on first use
 *     lease.MarkExecuting();
 *     controller.RunCommand(lease.Handle(), "print(1)", std::chrono::seconds(5));
 *     lease.MarkReady();
 *     lease.Touch();
 * }                                            // session lock released
 * registry.Terminate("s1");
 * @endcode
 */
class SessionRegistry {
public:
    SessionRegistry(SandboxController& controller,
                    SessionWorkspace& workspace,
                    RegistryOptions options);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Get the live sandbox for a key, provisioning one if absent
     *
     * Blocks while another operation holds the session. If the sandbox is
     * known to be dead it is torn down and a new generation provisioned.
     *
     * @throws ResourceExhausted if a new session would exceed max_sessions
     * @throws ProvisionError if the sandbox cannot be created (entry removed)
     * @throws ValidationError on a malformed key
     */
    SessionLease Resolve(const std::string& session_key);

    /**
     * @brief Lock an existing session without provisioning
     * @return nullopt if the key has no live entry
     */
    std::optional<SessionLease> Acquire(const std::string& session_key);

    /**
     * @brief Lock an existing session only if nobody holds it
     * @return nullopt if absent or busy
     */
    std::optional<SessionLease> TryAcquire(const std::string& session_key);

    /// Update last-access time (no-op for unknown keys)
    void Touch(const std::string& session_key);

    /**
     * @brief Tear down a session: container, writable area, file map
     *
     * Waits for the session's current operation to finish.
     *
     * @return false if the key was not registered
     * @throws std::runtime_error if the container could not be removed (the
     *         entry is gone regardless)
     */
    bool Terminate(const std::string& session_key);

    /**
     * @brief Tear down the session held by a lease
     * @throws std::runtime_error as Terminate(key)
     */
    void Terminate(SessionLease&& lease);

    /**
     * @brief Insert a Ready entry for an existing container
     *
     * Used only by startup recovery. Restores external id and generation
     * from the handle and advances the generation counter past it.
     *
     * @return false if the key is already registered
     * @throws ValidationError if the handle has no session key
     */
    bool Adopt(const SandboxHandle& handle);

    /// Read-only view of every entry
    std::vector<SessionInfo> Snapshot() const;

    /// Internal key of a session external id
    std::optional<std::string> KeyForExternalId(const std::string& external_id) const;

    /// External id of a registered key
    std::optional<std::string> ExternalIdForKey(const std::string& session_key) const;

    std::size_t Size() const;
    std::size_t MaxSessions() const { return options_.max_sessions; }

    SandboxController& Controller() { return controller_; }
    SessionWorkspace& Workspace() { return workspace_; }

private:
    /// Counting semaphore limiting concurrent Provision() calls
    class ProvisionGate {
    public:
        explicit ProvisionGate(std::size_t limit) : available_(limit) {}
        void Acquire();
        void Release();

    private:
        std::mutex mutex_;
        std::condition_variable released_;
        std::size_t available_;
    };

    SandboxController& controller_;
    SessionWorkspace& workspace_;
    RegistryOptions options_;
    ProvisionGate gate_;

    mutable std::shared_mutex table_mutex_;
    std::map<std::string, std::shared_ptr<SessionEntry>> sessions_;   ///< key -> entry
    std::map<std::string, std::string> aliases_;                      ///< external id -> key

    std::atomic<std::uint64_t> next_generation_{1};

    std::shared_ptr<SessionEntry> Find(const std::string& session_key) const;
    std::shared_ptr<SessionEntry> FindOrInsert(const std::string& session_key);
    void Provision(SessionEntry& entry);
    void Erase(const SessionEntry& entry);
    void TerminateLocked(SessionEntry& entry);
    std::string AllocateExternalId(const std::string& session_key) const;
};

} // namespace core
} // namespace sandkeep
