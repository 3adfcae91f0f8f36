/*
 * ShadowVeil - Privacy Enforcement Core
 * Copyright (C) 2026 ShadowVeil Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * ============================================================================
 * ShadowVeil - EPHEMERAL SESSION MANAGER
 * ============================================================================
 *
 * @file EphemeralSessionManager.hpp
 * @brief Registry of live browsing sessions, each with its own isolated
 *        storage directory and browsing environment.
 *
 * LIFECYCLE:
 * ==========
 *   Uninitialized -> Active -> Disposed (terminal)
 *
 * - CreateSession reserves the id, creates <base>/<id> (mode 0700), asks
 *   the IEnvironmentProvider for an environment bound to it and publishes
 *   the session. Any failure rolls back the environment and directory.
 * - DisposeSession marks the entry Disposed, releases the environment,
 *   waits (bounded) for its process to exit, runs the teardown hook and
 *   only then wipes storage. The entry leaves the registry after the wipe.
 * - CleanupOrphans wipes stale unregistered directories under the base.
 *   Overlapping sweeps are skipped, not queued.
 * - DisposeAll disposes every session concurrently and removes the base.
 *
 * @note All public methods are thread-safe.
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// SHADOWVEIL INFRASTRUCTURE INCLUDES
// ============================================================================

#include "../Utils/Logger.hpp"
#include "BrowsingEnvironment.hpp"
#include "SecureDeletion.hpp"

// ============================================================================
// FORWARD DECLARATIONS
// ============================================================================

namespace ShadowVeil::Privacy {
    class EphemeralSessionManagerImpl;
}

namespace ShadowVeil {
namespace Privacy {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace SessionManagerConstants {

    /// @brief Maximum caller-supplied session id length
    inline constexpr size_t MAX_SESSION_ID_LENGTH = 128;

    /// @brief Random bytes appended to the timestamp in generated ids
    inline constexpr size_t GENERATED_ID_RANDOM_BYTES = 8;

    /// @brief Orphan sweep interval (seconds)
    inline constexpr uint32_t DEFAULT_SWEEP_INTERVAL_SECONDS = 300;  // 5 minutes

    /// @brief Unregistered directories older than this are orphans (seconds)
    inline constexpr uint32_t DEFAULT_ORPHAN_STALENESS_SECONDS = 3600;  // 1 hour

    /// @brief Bounded wait for the environment's process on dispose (milliseconds)
    inline constexpr uint32_t DEFAULT_ENVIRONMENT_EXIT_TIMEOUT_MS = 2000;

    /// @brief Directory created under the temp directory when no base is configured
    inline constexpr std::string_view DEFAULT_BASE_DIRECTORY_NAME = "ShadowVeil";

    /// @brief Arguments passed to every new browsing environment
    inline constexpr std::array<std::string_view, 10> DEFAULT_BROWSER_ARGUMENTS = {
        "--disable-features=VizDisplayCompositor",
        "--process-per-site",
        "--disable-background-networking",
        "--disable-background-timer-throttling",
        "--disable-backgrounding-occluded-windows",
        "--disable-renderer-backgrounding",
        "--disable-field-trial-config",
        "--no-default-browser-check",
        "--no-first-run",
        "--disable-default-apps"
    };

}  // namespace SessionManagerConstants

// ============================================================================
// ENUMERATIONS
// ============================================================================

/**
 * @brief Session lifecycle state
 */
enum class SessionState : uint8_t {
    Uninitialized   = 0,    ///< Id reserved, storage/environment being created
    Active          = 1,    ///< Published and usable
    Disposed        = 2     ///< Teardown started (terminal); removed once storage is wiped
};

/**
 * @brief Session operation error codes
 */
enum class SessionErrorCode : uint8_t {
    None                = 0,
    InvalidId           = 1,    ///< Empty, too long, or characters outside [A-Za-z0-9_-]
    AlreadyExists       = 2,    ///< Id registered, or its directory already on disk
    StorageFailure      = 3,    ///< Base or session directory could not be created
    EnvironmentFailure  = 4,    ///< Provider returned null or threw
    WipeFailed          = 5,    ///< Session gone, storage removal failed
    ShuttingDown        = 6,    ///< DisposeAll() already ran
    RandomFailure       = 7     ///< Id generation failed
};

[[nodiscard]] std::string_view GetSessionStateName(SessionState state) noexcept;
[[nodiscard]] std::string_view GetSessionErrorCodeName(SessionErrorCode code) noexcept;

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Session operation error
 */
struct SessionError {
    SessionErrorCode code = SessionErrorCode::None;
    std::string message;

    [[nodiscard]] bool hasError() const noexcept { return code != SessionErrorCode::None; }

    void clear() noexcept {
        code = SessionErrorCode::None;
        message.clear();
    }
};

/**
 * @brief Public view of a session
 */
struct SessionInfo {
    std::string id;
    std::filesystem::path storagePath;
    std::chrono::system_clock::time_point createdAt{};
    bool active = false;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Result carried by the asynchronous variants
 */
struct SessionOutcome {
    bool ok = false;
    SessionInfo info;           ///< Filled by CreateSessionAsync
    SessionError error;
};

/**
 * @brief Session manager configuration
 */
struct SessionManagerConfiguration {
    /// @brief Parent of all session directories (empty = <temp>/ShadowVeil)
    std::filesystem::path basePath;

    /// @brief Orphan sweep interval
    std::chrono::seconds sweepInterval{SessionManagerConstants::DEFAULT_SWEEP_INTERVAL_SECONDS};

    /// @brief Minimum age of an orphan directory
    std::chrono::seconds orphanStaleness{SessionManagerConstants::DEFAULT_ORPHAN_STALENESS_SECONDS};

    /// @brief Bounded wait for environment exit on dispose
    std::chrono::milliseconds environmentExitTimeout{SessionManagerConstants::DEFAULT_ENVIRONMENT_EXIT_TIMEOUT_MS};

    /// @brief Arguments for new environments
    std::vector<std::string> browserArguments;

    [[nodiscard]] bool IsValid() const noexcept;

    /// @brief Defaults with the standard argument list and temp base path
    [[nodiscard]] static SessionManagerConfiguration CreateDefault();
};

/**
 * @brief Session manager counters
 */
struct SessionManagerStatistics {
    std::atomic<uint64_t> sessionsCreated{0};
    std::atomic<uint64_t> sessionsDisposed{0};
    std::atomic<uint64_t> creationFailures{0};
    std::atomic<uint64_t> wipeFailures{0};
    std::atomic<uint64_t> environmentExitTimeouts{0};
    std::atomic<uint64_t> orphansRemoved{0};
    std::atomic<uint64_t> sweepsRun{0};
    std::atomic<uint64_t> sweepsSkipped{0};

    void Reset() noexcept;

    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// EPHEMERAL SESSION MANAGER
// ============================================================================

/**
 * @brief Runs during disposal after the environment has exited and before
 *        the session storage is wiped.
 */
using SessionTeardownHook = std::function<void(const SessionInfo& session)>;

/**
 * @class EphemeralSessionManager
 * @brief Owns the session registry.
 *
 * USAGE:
 * @code
 *     auto wiper = std::make_shared<SecureDeletionWorker>();
 *     EphemeralSessionManager sessions(SessionManagerConfiguration::CreateDefault(),
 *                                      provider, wiper);
 *     sessions.Start();
 *
 *     SessionInfo info;
 *     SessionError err;
 *     if (!sessions.CreateSession(std::nullopt, info, &err)) {
 *         SV_LOG_ERROR("Shell", "session: %s", err.message.c_str());
 *     }
 *     ...
 *     sessions.DisposeSession(info.id);
 * @endcode
 */
class EphemeralSessionManager final {
public:
    EphemeralSessionManager(SessionManagerConfiguration config,
                            std::shared_ptr<IEnvironmentProvider> provider,
                            std::shared_ptr<SecureDeletionWorker> wiper);

    /// @brief Calls DisposeAll()
    ~EphemeralSessionManager();

    EphemeralSessionManager(const EphemeralSessionManager&) = delete;
    EphemeralSessionManager& operator=(const EphemeralSessionManager&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * @brief Start the background orphan sweep.
     */
    [[nodiscard]] bool Start();

    /**
     * @brief Stop the background orphan sweep. Sessions stay alive.
     */
    void Stop();

    // ========================================================================
    // SESSIONS
    // ========================================================================

    /**
     * @brief Create a session.
     * @param id Caller-chosen id, or nullopt to generate one
     */
    [[nodiscard]] bool CreateSession(const std::optional<std::string>& id,
                                     SessionInfo& out,
                                     SessionError* err = nullptr);

    [[nodiscard]] std::future<SessionOutcome> CreateSessionAsync(std::optional<std::string> id);

    /**
     * @brief Environment of an active session, or nullptr.
     */
    [[nodiscard]] std::shared_ptr<IBrowsingEnvironment> GetEnvironment(std::string_view id) const;

    [[nodiscard]] std::optional<SessionInfo> GetSession(std::string_view id) const;

    /**
     * @brief Snapshot of active sessions.
     */
    [[nodiscard]] std::vector<SessionInfo> ListActive() const;

    /**
     * @brief Tear down a session. Unknown ids succeed without side effects.
     *
     * The session is gone from the registry even when false is returned
     * with SessionErrorCode::WipeFailed.
     */
    bool DisposeSession(std::string_view id, SessionError* err = nullptr);

    [[nodiscard]] std::future<SessionOutcome> DisposeSessionAsync(std::string id);

    /**
     * @brief Install the hook run by every disposal. Exceptions it throws are logged.
     */
    void SetTeardownHook(SessionTeardownHook hook);

    // ========================================================================
    // MAINTENANCE
    // ========================================================================

    /**
     * @brief Wipe stale, unregistered session directories.
     * @return number of directories removed (0 when another sweep is running)
     */
    size_t CleanupOrphans();

    /**
     * @brief Stop the sweep, dispose every session, remove the base directory.
     *
     * Idempotent. CreateSession fails with ShuttingDown afterwards.
     */
    void DisposeAll();

    // ========================================================================
    // QUERIES
    // ========================================================================

    [[nodiscard]] const std::filesystem::path& GetBasePath() const noexcept;

    [[nodiscard]] const SessionManagerConfiguration& GetConfiguration() const noexcept;

    [[nodiscard]] const SessionManagerStatistics& GetStatistics() const noexcept;

    [[nodiscard]] bool IsShutDown() const noexcept;

    /**
     * @brief Non-empty, at most MAX_SESSION_ID_LENGTH, only [A-Za-z0-9_-].
     */
    [[nodiscard]] static bool IsValidSessionId(std::string_view id) noexcept;

private:
    std::shared_ptr<EphemeralSessionManagerImpl> m_impl;
};

}  // namespace Privacy
}  // namespace ShadowVeil
