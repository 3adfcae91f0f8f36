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
 * ShadowVeil - EPHEMERAL SESSION MANAGER IMPLEMENTATION
 * ============================================================================
 *
 * @file EphemeralSessionManager.cpp
 *
 * Locking:
 *   m_registryMutex  session map (shared for reads)
 *   m_sweepMutex     held for a whole orphan sweep and by DisposeAll while
 *                    removing the base directory
 *   m_pendingMutex   count of creations past their reservation
 *
 * Environment and file system calls never run under m_registryMutex.
 * ============================================================================
 */

#include "pch.h"
#include "EphemeralSessionManager.hpp"
#include "../Core/PeriodicTask.hpp"
#include "../Utils/CryptoUtils.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/HashUtils.hpp"

#include <sys/stat.h>
#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace ShadowVeil {
namespace Privacy {

using namespace Utils;
using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define SM_LOG_DEBUG(fmt, ...)   SV_LOG_DEBUG("Sessions", fmt, ##__VA_ARGS__)
#define SM_LOG_INFO(fmt, ...)    SV_LOG_INFO("Sessions", fmt, ##__VA_ARGS__)
#define SM_LOG_WARN(fmt, ...)    SV_LOG_WARN("Sessions", fmt, ##__VA_ARGS__)
#define SM_LOG_ERROR(fmt, ...)   SV_LOG_ERROR("Sessions", fmt, ##__VA_ARGS__)

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

std::string_view GetSessionStateName(SessionState state) noexcept {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Active:        return "Active";
        case SessionState::Disposed:      return "Disposed";
        default:                          return "Unknown";
    }
}

std::string_view GetSessionErrorCodeName(SessionErrorCode code) noexcept {
    switch (code) {
        case SessionErrorCode::None:               return "None";
        case SessionErrorCode::InvalidId:          return "InvalidId";
        case SessionErrorCode::AlreadyExists:      return "AlreadyExists";
        case SessionErrorCode::StorageFailure:     return "StorageFailure";
        case SessionErrorCode::EnvironmentFailure: return "EnvironmentFailure";
        case SessionErrorCode::WipeFailed:         return "WipeFailed";
        case SessionErrorCode::ShuttingDown:       return "ShuttingDown";
        case SessionErrorCode::RandomFailure:      return "RandomFailure";
        default:                                   return "Unknown";
    }
}

namespace {

void SetSessionError(SessionError* err, SessionErrorCode code, std::string message) {
    if (err) {
        err->code = code;
        err->message = std::move(message);
    }
}

fs::path DefaultBasePath() {
    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec || temp.empty()) {
        temp = "/tmp";
    }
    return temp / std::string(SessionManagerConstants::DEFAULT_BASE_DIRECTORY_NAME);
}

int64_t ToUnixMillis(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace

// ============================================================================
// STRUCTURE METHODS
// ============================================================================

std::string SessionInfo::ToJson() const {
    json j;
    j["id"] = id;
    j["storagePath"] = storagePath.string();
    j["createdAtMs"] = ToUnixMillis(createdAt);
    j["active"] = active;
    return j.dump();
}

bool SessionManagerConfiguration::IsValid() const noexcept {
    return sweepInterval.count() > 0 &&
           orphanStaleness.count() >= 0 &&
           environmentExitTimeout.count() >= 0;
}

SessionManagerConfiguration SessionManagerConfiguration::CreateDefault() {
    SessionManagerConfiguration config;
    config.basePath = DefaultBasePath();
    config.browserArguments.assign(SessionManagerConstants::DEFAULT_BROWSER_ARGUMENTS.begin(),
                                   SessionManagerConstants::DEFAULT_BROWSER_ARGUMENTS.end());
    return config;
}

void SessionManagerStatistics::Reset() noexcept {
    sessionsCreated = 0;
    sessionsDisposed = 0;
    creationFailures = 0;
    wipeFailures = 0;
    environmentExitTimeouts = 0;
    orphansRemoved = 0;
    sweepsRun = 0;
    sweepsSkipped = 0;
}

std::string SessionManagerStatistics::ToJson() const {
    json j;
    j["sessionsCreated"] = sessionsCreated.load();
    j["sessionsDisposed"] = sessionsDisposed.load();
    j["creationFailures"] = creationFailures.load();
    j["wipeFailures"] = wipeFailures.load();
    j["environmentExitTimeouts"] = environmentExitTimeouts.load();
    j["orphansRemoved"] = orphansRemoved.load();
    j["sweepsRun"] = sweepsRun.load();
    j["sweepsSkipped"] = sweepsSkipped.load();
    return j.dump();
}

// ============================================================================
// IMPLEMENTATION CLASS
// ============================================================================

class EphemeralSessionManagerImpl {
public:
    struct SessionEntry {
        SessionInfo info;
        SessionState state = SessionState::Uninitialized;
        std::shared_ptr<IBrowsingEnvironment> environment;
    };

    EphemeralSessionManagerImpl(SessionManagerConfiguration config,
                                std::shared_ptr<IEnvironmentProvider> provider,
                                std::shared_ptr<SecureDeletionWorker> wiper);

    ~EphemeralSessionManagerImpl() = default;

    bool Start();
    void Stop();

    bool CreateSession(const std::optional<std::string>& id, SessionInfo& out, SessionError* err);
    bool DisposeSession(std::string_view id, SessionError* err);
    size_t CleanupOrphans();
    void DisposeAll();

    std::shared_ptr<IBrowsingEnvironment> GetEnvironment(std::string_view id) const;
    std::optional<SessionInfo> GetSession(std::string_view id) const;
    std::vector<SessionInfo> ListActive() const;

    void SetTeardownHook(SessionTeardownHook hook);

    SessionManagerConfiguration m_config;
    SessionManagerStatistics m_stats;
    std::atomic<bool> m_shutDown{false};

private:
    bool GenerateSessionId(std::string& out, SessionError* err);
    bool IsRegistered(const std::string& id) const;
    void RollBack(const std::string& id, const fs::path& dir,
                  const std::shared_ptr<IBrowsingEnvironment>& environment);
    void ReleaseEnvironment(const std::string& id,
                            const std::shared_ptr<IBrowsingEnvironment>& environment);
    void EndPendingCreation();
    void EndPendingDisposal();
    void RunTeardownHook(const SessionInfo& info);

    std::shared_ptr<IEnvironmentProvider> m_provider;
    std::shared_ptr<SecureDeletionWorker> m_wiper;
    CryptoUtils::SecureRandom m_rng;

    mutable std::shared_mutex m_registryMutex;
    std::unordered_map<std::string, SessionEntry> m_sessions;

    std::mutex m_sweepMutex;

    std::mutex m_pendingMutex;
    std::condition_variable m_pendingCv;
    size_t m_pendingCreations = 0;
    size_t m_pendingDisposals = 0;

    std::mutex m_hookMutex;
    SessionTeardownHook m_teardownHook;

    std::unique_ptr<Core::PeriodicTask> m_sweepTask;
};

EphemeralSessionManagerImpl::EphemeralSessionManagerImpl(
    SessionManagerConfiguration config,
    std::shared_ptr<IEnvironmentProvider> provider,
    std::shared_ptr<SecureDeletionWorker> wiper)
    : m_config(std::move(config))
    , m_provider(std::move(provider))
    , m_wiper(std::move(wiper)) {

    if (!m_provider) {
        throw std::invalid_argument("EphemeralSessionManager requires an environment provider");
    }
    if (!m_wiper) {
        m_wiper = std::make_shared<SecureDeletionWorker>();
    }
    if (!m_config.IsValid()) {
        SM_LOG_WARN("Invalid configuration, falling back to defaults");
        fs::path basePath = m_config.basePath;
        m_config = SessionManagerConfiguration::CreateDefault();
        if (!basePath.empty()) {
            m_config.basePath = std::move(basePath);
        }
    }
    if (m_config.basePath.empty()) {
        m_config.basePath = DefaultBasePath();
    }
    m_config.basePath = m_config.basePath.lexically_normal();

    m_sweepTask = std::make_unique<Core::PeriodicTask>(
        "SessionOrphanSweep",
        std::chrono::duration_cast<std::chrono::milliseconds>(m_config.sweepInterval),
        [this] { CleanupOrphans(); });
}

bool EphemeralSessionManagerImpl::Start() {
    if (m_shutDown.load(std::memory_order_acquire)) {
        SM_LOG_WARN("Start() after DisposeAll()");
        return false;
    }
    if (!m_sweepTask->Start()) {
        return false;
    }
    SM_LOG_INFO("Session manager started (base=%s, sweep=%llds)",
                m_config.basePath.c_str(),
                static_cast<long long>(m_config.sweepInterval.count()));
    return true;
}

void EphemeralSessionManagerImpl::Stop() {
    m_sweepTask->Stop();
}

// ----------------------------------------------------------------------------
// Creation
// ----------------------------------------------------------------------------

bool EphemeralSessionManagerImpl::GenerateSessionId(std::string& out, SessionError* err) {
    std::array<uint8_t, 8 + SessionManagerConstants::GENERATED_ID_RANDOM_BYTES> raw{};

    // Big-endian millisecond timestamp keeps ids roughly time-ordered.
    const uint64_t millis = static_cast<uint64_t>(ToUnixMillis(std::chrono::system_clock::now()));
    for (size_t i = 0; i < 8; ++i) {
        raw[i] = static_cast<uint8_t>(millis >> (56 - 8 * i));
    }

    CryptoUtils::Error cerr;
    if (!m_rng.Generate(raw.data() + 8, SessionManagerConstants::GENERATED_ID_RANDOM_BYTES, &cerr)) {
        SetSessionError(err, SessionErrorCode::RandomFailure, "session id generation failed: " + cerr.message);
        return false;
    }

    out = HashUtils::ToHexLower(raw.data(), raw.size());
    return true;
}

bool EphemeralSessionManagerImpl::IsRegistered(const std::string& id) const {
    std::shared_lock lock(m_registryMutex);
    return m_sessions.find(id) != m_sessions.end();
}

void EphemeralSessionManagerImpl::EndPendingCreation() {
    {
        std::lock_guard lock(m_pendingMutex);
        --m_pendingCreations;
    }
    m_pendingCv.notify_all();
}

void EphemeralSessionManagerImpl::EndPendingDisposal() {
    {
        std::lock_guard lock(m_pendingMutex);
        --m_pendingDisposals;
    }
    m_pendingCv.notify_all();
}

void EphemeralSessionManagerImpl::SetTeardownHook(SessionTeardownHook hook) {
    std::lock_guard lock(m_hookMutex);
    m_teardownHook = std::move(hook);
}

void EphemeralSessionManagerImpl::RunTeardownHook(const SessionInfo& info) {
    SessionTeardownHook hook;
    {
        std::lock_guard lock(m_hookMutex);
        hook = m_teardownHook;
    }
    if (!hook) {
        return;
    }
    try {
        hook(info);
    }
    catch (const std::exception& ex) {
        SM_LOG_WARN("Teardown hook for session %s threw: %s", info.id.c_str(), ex.what());
    }
}

void EphemeralSessionManagerImpl::ReleaseEnvironment(
    const std::string& id,
    const std::shared_ptr<IBrowsingEnvironment>& environment) {

    if (!environment) {
        return;
    }
    try {
        environment->Release();
        if (!environment->WaitForExit(m_config.environmentExitTimeout)) {
            m_stats.environmentExitTimeouts++;
            SM_LOG_WARN("Environment of session %s still running after %lldms",
                        id.c_str(), static_cast<long long>(m_config.environmentExitTimeout.count()));
        }
    }
    catch (const std::exception& ex) {
        SM_LOG_WARN("Releasing environment of session %s failed: %s", id.c_str(), ex.what());
    }
}

void EphemeralSessionManagerImpl::RollBack(
    const std::string& id,
    const fs::path& dir,
    const std::shared_ptr<IBrowsingEnvironment>& environment) {

    ReleaseEnvironment(id, environment);

    if (!dir.empty()) {
        const WipeResult wipe = m_wiper->WipeDirectory(dir);
        if (!wipe) {
            m_stats.wipeFailures++;
            SM_LOG_ERROR("Rollback of session %s left storage behind: %s",
                         id.c_str(), wipe.message.c_str());
        }
    }

    std::unique_lock lock(m_registryMutex);
    m_sessions.erase(id);
}

bool EphemeralSessionManagerImpl::CreateSession(const std::optional<std::string>& requestedId,
                                                SessionInfo& out,
                                                SessionError* err) {
    if (m_shutDown.load(std::memory_order_acquire)) {
        SetSessionError(err, SessionErrorCode::ShuttingDown, "session manager is shut down");
        return false;
    }

    std::string id;
    if (requestedId.has_value()) {
        if (!EphemeralSessionManager::IsValidSessionId(*requestedId)) {
            m_stats.creationFailures++;
            SetSessionError(err, SessionErrorCode::InvalidId, "invalid session id");
            return false;
        }
        id = *requestedId;
    }
    else if (!GenerateSessionId(id, err)) {
        m_stats.creationFailures++;
        return false;
    }

    // Reserve the id. From here on every exit path must release it.
    {
        std::unique_lock lock(m_registryMutex);
        if (m_shutDown.load(std::memory_order_acquire)) {
            SetSessionError(err, SessionErrorCode::ShuttingDown, "session manager is shut down");
            return false;
        }
        if (m_sessions.find(id) != m_sessions.end()) {
            m_stats.creationFailures++;
            SetSessionError(err, SessionErrorCode::AlreadyExists, "session '" + id + "' already exists");
            return false;
        }
        SessionEntry entry;
        entry.info.id = id;
        entry.info.storagePath = m_config.basePath / id;
        m_sessions.emplace(id, std::move(entry));

        std::lock_guard pending(m_pendingMutex);
        ++m_pendingCreations;
    }

    const fs::path dir = m_config.basePath / id;

    FileUtils::Error ferr;
    if (!FileUtils::CreateDirectories(m_config.basePath, &ferr)) {
        RollBack(id, {}, nullptr);
        EndPendingCreation();
        m_stats.creationFailures++;
        SetSessionError(err, SessionErrorCode::StorageFailure, ferr.message);
        SM_LOG_ERROR("Cannot create base directory: %s", ferr.message.c_str());
        return false;
    }

    if (::mkdir(dir.c_str(), S_IRWXU) != 0) {
        const int code = errno;
        RollBack(id, {}, nullptr);
        EndPendingCreation();
        m_stats.creationFailures++;
        if (code == EEXIST) {
            SetSessionError(err, SessionErrorCode::AlreadyExists,
                            "storage for session '" + id + "' already exists");
        }
        else {
            SetSessionError(err, SessionErrorCode::StorageFailure,
                            "mkdir " + dir.string() + ": " + std::strerror(code));
            SV_LOG_ERRNO("Sessions", code, "mkdir %s failed", dir.c_str());
        }
        return false;
    }

    std::shared_ptr<IBrowsingEnvironment> environment;
    std::string providerError = "provider returned no environment";
    try {
        environment = m_provider->CreateEnvironment(dir, m_config.browserArguments);
    }
    catch (const std::exception& ex) {
        providerError = ex.what();
    }

    if (!environment) {
        RollBack(id, dir, nullptr);
        EndPendingCreation();
        m_stats.creationFailures++;
        SetSessionError(err, SessionErrorCode::EnvironmentFailure, providerError);
        SM_LOG_ERROR("Environment for session %s failed: %s", id.c_str(), providerError.c_str());
        return false;
    }

    bool published = false;
    {
        std::unique_lock lock(m_registryMutex);
        auto it = m_sessions.find(id);
        if (it != m_sessions.end() && !m_shutDown.load(std::memory_order_acquire)) {
            it->second.state = SessionState::Active;
            it->second.environment = environment;
            it->second.info.createdAt = std::chrono::system_clock::now();
            it->second.info.active = true;
            out = it->second.info;
            published = true;
        }
    }

    if (!published) {
        RollBack(id, dir, environment);
        EndPendingCreation();
        m_stats.creationFailures++;
        SetSessionError(err, SessionErrorCode::ShuttingDown, "session manager shut down during creation");
        return false;
    }

    EndPendingCreation();
    m_stats.sessionsCreated++;
    SM_LOG_INFO("Created session %s", id.c_str());
    return true;
}

// ----------------------------------------------------------------------------
// Disposal
// ----------------------------------------------------------------------------

bool EphemeralSessionManagerImpl::DisposeSession(std::string_view idView, SessionError* err) {
    const std::string id(idView);

    // The entry stays registered as Disposed until its storage is wiped so the
    // orphan sweep never treats the directory as unowned.
    SessionInfo info;
    std::shared_ptr<IBrowsingEnvironment> environment;
    {
        std::unique_lock lock(m_registryMutex);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) {
            SM_LOG_DEBUG("Dispose of unknown session %s ignored", id.c_str());
            return true;
        }
        if (it->second.state != SessionState::Active) {
            SM_LOG_DEBUG("Dispose of session %s ignored, state %s", id.c_str(),
                         std::string(GetSessionStateName(it->second.state)).c_str());
            return true;
        }
        it->second.state = SessionState::Disposed;
        it->second.info.active = false;
        info = it->second.info;
        environment = std::move(it->second.environment);

        std::lock_guard pending(m_pendingMutex);
        ++m_pendingDisposals;
    }

    ReleaseEnvironment(id, environment);
    environment.reset();

    RunTeardownHook(info);

    const WipeResult wipe = m_wiper->WipeDirectory(info.storagePath);
    {
        std::unique_lock lock(m_registryMutex);
        m_sessions.erase(id);
    }
    EndPendingDisposal();

    m_stats.sessionsDisposed++;
    if (!wipe) {
        m_stats.wipeFailures++;
        SetSessionError(err, SessionErrorCode::WipeFailed, wipe.message);
        SM_LOG_ERROR("Session %s disposed but storage wipe failed: %s", id.c_str(), wipe.message.c_str());
        return false;
    }

    SM_LOG_INFO("Disposed session %s", id.c_str());
    return true;
}

size_t EphemeralSessionManagerImpl::CleanupOrphans() {
    std::unique_lock sweepLock(m_sweepMutex, std::try_to_lock);
    if (!sweepLock.owns_lock()) {
        m_stats.sweepsSkipped++;
        SM_LOG_DEBUG("Orphan sweep already running, skipped");
        return 0;
    }
    m_stats.sweepsRun++;

    FileUtils::Error ferr;
    if (!FileUtils::IsDirectory(m_config.basePath, &ferr)) {
        return 0;
    }

    std::vector<fs::path> candidates;
    if (!FileUtils::ListSubdirectories(m_config.basePath, candidates, &ferr)) {
        SM_LOG_WARN("Orphan sweep cannot list %s: %s", m_config.basePath.c_str(), ferr.message.c_str());
        return 0;
    }

    const auto now = std::chrono::system_clock::now();
    size_t removed = 0;

    for (const auto& dir : candidates) {
        const std::string name = dir.filename().string();
        if (IsRegistered(name)) {
            continue;
        }

        FileUtils::FileStat st;
        if (!FileUtils::Stat(dir, st, &ferr) || !st.exists || !st.isDirectory) {
            continue;
        }
        if (now - st.changeTime < m_config.orphanStaleness ||
            now - st.lastWrite < m_config.orphanStaleness) {
            continue;
        }

        const WipeResult wipe = m_wiper->WipeDirectory(dir);
        if (wipe) {
            ++removed;
            m_stats.orphansRemoved++;
            SM_LOG_INFO("Removed orphaned session storage %s", name.c_str());
        }
        else {
            m_stats.wipeFailures++;
            SM_LOG_WARN("Orphan %s not removed: %s", name.c_str(), wipe.message.c_str());
        }
    }

    return removed;
}

void EphemeralSessionManagerImpl::DisposeAll() {
    bool expected = false;
    if (!m_shutDown.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    SV_LOG_SCOPE("Sessions");
    SM_LOG_INFO("Disposing all sessions");
    m_sweepTask->Stop();

    {
        std::unique_lock lock(m_pendingMutex);
        m_pendingCv.wait(lock, [this] { return m_pendingCreations == 0; });
    }

    std::vector<std::string> ids;
    {
        std::shared_lock lock(m_registryMutex);
        ids.reserve(m_sessions.size());
        for (const auto& [id, entry] : m_sessions) {
            if (entry.state == SessionState::Active) {
                ids.push_back(id);
            }
        }
    }

    std::vector<std::future<bool>> pending;
    pending.reserve(ids.size());
    for (const auto& id : ids) {
        pending.push_back(std::async(std::launch::async, [this, id] {
            return DisposeSession(id, nullptr);
        }));
    }
    size_t failed = 0;
    for (auto& f : pending) {
        if (!f.get()) {
            ++failed;
        }
    }

    // Disposals started by other callers before the shutdown flag was set.
    {
        std::unique_lock lock(m_pendingMutex);
        m_pendingCv.wait(lock, [this] { return m_pendingDisposals == 0; });
    }

    std::lock_guard sweepLock(m_sweepMutex);
    FileUtils::Error ferr;
    if (FileUtils::Exists(m_config.basePath, &ferr)) {
        const WipeResult wipe = m_wiper->WipeDirectory(m_config.basePath);
        if (!wipe) {
            m_stats.wipeFailures++;
            SM_LOG_ERROR("Base directory %s not removed: %s",
                         m_config.basePath.c_str(), wipe.message.c_str());
        }
    }

    SM_LOG_INFO("Disposed %zu session(s), %zu with wipe failures", ids.size(), failed);
}

// ----------------------------------------------------------------------------
// Queries
// ----------------------------------------------------------------------------

std::shared_ptr<IBrowsingEnvironment> EphemeralSessionManagerImpl::GetEnvironment(std::string_view id) const {
    std::shared_lock lock(m_registryMutex);
    auto it = m_sessions.find(std::string(id));
    if (it == m_sessions.end() || it->second.state != SessionState::Active) {
        return nullptr;
    }
    return it->second.environment;
}

std::optional<SessionInfo> EphemeralSessionManagerImpl::GetSession(std::string_view id) const {
    std::shared_lock lock(m_registryMutex);
    auto it = m_sessions.find(std::string(id));
    if (it == m_sessions.end() || it->second.state != SessionState::Active) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<SessionInfo> EphemeralSessionManagerImpl::ListActive() const {
    std::vector<SessionInfo> out;
    {
        std::shared_lock lock(m_registryMutex);
        out.reserve(m_sessions.size());
        for (const auto& [id, entry] : m_sessions) {
            if (entry.state == SessionState::Active) {
                out.push_back(entry.info);
            }
        }
    }
    std::sort(out.begin(), out.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.createdAt < b.createdAt;
    });
    return out;
}

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

EphemeralSessionManager::EphemeralSessionManager(SessionManagerConfiguration config,
                                                 std::shared_ptr<IEnvironmentProvider> provider,
                                                 std::shared_ptr<SecureDeletionWorker> wiper)
    : m_impl(std::make_shared<EphemeralSessionManagerImpl>(
          std::move(config), std::move(provider), std::move(wiper))) {
}

EphemeralSessionManager::~EphemeralSessionManager() {
    m_impl->DisposeAll();
}

bool EphemeralSessionManager::Start() {
    return m_impl->Start();
}

void EphemeralSessionManager::Stop() {
    m_impl->Stop();
}

bool EphemeralSessionManager::CreateSession(const std::optional<std::string>& id,
                                            SessionInfo& out,
                                            SessionError* err) {
    return m_impl->CreateSession(id, out, err);
}

std::future<SessionOutcome> EphemeralSessionManager::CreateSessionAsync(std::optional<std::string> id) {
    return std::async(std::launch::async, [impl = m_impl, id = std::move(id)] {
        SessionOutcome outcome;
        outcome.ok = impl->CreateSession(id, outcome.info, &outcome.error);
        return outcome;
    });
}

std::shared_ptr<IBrowsingEnvironment> EphemeralSessionManager::GetEnvironment(std::string_view id) const {
    return m_impl->GetEnvironment(id);
}

std::optional<SessionInfo> EphemeralSessionManager::GetSession(std::string_view id) const {
    return m_impl->GetSession(id);
}

std::vector<SessionInfo> EphemeralSessionManager::ListActive() const {
    return m_impl->ListActive();
}

void EphemeralSessionManager::SetTeardownHook(SessionTeardownHook hook) {
    m_impl->SetTeardownHook(std::move(hook));
}

bool EphemeralSessionManager::DisposeSession(std::string_view id, SessionError* err) {
    return m_impl->DisposeSession(id, err);
}

std::future<SessionOutcome> EphemeralSessionManager::DisposeSessionAsync(std::string id) {
    return std::async(std::launch::async, [impl = m_impl, id = std::move(id)] {
        SessionOutcome outcome;
        outcome.ok = impl->DisposeSession(id, &outcome.error);
        return outcome;
    });
}

size_t EphemeralSessionManager::CleanupOrphans() {
    return m_impl->CleanupOrphans();
}

void EphemeralSessionManager::DisposeAll() {
    m_impl->DisposeAll();
}

const fs::path& EphemeralSessionManager::GetBasePath() const noexcept {
    return m_impl->m_config.basePath;
}

const SessionManagerConfiguration& EphemeralSessionManager::GetConfiguration() const noexcept {
    return m_impl->m_config;
}

const SessionManagerStatistics& EphemeralSessionManager::GetStatistics() const noexcept {
    return m_impl->m_stats;
}

bool EphemeralSessionManager::IsShutDown() const noexcept {
    return m_impl->m_shutDown.load(std::memory_order_acquire);
}

bool EphemeralSessionManager::IsValidSessionId(std::string_view id) noexcept {
    if (id.empty() || id.size() > SessionManagerConstants::MAX_SESSION_ID_LENGTH) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_';
    });
}

}  // namespace Privacy
}  // namespace ShadowVeil
