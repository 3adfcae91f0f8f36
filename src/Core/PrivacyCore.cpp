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
 * ShadowVeil - PRIVACY CORE IMPLEMENTATION
 * ============================================================================
 *
 * @file PrivacyCore.cpp
 * ============================================================================
 */

#include "pch.h"
#include "PrivacyCore.hpp"

#include <mutex>

#include <nlohmann/json.hpp>

namespace ShadowVeil {
namespace Core {

using namespace Privacy;
using namespace WebProtection;
using json = nlohmann::json;
namespace fs = std::filesystem;

#define PC_LOG_INFO(fmt, ...)    SV_LOG_INFO("PrivacyCore", fmt, ##__VA_ARGS__)
#define PC_LOG_WARN(fmt, ...)    SV_LOG_WARN("PrivacyCore", fmt, ##__VA_ARGS__)

PrivacyCore::PrivacyCore(Config::CoreConfiguration config,
                         std::shared_ptr<IEnvironmentProvider> provider,
                         std::shared_ptr<IContentMarker> marker)
    : m_config(std::move(config))
    , m_wiper(std::make_shared<SecureDeletionWorker>(m_config.secureDeletion))
    , m_marker(marker ? std::move(marker) : CreateDefaultContentMarker())
    , m_sanitizer(std::make_unique<UrlSanitizer>(m_config.sanitizer))
    , m_sessions(std::make_unique<EphemeralSessionManager>(m_config.sessions, std::move(provider), m_wiper)) {

    // Quarantine purge runs once the session's environment has exited.
    m_sessions->SetTeardownHook([this](const SessionInfo& session) {
        if (auto gate = TakeGate(session.id)) {
            gate->Shutdown();
        }
    });
}

PrivacyCore::~PrivacyCore() {
    DisposeAll();
    m_sessions->SetTeardownHook(nullptr);
}

bool PrivacyCore::Start() {
    auto& logger = Utils::Logger::Instance();
    if (!logger.IsInitialized()) {
        logger.Initialize(m_config.logging);
    }

    if (!m_sanitizer->Initialize()) {
        PC_LOG_WARN("Sanitizer rules file not loaded, default rules active");
    }

    if (!m_sessions->Start()) {
        PC_LOG_WARN("Orphan sweep not started");
        return false;
    }

    PC_LOG_INFO("Privacy core started");
    return true;
}

// ============================================================================
// SESSIONS
// ============================================================================

bool PrivacyCore::CreateSession(const std::optional<std::string>& id, SessionInfo& out, SessionError* err) {
    return m_sessions->CreateSession(id, out, err);
}

std::shared_ptr<IBrowsingEnvironment> PrivacyCore::GetEnvironment(std::string_view id) const {
    return m_sessions->GetEnvironment(id);
}

std::shared_ptr<DownloadQuarantineGate> PrivacyCore::TakeGate(std::string_view sessionId) {
    std::unique_lock lock(m_gatesMutex);
    const auto it = m_gates.find(std::string(sessionId));
    if (it == m_gates.end()) {
        return nullptr;
    }
    auto gate = std::move(it->second);
    m_gates.erase(it);
    return gate;
}

bool PrivacyCore::DisposeSession(std::string_view id, SessionError* err) {
    if (auto gate = GetDownloadGate(id)) {
        gate->Detach();
    }
    return m_sessions->DisposeSession(id, err);
}

std::vector<SessionInfo> PrivacyCore::ListActive() const {
    return m_sessions->ListActive();
}

size_t PrivacyCore::CleanupOrphans() {
    return m_sessions->CleanupOrphans();
}

void PrivacyCore::DisposeAll() {
    std::vector<std::shared_ptr<DownloadQuarantineGate>> attached;
    {
        std::shared_lock lock(m_gatesMutex);
        attached.reserve(m_gates.size());
        for (const auto& [id, gate] : m_gates) {
            attached.push_back(gate);
        }
    }
    for (const auto& gate : attached) {
        gate->Detach();
    }

    m_sessions->DisposeAll();

    std::unordered_map<std::string, std::shared_ptr<DownloadQuarantineGate>> leftover;
    {
        std::unique_lock lock(m_gatesMutex);
        leftover.swap(m_gates);
    }
    for (auto& [id, gate] : leftover) {
        gate->Shutdown();
    }
}

// ============================================================================
// NAVIGATION
// ============================================================================

SanitizationResult PrivacyCore::Sanitize(std::string_view url) {
    return m_sanitizer->Sanitize(url);
}

NavigationDecision PrivacyCore::OnNavigationStarting(std::string_view uri) {
    return m_sanitizer->OnNavigationStarting(uri);
}

DomainMetrics PrivacyCore::GetDomainMetrics(std::string_view domain) const {
    return m_sanitizer->GetDomainMetrics(domain);
}

bool PrivacyCore::LoadRules(std::string_view jsonText) {
    return m_sanitizer->LoadRules(jsonText);
}

// ============================================================================
// DOWNLOADS
// ============================================================================

bool PrivacyCore::InitializeDownloadGate(std::string_view sessionId,
                                         std::shared_ptr<IDownloadEventSource> source,
                                         DownloadError* err) {
    auto fail = [err](DownloadErrorCode code, std::string message) {
        if (err) {
            err->code = code;
            err->message = std::move(message);
        }
        return false;
    };

    const auto session = m_sessions->GetSession(sessionId);
    if (!session) {
        return fail(DownloadErrorCode::NotFound, "unknown session '" + std::string(sessionId) + "'");
    }

    auto gate = std::make_shared<DownloadQuarantineGate>(m_config.downloads, m_marker, m_wiper);
    {
        std::unique_lock lock(m_gatesMutex);
        if (m_gates.count(session->id) != 0) {
            PC_LOG_WARN("Session %s already has a download gate", session->id.c_str());
            return fail(DownloadErrorCode::InvalidState, "download gate already initialized");
        }
        m_gates.emplace(session->id, gate);
    }

    const fs::path quarantineDir =
        session->storagePath / std::string(QuarantineGateConstants::QUARANTINE_DIRECTORY_NAME);
    if (!gate->Initialize(std::move(source), quarantineDir)) {
        TakeGate(session->id);
        return fail(DownloadErrorCode::IoError, "cannot initialize quarantine at " + quarantineDir.string());
    }

    // The session may have been disposed while the gate was being set up.
    if (!m_sessions->GetSession(session->id)) {
        if (auto stale = TakeGate(session->id)) {
            stale->Shutdown();
        }
        return fail(DownloadErrorCode::NotFound, "session disposed during gate setup");
    }

    return true;
}

std::shared_ptr<DownloadQuarantineGate> PrivacyCore::GetDownloadGate(std::string_view sessionId) const {
    std::shared_lock lock(m_gatesMutex);
    const auto it = m_gates.find(std::string(sessionId));
    return it == m_gates.end() ? nullptr : it->second;
}

bool PrivacyCore::Promote(std::string_view sessionId,
                          const std::string& downloadId,
                          const fs::path& destination,
                          DownloadRecord& out,
                          DownloadError* err) {
    const auto gate = GetDownloadGate(sessionId);
    if (!gate) {
        if (err) {
            err->code = DownloadErrorCode::NotInitialized;
            err->message = "no download gate for session '" + std::string(sessionId) + "'";
        }
        return false;
    }
    return gate->Promote(downloadId, destination, out, err);
}

bool PrivacyCore::Delete(std::string_view sessionId, const std::string& downloadId) {
    const auto gate = GetDownloadGate(sessionId);
    return gate && gate->Delete(downloadId);
}

std::vector<DownloadRecord> PrivacyCore::GetActiveDownloads(std::string_view sessionId) const {
    const auto gate = GetDownloadGate(sessionId);
    return gate ? gate->GetActiveDownloads() : std::vector<DownloadRecord>{};
}

DownloadMetrics PrivacyCore::GetDownloadMetrics(std::string_view sessionId) const {
    const auto gate = GetDownloadGate(sessionId);
    return gate ? gate->GetMetrics() : DownloadMetrics{};
}

// ============================================================================
// STATUS
// ============================================================================

std::string PrivacyCore::GetStatusJson() const {
    json j;
    j["sessions"] = json::parse(m_sessions->GetStatistics().ToJson());
    j["secureDeletion"] = json::parse(m_wiper->GetStatistics().ToJson());
    j["sanitizer"] = json::parse(m_sanitizer->GetStatistics().ToJson());

    json active = json::array();
    for (const auto& info : m_sessions->ListActive()) {
        json entry = json::parse(info.ToJson());
        if (const auto gate = GetDownloadGate(info.id)) {
            entry["downloads"] = json::parse(gate->GetMetrics().ToJson());
        }
        active.push_back(std::move(entry));
    }
    j["activeSessions"] = std::move(active);
    return j.dump();
}

}  // namespace Core
}  // namespace ShadowVeil
