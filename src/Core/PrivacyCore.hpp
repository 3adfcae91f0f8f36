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
 * ShadowVeil - PRIVACY CORE
 * ============================================================================
 *
 * @file PrivacyCore.hpp
 * @brief Inbound interface of the privacy core for the GUI shell.
 *
 * Owns one session manager, one URL sanitizer, and one download quarantine
 * gate per session. Closing a session shuts its gate down first, so
 * undecided downloads are purged before the session storage is wiped.
 * ============================================================================
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../Config/CoreConfiguration.hpp"
#include "../Privacy/BrowsingEnvironment.hpp"
#include "../Privacy/EphemeralSessionManager.hpp"
#include "../Privacy/SecureDeletion.hpp"
#include "../WebProtection/ContentMarker.hpp"
#include "../WebProtection/DownloadQuarantineGate.hpp"
#include "../WebProtection/UrlSanitizer.hpp"

namespace ShadowVeil {
namespace Core {

class PrivacyCore final {
public:
    PrivacyCore(Config::CoreConfiguration config,
                std::shared_ptr<Privacy::IEnvironmentProvider> provider,
                std::shared_ptr<WebProtection::IContentMarker> marker = nullptr);

    /// @brief Calls DisposeAll()
    ~PrivacyCore();

    PrivacyCore(const PrivacyCore&) = delete;
    PrivacyCore& operator=(const PrivacyCore&) = delete;

    /**
     * @brief Initialize logging (unless the host already did), load
     *        sanitizer rules and start the orphan sweep.
     * @return false when the sweep could not start
     */
    [[nodiscard]] bool Start();

    // ========================================================================
    // SESSIONS
    // ========================================================================

    [[nodiscard]] bool CreateSession(const std::optional<std::string>& id,
                                     Privacy::SessionInfo& out,
                                     Privacy::SessionError* err = nullptr);

    [[nodiscard]] std::shared_ptr<Privacy::IBrowsingEnvironment> GetEnvironment(std::string_view id) const;

    /**
     * @brief Detach the session's gate, then dispose the session.
     *
     * Undecided downloads are purged after the environment has exited and
     * before the storage wipe.
     */
    bool DisposeSession(std::string_view id, Privacy::SessionError* err = nullptr);

    [[nodiscard]] std::vector<Privacy::SessionInfo> ListActive() const;

    size_t CleanupOrphans();

    void DisposeAll();

    // ========================================================================
    // NAVIGATION
    // ========================================================================

    [[nodiscard]] WebProtection::SanitizationResult Sanitize(std::string_view url);

    [[nodiscard]] WebProtection::NavigationDecision OnNavigationStarting(std::string_view uri);

    [[nodiscard]] WebProtection::DomainMetrics GetDomainMetrics(std::string_view domain) const;

    bool LoadRules(std::string_view jsonText);

    // ========================================================================
    // DOWNLOADS
    // ========================================================================

    /**
     * @brief Attach a quarantine gate at <session>/Quarantine to a download source.
     */
    [[nodiscard]] bool InitializeDownloadGate(std::string_view sessionId,
                                              std::shared_ptr<WebProtection::IDownloadEventSource> source,
                                              WebProtection::DownloadError* err = nullptr);

    [[nodiscard]] bool Promote(std::string_view sessionId,
                               const std::string& downloadId,
                               const std::filesystem::path& destination,
                               WebProtection::DownloadRecord& out,
                               WebProtection::DownloadError* err = nullptr);

    bool Delete(std::string_view sessionId, const std::string& downloadId);

    [[nodiscard]] std::vector<WebProtection::DownloadRecord> GetActiveDownloads(std::string_view sessionId) const;

    /// @brief Zero-valued metrics when the session has no gate
    [[nodiscard]] WebProtection::DownloadMetrics GetDownloadMetrics(std::string_view sessionId) const;

    [[nodiscard]] std::shared_ptr<WebProtection::DownloadQuarantineGate> GetDownloadGate(std::string_view sessionId) const;

    // ========================================================================
    // COMPONENTS
    // ========================================================================

    [[nodiscard]] Privacy::EphemeralSessionManager& GetSessionManager() noexcept { return *m_sessions; }

    [[nodiscard]] WebProtection::UrlSanitizer& GetSanitizer() noexcept { return *m_sanitizer; }

    [[nodiscard]] const Config::CoreConfiguration& GetConfiguration() const noexcept { return m_config; }

    [[nodiscard]] std::string GetStatusJson() const;

private:
    std::shared_ptr<WebProtection::DownloadQuarantineGate> TakeGate(std::string_view sessionId);

    Config::CoreConfiguration m_config;
    std::shared_ptr<Privacy::SecureDeletionWorker> m_wiper;
    std::shared_ptr<WebProtection::IContentMarker> m_marker;
    std::unique_ptr<WebProtection::UrlSanitizer> m_sanitizer;
    std::unique_ptr<Privacy::EphemeralSessionManager> m_sessions;

    mutable std::shared_mutex m_gatesMutex;
    std::unordered_map<std::string, std::shared_ptr<WebProtection::DownloadQuarantineGate>> m_gates;
};

}  // namespace Core
}  // namespace ShadowVeil
