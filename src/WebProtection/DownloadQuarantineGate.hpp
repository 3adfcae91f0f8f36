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
 * ShadowVeil - DOWNLOAD QUARANTINE GATE
 * ============================================================================
 *
 * @file DownloadQuarantineGate.hpp
 * @brief Intercepts downloads of one session and holds them in quarantine
 *        until the user promotes or deletes them.
 *
 * FLOW:
 * =====
 * 1. OnDownloadStarting: content type must start with an allowed type and
 *    the extension must not be blocked. Accepted downloads are written by
 *    the engine to <quarantine>/<id>_<file name>.
 * 2. OnDownloadStateChanged(Completed): size and SHA-256 are computed, the
 *    file is marked as internet content (sidecar file when the marker fails)
 *    and the record becomes Quarantined. Interrupted transfers (or hashing failures) become Failed and the
 *    partial file is removed.
 * 3. Promote moves the file atomically to user storage. Delete wipes it.
 * 4. Detach stops new downloads; Shutdown purges every undecided download.
 *
 * Transitions on the same download are serialized and checked against
 * IsValidTransition; transitions whose precondition no longer holds fail
 * without side effects.
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// SHADOWVEIL INFRASTRUCTURE INCLUDES
// ============================================================================

#include "../Utils/Logger.hpp"
#include "../Privacy/SecureDeletion.hpp"
#include "ContentMarker.hpp"
#include "DownloadTypes.hpp"

// ============================================================================
// FORWARD DECLARATIONS
// ============================================================================

namespace ShadowVeil::WebProtection {
    class DownloadQuarantineGateImpl;
}

namespace ShadowVeil {
namespace WebProtection {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace QuarantineGateConstants {

    /// @brief Content types accepted by default (prefix match, case-insensitive)
    inline constexpr std::array<std::string_view, 10> DEFAULT_ALLOWED_CONTENT_TYPES = {
        "application/pdf",
        "text/plain",
        "text/csv",
        "application/json",
        "image/jpeg",
        "image/png",
        "image/gif",
        "image/webp",
        "application/zip",
        "application/x-zip-compressed"
    };

    /// @brief Extensions refused by default
    inline constexpr std::array<std::string_view, 13> DEFAULT_BLOCKED_EXTENSIONS = {
        ".exe", ".msi", ".bat", ".cmd", ".com", ".scr", ".pif",
        ".vbs", ".js", ".jar", ".app", ".deb", ".rpm"
    };

    /// @brief Assumed when the engine reports no content type
    inline constexpr std::string_view DEFAULT_CONTENT_TYPE = "application/octet-stream";

    /// @brief Random bytes in a download id (32 hex characters)
    inline constexpr size_t DOWNLOAD_ID_BYTES = 16;

    /// @brief Name of the per-session quarantine directory
    inline constexpr std::string_view QUARANTINE_DIRECTORY_NAME = "Quarantine";

}  // namespace QuarantineGateConstants

// ============================================================================
// STRUCTURES
// ============================================================================

struct QuarantineGateConfiguration {
    std::vector<std::string> allowedContentTypes = std::vector<std::string>(
        QuarantineGateConstants::DEFAULT_ALLOWED_CONTENT_TYPES.begin(),
        QuarantineGateConstants::DEFAULT_ALLOWED_CONTENT_TYPES.end());

    /// @brief Lowercase, with the leading dot
    std::vector<std::string> blockedExtensions = std::vector<std::string>(
        QuarantineGateConstants::DEFAULT_BLOCKED_EXTENSIONS.begin(),
        QuarantineGateConstants::DEFAULT_BLOCKED_EXTENSIONS.end());

    [[nodiscard]] bool IsValid() const noexcept;
};

using DownloadCallback = std::function<void(const DownloadRecord&)>;

// ============================================================================
// DOWNLOAD QUARANTINE GATE
// ============================================================================

/**
 * @class DownloadQuarantineGate
 *
 * USAGE:
 * @code
 *     DownloadQuarantineGate gate({}, CreateDefaultContentMarker(), wiper);
 *     gate.Initialize(engineDownloads, session.storagePath / "Quarantine");
 *     ...
 *     DownloadRecord record;
 *     DownloadError err;
 *     if (!gate.Promote(id, home / "Downloads" / name, record, &err)) { ... }
 * @endcode
 */
class DownloadQuarantineGate final : public IDownloadEventSink {
public:
    DownloadQuarantineGate(QuarantineGateConfiguration config = {},
                           std::shared_ptr<IContentMarker> marker = nullptr,
                           std::shared_ptr<Privacy::SecureDeletionWorker> wiper = nullptr);

    /// @brief Calls Shutdown()
    ~DownloadQuarantineGate() override;

    DownloadQuarantineGate(const DownloadQuarantineGate&) = delete;
    DownloadQuarantineGate& operator=(const DownloadQuarantineGate&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * @brief Create the quarantine directory and subscribe to the source.
     * @return false when already initialized, shut down, or the directory
     *         cannot be created
     */
    [[nodiscard]] bool Initialize(std::shared_ptr<IDownloadEventSource> source,
                                  const std::filesystem::path& quarantineDir);

    /**
     * @brief Unsubscribe and cancel new downloads.
     *
     * Recorded downloads and their files stay untouched until Shutdown.
     */
    void Detach();

    /**
     * @brief Unsubscribe and purge undecided downloads. Idempotent.
     */
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const;

    // ========================================================================
    // IDownloadEventSink
    // ========================================================================

    [[nodiscard]] StartDecision OnDownloadStarting(const DownloadStartingEvent& event) override;

    void OnDownloadStateChanged(const std::string& downloadId, TransferState state) override;

    // ========================================================================
    // DECISIONS
    // ========================================================================

    /**
     * @brief Move a quarantined download to user storage.
     *
     * Only valid from Quarantined. The file is hashed again first; a digest
     * differing from the recorded one fails with IntegrityMismatch. A failed
     * move leaves the record Failed and the quarantined file in place.
     */
    [[nodiscard]] bool Promote(const std::string& downloadId,
                               const std::filesystem::path& destination,
                               DownloadRecord& out,
                               DownloadError* err = nullptr);

    /**
     * @brief Wipe a quarantined download.
     * @return false for unknown ids, records not in quarantine, or wipe failure
     */
    bool Delete(const std::string& downloadId);

    // ========================================================================
    // QUERIES
    // ========================================================================

    /// @brief Records in Pending, InProgress or Quarantined
    [[nodiscard]] std::vector<DownloadRecord> GetActiveDownloads() const;

    [[nodiscard]] std::optional<DownloadRecord> GetDownload(const std::string& downloadId) const;

    [[nodiscard]] DownloadMetrics GetMetrics() const;

    [[nodiscard]] std::filesystem::path GetQuarantineDirectory() const;

    [[nodiscard]] const QuarantineGateConfiguration& GetConfiguration() const noexcept;

    // ========================================================================
    // CALLBACKS
    // ========================================================================

    /// @return id for UnregisterCallback
    uint64_t RegisterCompletedCallback(DownloadCallback callback);
    uint64_t RegisterPromotedCallback(DownloadCallback callback);
    uint64_t RegisterDeletedCallback(DownloadCallback callback);

    bool UnregisterCallback(uint64_t callbackId);

private:
    std::unique_ptr<DownloadQuarantineGateImpl> m_impl;
};

}  // namespace WebProtection
}  // namespace ShadowVeil
