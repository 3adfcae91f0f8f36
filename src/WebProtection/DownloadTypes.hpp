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
 * ShadowVeil - DOWNLOAD TYPES
 * ============================================================================
 *
 * @file DownloadTypes.hpp
 * @brief Download records, status FSM and the download event interfaces
 *        shared between the quarantine gate and the rendering engine.
 *
 * STATUS FSM:
 * ===========
 *   Pending -> InProgress -> Quarantined -> Promoted
 *   Pending -> Quarantined
 *   Pending | InProgress -> Failed
 *   Quarantined -> Deleted
 *   Quarantined -> Failed        (promotion failure)
 * ============================================================================
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace ShadowVeil {
namespace WebProtection {

// ============================================================================
// ENUMERATIONS
// ============================================================================

enum class DownloadStatus : uint8_t {
    Pending     = 0,    ///< Accepted, no bytes yet
    InProgress  = 1,    ///< Transfer running
    Quarantined = 2,    ///< Complete, hashed, awaiting a decision
    Promoted    = 3,    ///< Moved to user storage (terminal)
    Deleted     = 4,    ///< Wiped from quarantine (terminal)
    Failed      = 5     ///< Interrupted, unhashable, or promotion failed (terminal)
};

/**
 * @brief Transfer states reported by the rendering engine
 */
enum class TransferState : uint8_t {
    InProgress  = 0,
    Completed   = 1,
    Interrupted = 2
};

enum class DownloadErrorCode : uint8_t {
    None            = 0,
    NotFound        = 1,    ///< Unknown download id
    InvalidState    = 2,    ///< Status does not allow the operation
    NotInitialized  = 3,    ///< Gate not initialized or shut down
    IoError         = 4,    ///< File system failure
    IntegrityMismatch = 5   ///< Quarantined file changed after completion
};

[[nodiscard]] std::string_view GetDownloadStatusName(DownloadStatus status) noexcept;
[[nodiscard]] std::string_view GetTransferStateName(TransferState state) noexcept;
[[nodiscard]] std::string_view GetDownloadErrorCodeName(DownloadErrorCode code) noexcept;

/**
 * @brief true when the FSM allows from -> to
 */
[[nodiscard]] bool IsValidTransition(DownloadStatus from, DownloadStatus to) noexcept;

[[nodiscard]] bool IsTerminal(DownloadStatus status) noexcept;

// ============================================================================
// STRUCTURES
// ============================================================================

struct DownloadRecord {
    std::string id;                             ///< 32 lowercase hex characters
    std::string fileName;                       ///< Sanitized
    std::string sourceUrl;
    std::filesystem::path quarantinePath;       ///< <quarantine>/<id>_<fileName>
    std::filesystem::path finalPath;            ///< Set after promotion
    std::string contentType;
    int64_t size = -1;                          ///< -1 until completion
    std::string sha256;                         ///< Lowercase hex, empty until completion
    std::chrono::system_clock::time_point startTime{};
    DownloadStatus status = DownloadStatus::Pending;

    [[nodiscard]] std::string ToJson() const;
};

struct DownloadError {
    DownloadErrorCode code = DownloadErrorCode::None;
    std::string message;

    [[nodiscard]] bool hasError() const noexcept { return code != DownloadErrorCode::None; }

    void clear() noexcept {
        code = DownloadErrorCode::None;
        message.clear();
    }
};

/**
 * @brief Snapshot of gate counters
 */
struct DownloadMetrics {
    uint64_t totalDownloads = 0;        ///< Accepted at start
    uint64_t quarantined = 0;
    uint64_t promoted = 0;
    uint64_t deleted = 0;
    uint64_t blocked = 0;               ///< Rejected at start
    uint64_t failed = 0;
    uint64_t totalBytes = 0;            ///< Bytes that reached quarantine
    double averageTransferMs = 0.0;     ///< Start -> quarantined

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Download about to start, as reported by the rendering engine
 */
struct DownloadStartingEvent {
    std::string uri;
    std::string mimeType;
    int64_t totalBytesToReceive = -1;
    std::string suggestedFileName;      ///< Optional, preferred over the URI segment
};

/**
 * @brief Gate's answer to a starting download
 */
struct StartDecision {
    bool cancel = true;
    std::string downloadId;
    std::filesystem::path resultFilePath;   ///< Where the engine must write the bytes

    [[nodiscard]] static StartDecision Cancel() { return StartDecision{}; }

    [[nodiscard]] static StartDecision Accept(std::string id, std::filesystem::path path) {
        return StartDecision{false, std::move(id), std::move(path)};
    }
};

// ============================================================================
// EVENT INTERFACES
// ============================================================================

/**
 * @brief Receiver of download events.
 */
class IDownloadEventSink {
public:
    virtual ~IDownloadEventSink() = default;

    /// @brief Decide before any bytes are written
    [[nodiscard]] virtual StartDecision OnDownloadStarting(const DownloadStartingEvent& event) = 0;

    virtual void OnDownloadStateChanged(const std::string& downloadId, TransferState state) = 0;
};

/**
 * @brief Download event producer (implemented by the rendering engine).
 */
class IDownloadEventSource {
public:
    virtual ~IDownloadEventSource() = default;

    virtual void Subscribe(IDownloadEventSink* sink) = 0;

    /// @brief After return, no further calls reach the sink
    virtual void Unsubscribe(IDownloadEventSink* sink) = 0;
};

}  // namespace WebProtection
}  // namespace ShadowVeil
