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
 * ShadowVeil - DOWNLOAD TYPES IMPLEMENTATION
 * ============================================================================
 *
 * @file DownloadTypes.cpp
 * ============================================================================
 */

#include "pch.h"
#include "DownloadTypes.hpp"

#include <nlohmann/json.hpp>

namespace ShadowVeil {
namespace WebProtection {

using json = nlohmann::json;

std::string_view GetDownloadStatusName(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::Pending:     return "Pending";
        case DownloadStatus::InProgress:  return "InProgress";
        case DownloadStatus::Quarantined: return "Quarantined";
        case DownloadStatus::Promoted:    return "Promoted";
        case DownloadStatus::Deleted:     return "Deleted";
        case DownloadStatus::Failed:      return "Failed";
        default:                          return "Unknown";
    }
}

std::string_view GetTransferStateName(TransferState state) noexcept {
    switch (state) {
        case TransferState::InProgress:  return "InProgress";
        case TransferState::Completed:   return "Completed";
        case TransferState::Interrupted: return "Interrupted";
        default:                         return "Unknown";
    }
}

std::string_view GetDownloadErrorCodeName(DownloadErrorCode code) noexcept {
    switch (code) {
        case DownloadErrorCode::None:           return "None";
        case DownloadErrorCode::NotFound:       return "NotFound";
        case DownloadErrorCode::InvalidState:   return "InvalidState";
        case DownloadErrorCode::NotInitialized: return "NotInitialized";
        case DownloadErrorCode::IoError:        return "IoError";
        case DownloadErrorCode::IntegrityMismatch: return "IntegrityMismatch";
        default:                                return "Unknown";
    }
}

bool IsValidTransition(DownloadStatus from, DownloadStatus to) noexcept {
    switch (from) {
        case DownloadStatus::Pending:
            return to == DownloadStatus::InProgress ||
                   to == DownloadStatus::Failed;
        case DownloadStatus::InProgress:
            return to == DownloadStatus::Quarantined ||
                   to == DownloadStatus::Failed;
        case DownloadStatus::Quarantined:
            return to == DownloadStatus::Promoted ||
                   to == DownloadStatus::Deleted ||
                   to == DownloadStatus::Failed;
        default:
            return false;
    }
}

bool IsTerminal(DownloadStatus status) noexcept {
    return status == DownloadStatus::Promoted ||
           status == DownloadStatus::Deleted ||
           status == DownloadStatus::Failed;
}

std::string DownloadRecord::ToJson() const {
    json j;
    j["id"] = id;
    j["fileName"] = fileName;
    j["sourceUrl"] = sourceUrl;
    j["quarantinePath"] = quarantinePath.string();
    j["finalPath"] = finalPath.string();
    j["contentType"] = contentType;
    j["size"] = size;
    j["sha256"] = sha256;
    j["startTimeMs"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        startTime.time_since_epoch()).count();
    j["status"] = std::string(GetDownloadStatusName(status));
    return j.dump();
}

std::string DownloadMetrics::ToJson() const {
    json j;
    j["totalDownloads"] = totalDownloads;
    j["quarantined"] = quarantined;
    j["promoted"] = promoted;
    j["deleted"] = deleted;
    j["blocked"] = blocked;
    j["failed"] = failed;
    j["totalBytes"] = totalBytes;
    j["averageTransferMs"] = averageTransferMs;
    return j.dump();
}

}  // namespace WebProtection
}  // namespace ShadowVeil
