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
 * ShadowVeil - SECURE DELETION WORKER IMPLEMENTATION
 * ============================================================================
 *
 * @file SecureDeletion.cpp
 * ============================================================================
 */

#include "pch.h"
#include "SecureDeletion.hpp"
#include "../Utils/FileUtils.hpp"

#include <cerrno>
#include <system_error>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace ShadowVeil {
namespace Privacy {

using namespace Utils;
using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define SD_LOG_DEBUG(fmt, ...)   SV_LOG_DEBUG("SecureDeletion", fmt, ##__VA_ARGS__)
#define SD_LOG_INFO(fmt, ...)    SV_LOG_INFO("SecureDeletion", fmt, ##__VA_ARGS__)
#define SD_LOG_WARN(fmt, ...)    SV_LOG_WARN("SecureDeletion", fmt, ##__VA_ARGS__)
#define SD_LOG_ERROR(fmt, ...)   SV_LOG_ERROR("SecureDeletion", fmt, ##__VA_ARGS__)

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

std::string_view GetWipeErrorCodeName(WipeErrorCode code) noexcept {
    switch (code) {
        case WipeErrorCode::None:         return "None";
        case WipeErrorCode::AccessDenied: return "AccessDenied";
        case WipeErrorCode::IoError:      return "IoError";
        case WipeErrorCode::InvalidPath:  return "InvalidPath";
        default:                          return "Unknown";
    }
}

namespace {

bool IsAccessError(const std::error_code& ec) noexcept {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

}  // namespace

// ============================================================================
// STRUCTURE METHODS
// ============================================================================

bool SecureDeletionConfiguration::IsValid() const noexcept {
    return maxAttempts >= 1 &&
           maxAttempts <= SecureDeletionConstants::MAX_ATTEMPTS_LIMIT &&
           overwriteCeilingBytes <= SecureDeletionConstants::MAX_OVERWRITE_CEILING_BYTES &&
           retryBaseDelay.count() >= 0;
}

std::string WipeResult::ToJson() const {
    json j;
    j["success"] = success;
    j["errorCode"] = std::string(GetWipeErrorCodeName(errorCode));
    j["sysError"] = sysError;
    j["message"] = message;
    j["attempts"] = attempts;
    return j.dump();
}

void SecureDeletionStatistics::Reset() noexcept {
    filesOverwritten = 0;
    bytesOverwritten = 0;
    overwriteFailures = 0;
    retries = 0;
    wipesSucceeded = 0;
    wipesFailed = 0;
}

std::string SecureDeletionStatistics::ToJson() const {
    json j;
    j["filesOverwritten"] = filesOverwritten.load();
    j["bytesOverwritten"] = bytesOverwritten.load();
    j["overwriteFailures"] = overwriteFailures.load();
    j["retries"] = retries.load();
    j["wipesSucceeded"] = wipesSucceeded.load();
    j["wipesFailed"] = wipesFailed.load();
    return j.dump();
}

// ============================================================================
// SECURE DELETION WORKER
// ============================================================================

SecureDeletionWorker::SecureDeletionWorker(SecureDeletionConfiguration config)
    : m_config(std::move(config)) {
    if (!m_config.IsValid()) {
        SD_LOG_WARN("Invalid configuration, falling back to defaults");
        m_config = SecureDeletionConfiguration{};
    }
}

WipeResult SecureDeletionWorker::WipeDirectory(const fs::path& path) {
    return WipeWithRetry(path);
}

WipeResult SecureDeletionWorker::WipeFile(const fs::path& path) {
    FileUtils::FileStat st;
    FileUtils::Error ferr;
    if (FileUtils::Stat(path, st, &ferr) && st.isDirectory) {
        WipeResult result;
        result.errorCode = WipeErrorCode::InvalidPath;
        result.sysError = EISDIR;
        result.message = "expected a file: " + path.string();
        m_stats.wipesFailed++;
        return result;
    }
    return WipeWithRetry(path);
}

WipeResult SecureDeletionWorker::WipeWithRetry(const fs::path& path) {
    WipeResult result;

    if (path.empty() || path == path.root_path()) {
        result.errorCode = WipeErrorCode::InvalidPath;
        result.sysError = EINVAL;
        result.message = "refusing to wipe '" + path.string() + "'";
        m_stats.wipesFailed++;
        SD_LOG_ERROR("%s", result.message.c_str());
        return result;
    }

    for (uint32_t attempt = 0; attempt < m_config.maxAttempts; ++attempt) {
        result.attempts = attempt + 1;

        FileUtils::FileStat st;
        FileUtils::Error ferr;
        if (!FileUtils::Stat(path, st, &ferr)) {
            result.errorCode = IsAccessError(std::error_code(ferr.code, std::generic_category()))
                ? WipeErrorCode::AccessDenied : WipeErrorCode::IoError;
            result.sysError = ferr.code;
            result.message = ferr.message;
        }
        else if (!st.exists) {
            result = WipeResult{true, WipeErrorCode::None, 0, {}, attempt + 1};
            m_stats.wipesSucceeded++;
            return result;
        }
        else {
            if (st.isDirectory) {
                OverwriteTree(path);
            }
            else if (st.isRegularFile && st.size <= m_config.overwriteCeilingBytes) {
                OverwriteFile(path, st.size);
            }

            std::error_code ec;
            fs::remove_all(path, ec);
            if (!ec || ec == std::errc::no_such_file_or_directory) {
                result = WipeResult{true, WipeErrorCode::None, 0, {}, attempt + 1};
                m_stats.wipesSucceeded++;
                SD_LOG_DEBUG("Wiped %s after %u attempt(s)", path.c_str(), attempt + 1);
                return result;
            }

            result.sysError = ec.value();
            result.message = "remove_all " + path.string() + ": " + ec.message();
            if (IsAccessError(ec)) {
                result.errorCode = WipeErrorCode::AccessDenied;
                const size_t cleared = FileUtils::ClearRestrictivePermissions(path);
                SD_LOG_DEBUG("Access denied on %s, relaxed %zu entries", path.c_str(), cleared);
            }
            else {
                result.errorCode = WipeErrorCode::IoError;
            }
        }

        if (attempt + 1 < m_config.maxAttempts) {
            m_stats.retries++;
            SD_LOG_DEBUG("Retrying wipe of %s (%s)", path.c_str(), result.message.c_str());
            Backoff(attempt);
        }
    }

    m_stats.wipesFailed++;
    SD_LOG_ERROR("Wipe of %s failed after %u attempt(s): %s",
                 path.c_str(), result.attempts, result.message.c_str());
    return result;
}

size_t SecureDeletionWorker::OverwriteTree(const fs::path& root) {
    size_t count = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        SD_LOG_DEBUG("Cannot enumerate %s: %s", root.c_str(), ec.message().c_str());
        return 0;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code sec;
        const auto status = it->symlink_status(sec);
        if (!sec && fs::is_regular_file(status)) {
            const uint64_t size = it->file_size(sec);
            if (!sec && size <= m_config.overwriteCeilingBytes) {
                if (OverwriteFile(it->path(), size)) {
                    ++count;
                }
            }
        }

        it.increment(ec);
        if (ec) {
            SD_LOG_DEBUG("Enumeration of %s stopped: %s", root.c_str(), ec.message().c_str());
            break;
        }
    }
    return count;
}

bool SecureDeletionWorker::OverwriteFile(const fs::path& file, uint64_t size) {
    if (size == 0) {
        return true;
    }

    std::vector<uint8_t> noise;
    CryptoUtils::Error cerr;
    if (!m_rng.Generate(noise, static_cast<size_t>(size), &cerr)) {
        m_stats.overwriteFailures++;
        SD_LOG_WARN("No random data for %s: %s", file.c_str(), cerr.message.c_str());
        return false;
    }

    FileUtils::Error ferr;
    const bool ok = FileUtils::OverwriteInPlace(file, noise.data(), noise.size(), &ferr);
    CryptoUtils::SecureZeroMemory(noise.data(), noise.size());

    if (!ok) {
        m_stats.overwriteFailures++;
        SD_LOG_DEBUG("Overwrite skipped: %s", ferr.message.c_str());
        return false;
    }

    m_stats.filesOverwritten++;
    m_stats.bytesOverwritten += size;
    return true;
}

void SecureDeletionWorker::Backoff(uint32_t attempt) const {
    const auto delay = m_config.retryBaseDelay * static_cast<int64_t>(attempt + 1);
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

}  // namespace Privacy
}  // namespace ShadowVeil
