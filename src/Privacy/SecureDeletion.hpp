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
 * ShadowVeil - SECURE DELETION WORKER
 * ============================================================================
 *
 * @file SecureDeletion.hpp
 * @brief Best-effort overwrite-then-remove of session storage trees and
 *        quarantined files.
 *
 * WIPE PROCEDURE:
 * ===============
 * 1. A missing path is an immediate success.
 * 2. Every regular file at or below the overwrite ceiling is overwritten
 *    with random bytes and flushed. Symlinks are never followed.
 * 3. The tree is removed.
 * 4. EACCES/EPERM clears restrictive permission bits on what remains, then
 *    retries. Other I/O errors retry as-is. The delay before attempt N+1
 *    is retryBaseDelay * (N+1).
 *
 * @note A single worker may be shared by the session manager and any number
 *       of quarantine gates; all methods are thread-safe.
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <cstdint>
#include <string>
#include <string_view>
#include <atomic>
#include <chrono>
#include <filesystem>

// ============================================================================
// SHADOWVEIL INFRASTRUCTURE INCLUDES
// ============================================================================

#include "../Utils/Logger.hpp"
#include "../Utils/CryptoUtils.hpp"

namespace ShadowVeil {
namespace Privacy {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace SecureDeletionConstants {

    /// @brief Files at or below this size are overwritten before removal (1 MiB)
    inline constexpr uint64_t DEFAULT_OVERWRITE_CEILING_BYTES = 1ULL * 1024 * 1024;

    /// @brief Removal attempts before giving up
    inline constexpr uint32_t DEFAULT_MAX_ATTEMPTS = 3;

    /// @brief Base backoff delay (milliseconds)
    inline constexpr uint32_t DEFAULT_RETRY_BASE_DELAY_MS = 100;

    /// @brief Upper bound accepted for maxAttempts
    inline constexpr uint32_t MAX_ATTEMPTS_LIMIT = 16;

    /// @brief Upper bound accepted for the overwrite ceiling (256 MiB)
    inline constexpr uint64_t MAX_OVERWRITE_CEILING_BYTES = 256ULL * 1024 * 1024;

}  // namespace SecureDeletionConstants

// ============================================================================
// ENUMERATIONS
// ============================================================================

/**
 * @brief Classification of the last wipe failure
 */
enum class WipeErrorCode : uint8_t {
    None            = 0,    ///< Success
    AccessDenied    = 1,    ///< EACCES / EPERM persisted through all retries
    IoError         = 2,    ///< Any other filesystem error
    InvalidPath     = 3     ///< Empty path or filesystem root
};

[[nodiscard]] std::string_view GetWipeErrorCodeName(WipeErrorCode code) noexcept;

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Secure deletion configuration
 */
struct SecureDeletionConfiguration {
    /// @brief Files larger than this are removed without overwrite
    uint64_t overwriteCeilingBytes = SecureDeletionConstants::DEFAULT_OVERWRITE_CEILING_BYTES;

    /// @brief Removal attempts (>= 1)
    uint32_t maxAttempts = SecureDeletionConstants::DEFAULT_MAX_ATTEMPTS;

    /// @brief Backoff unit between attempts
    std::chrono::milliseconds retryBaseDelay{SecureDeletionConstants::DEFAULT_RETRY_BASE_DELAY_MS};

    [[nodiscard]] bool IsValid() const noexcept;
};

/**
 * @brief Outcome of a wipe
 */
struct WipeResult {
    bool success = false;
    WipeErrorCode errorCode = WipeErrorCode::None;
    int sysError = 0;               ///< errno of the last failure
    std::string message;
    uint32_t attempts = 0;          ///< Removal attempts made

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Secure deletion counters
 */
struct SecureDeletionStatistics {
    std::atomic<uint64_t> filesOverwritten{0};
    std::atomic<uint64_t> bytesOverwritten{0};
    std::atomic<uint64_t> overwriteFailures{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> wipesSucceeded{0};
    std::atomic<uint64_t> wipesFailed{0};

    void Reset() noexcept;

    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// SECURE DELETION WORKER
// ============================================================================

/**
 * @class SecureDeletionWorker
 * @brief Overwrite-then-remove with bounded retry.
 *
 * USAGE:
 * @code
 *     SecureDeletionWorker wiper;
 *     if (auto r = wiper.WipeDirectory(sessionDir); !r) {
 *         SV_LOG_WARN("Sessions", "wipe failed: %s", r.message.c_str());
 *     }
 * @endcode
 */
class SecureDeletionWorker final {
public:
    explicit SecureDeletionWorker(SecureDeletionConfiguration config = {});
    ~SecureDeletionWorker() = default;

    SecureDeletionWorker(const SecureDeletionWorker&) = delete;
    SecureDeletionWorker& operator=(const SecureDeletionWorker&) = delete;

    /**
     * @brief Wipe a directory tree (or a lone file found at the path).
     */
    [[nodiscard]] WipeResult WipeDirectory(const std::filesystem::path& path);

    /**
     * @brief Wipe a single file. Directories are rejected with InvalidPath.
     */
    [[nodiscard]] WipeResult WipeFile(const std::filesystem::path& path);

    [[nodiscard]] const SecureDeletionConfiguration& GetConfiguration() const noexcept { return m_config; }

    [[nodiscard]] const SecureDeletionStatistics& GetStatistics() const noexcept { return m_stats; }

    void ResetStatistics() noexcept { m_stats.Reset(); }

private:
    WipeResult WipeWithRetry(const std::filesystem::path& path);

    /// @brief Overwrite every eligible file below root. Returns files overwritten.
    size_t OverwriteTree(const std::filesystem::path& root);

    bool OverwriteFile(const std::filesystem::path& file, uint64_t size);

    void Backoff(uint32_t attempt) const;

    SecureDeletionConfiguration m_config;
    SecureDeletionStatistics m_stats;
    Utils::CryptoUtils::SecureRandom m_rng;
};

}  // namespace Privacy
}  // namespace ShadowVeil
