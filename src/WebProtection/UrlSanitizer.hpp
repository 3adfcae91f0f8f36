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
 * ShadowVeil - URL SANITIZATION ENGINE
 * ============================================================================
 *
 * @file UrlSanitizer.hpp
 * @brief Strips tracking parameters from navigated URLs.
 *
 * BEHAVIOR:
 * =========
 * - Query parameters (split on '&', empty segments dropped) are removed when
 *   their name is an exact tracking name or matches a tracking pattern,
 *   unless the URL's host exempts them.
 * - Scheme, authority, path and fragment are kept byte-for-byte. Surviving
 *   segments keep their order and original text. When nothing survives the
 *   '?' is dropped. When nothing is removed the input is returned unchanged.
 * - Unparsable input is returned unchanged. Sanitize() never throws.
 * - Per-domain metrics (requests, modified requests, running average
 *   latency) are kept for the process lifetime.
 *
 * RULE DOCUMENT:
 * ==============
 * @code
 * {
 *   "trackingParams":      ["utm_source", "fbclid"],
 *   "trackingPatterns":    ["^utm_.*"],
 *   "domainAllowedParams": { "example.com": ["utm_source"] }
 * }
 * @endcode
 * Absent keys keep their current values. PascalCase keys are accepted.
 * A malformed document leaves the active rules untouched.
 *
 * @note Thread-safe. Sanitize() reads an immutable rule snapshot.
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// SHADOWVEIL INFRASTRUCTURE INCLUDES
// ============================================================================

#include "../Utils/Logger.hpp"
#include "SanitizationRuleSet.hpp"

// ============================================================================
// FORWARD DECLARATIONS
// ============================================================================

namespace ShadowVeil::WebProtection {
    class UrlSanitizerImpl;
}

namespace ShadowVeil {
namespace WebProtection {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace UrlSanitizerConstants {

    /// @brief Per-domain metric records kept before new domains stop being tracked
    inline constexpr size_t MAX_TRACKED_DOMAINS = 16384;

}  // namespace UrlSanitizerConstants

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Outcome of one Sanitize() call
 */
struct SanitizationResult {
    std::string originalUrl;
    std::string sanitizedUrl;
    std::vector<std::string> removedParams;     ///< Names as they appeared in the URL
    std::chrono::microseconds elapsed{0};

    [[nodiscard]] bool WasModified() const noexcept { return !removedParams.empty(); }

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Per-domain sanitization metrics
 */
struct DomainMetrics {
    std::string domain;
    uint64_t totalRequests = 0;
    uint64_t modifiedRequests = 0;
    double averageLatencyMs = 0.0;
    std::chrono::system_clock::time_point lastUpdated{};

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Synchronous answer to a navigation request
 */
struct NavigationDecision {
    enum class Action : uint8_t {
        Continue    = 0,    ///< Navigate to the requested URL
        Redirect    = 1     ///< Cancel and navigate to redirectUri instead
    };

    Action action = Action::Continue;
    std::string redirectUri;

    [[nodiscard]] bool IsRedirect() const noexcept { return action == Action::Redirect; }
};

/**
 * @brief Sanitizer configuration
 */
struct UrlSanitizerConfiguration {
    /// @brief When false, Sanitize() returns every URL unchanged
    bool enabled = true;

    /// @brief Optional rule document loaded by Initialize()
    std::filesystem::path rulesFile;

    [[nodiscard]] bool IsValid() const noexcept;
};

/**
 * @brief Aggregate counters across all domains
 */
struct UrlSanitizerStatistics {
    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> modifiedRequests{0};
    std::atomic<uint64_t> unparsableUrls{0};
    std::atomic<uint64_t> parametersRemoved{0};
    std::atomic<uint64_t> rulesReloaded{0};
    std::atomic<uint64_t> rulesRejected{0};
    std::atomic<uint64_t> totalProcessingTimeUs{0};

    void Reset() noexcept;

    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// URL SANITIZER
// ============================================================================

class UrlSanitizer final {
public:
    explicit UrlSanitizer(UrlSanitizerConfiguration config = {});
    ~UrlSanitizer();

    UrlSanitizer(const UrlSanitizer&) = delete;
    UrlSanitizer& operator=(const UrlSanitizer&) = delete;

    /**
     * @brief Load the configured rules file, if any.
     * @return false when a configured file could not be loaded (defaults stay active)
     */
    [[nodiscard]] bool Initialize();

    /**
     * @brief Remove tracking parameters from a URL.
     */
    [[nodiscard]] SanitizationResult Sanitize(std::string_view url);

    /**
     * @brief Navigation hook. Redirect only when sanitizing changed the URL.
     */
    [[nodiscard]] NavigationDecision OnNavigationStarting(std::string_view uri);

    /**
     * @brief Replace rules from a JSON document.
     * @return false when the document was rejected (active rules unchanged)
     */
    bool LoadRules(std::string_view jsonText);

    bool LoadRulesFromFile(const std::filesystem::path& path);

    /**
     * @brief Metrics for a host (case-insensitive). Zero-valued when never seen.
     */
    [[nodiscard]] DomainMetrics GetDomainMetrics(std::string_view domain) const;

    [[nodiscard]] std::vector<DomainMetrics> GetAllDomainMetrics() const;

    [[nodiscard]] std::shared_ptr<const SanitizationRuleSet> GetRuleSet() const;

    [[nodiscard]] const UrlSanitizerConfiguration& GetConfiguration() const noexcept;

    [[nodiscard]] const UrlSanitizerStatistics& GetStatistics() const noexcept;

    void ResetStatistics() noexcept;

private:
    std::unique_ptr<UrlSanitizerImpl> m_impl;
};

}  // namespace WebProtection
}  // namespace ShadowVeil
