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
 * ShadowVeil - SANITIZATION RULE SET
 * ============================================================================
 *
 * @file SanitizationRuleSet.hpp
 * @brief Immutable table of tracking query parameters.
 *
 * A rule set holds:
 * - exact parameter names (case-insensitive)
 * - compiled case-insensitive ECMAScript patterns (regex_search semantics)
 * - per-host exemptions (lowercased host -> case-insensitive names)
 *
 * Rule sets are built once and shared as shared_ptr<const SanitizationRuleSet>.
 * Reloading rules builds a new instance and swaps the pointer.
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <array>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ShadowVeil {
namespace WebProtection {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace SanitizationConstants {

    /// @brief URLs longer than this are treated as unparsable
    inline constexpr size_t MAX_URL_LENGTH = 8192;

    /// @brief Tracking parameters stripped by default
    inline constexpr std::array<std::string_view, 21> DEFAULT_TRACKING_PARAMS = {
        "utm_source", "utm_medium", "utm_campaign", "utm_term", "utm_content",
        "fbclid", "gclid", "mc_eid", "igshid", "_ga", "msclkid", "twclid",
        "li_fat_id", "s_cid", "vero_conv", "vero_id", "wickedid", "yclid",
        "_openstat", "pk_campaign", "pk_kwd"
    };

    /// @brief Tracking parameter patterns applied by default
    inline constexpr std::array<std::string_view, 9> DEFAULT_TRACKING_PATTERNS = {
        "^utm_.*",
        "^_ga.*",
        "^fb.*",
        "^gc.*",
        ".*clid$",
        "^pk_.*",
        "^_.*tracking.*",
        ".*_campaign.*",
        ".*_source.*"
    };

}  // namespace SanitizationConstants

// ============================================================================
// SANITIZATION RULE SET
// ============================================================================

class SanitizationRuleSet final {
public:
    using DomainAllowList = std::map<std::string, std::vector<std::string>>;

    /**
     * @brief Rule set with the default parameters and patterns and no exemptions.
     */
    [[nodiscard]] static std::shared_ptr<const SanitizationRuleSet> CreateDefault();

    /**
     * @brief Compile a rule set.
     *
     * Domain keys are lowercased. Empty names and patterns are ignored.
     *
     * @param error Receives the offending pattern when compilation fails
     * @return nullptr when a pattern does not compile
     */
    [[nodiscard]] static std::shared_ptr<const SanitizationRuleSet> Build(
        std::vector<std::string> trackingParams,
        std::vector<std::string> trackingPatterns,
        const DomainAllowList& domainAllowedParams,
        std::string* error = nullptr);

    /// @brief Exact (case-insensitive) or pattern match
    [[nodiscard]] bool IsTrackingParam(std::string_view name) const;

    /// @brief name is exempted for exactly this (lowercased) host
    [[nodiscard]] bool IsExempt(std::string_view lowerHost, std::string_view name) const;

    /// @brief Tracking and not exempt; exemptions win
    [[nodiscard]] bool ShouldStrip(std::string_view lowerHost, std::string_view name) const;

    [[nodiscard]] const std::vector<std::string>& GetTrackingParams() const noexcept { return m_trackingParams; }

    [[nodiscard]] const std::vector<std::string>& GetTrackingPatterns() const noexcept { return m_patternSources; }

    [[nodiscard]] const DomainAllowList& GetDomainAllowedParams() const noexcept { return m_domainAllowed; }

    [[nodiscard]] std::string ToJson() const;

private:
    SanitizationRuleSet() = default;

    std::vector<std::string> m_trackingParams;
    std::unordered_set<std::string> m_exactLower;

    std::vector<std::string> m_patternSources;
    std::vector<std::regex> m_patterns;

    DomainAllowList m_domainAllowed;
    std::unordered_map<std::string, std::unordered_set<std::string>> m_exemptLower;
};

}  // namespace WebProtection
}  // namespace ShadowVeil
