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
 * ShadowVeil - URL SANITIZATION ENGINE IMPLEMENTATION
 * ============================================================================
 *
 * @file UrlSanitizer.cpp
 * ============================================================================
 */

#include "pch.h"
#include "UrlSanitizer.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace ShadowVeil {
namespace WebProtection {

using namespace Utils;
using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define US_LOG_DEBUG(fmt, ...)   SV_LOG_DEBUG("UrlSanitizer", fmt, ##__VA_ARGS__)
#define US_LOG_INFO(fmt, ...)    SV_LOG_INFO("UrlSanitizer", fmt, ##__VA_ARGS__)
#define US_LOG_WARN(fmt, ...)    SV_LOG_WARN("UrlSanitizer", fmt, ##__VA_ARGS__)
#define US_LOG_ERROR(fmt, ...)   SV_LOG_ERROR("UrlSanitizer", fmt, ##__VA_ARGS__)

namespace {

/**
 * @brief Views into a URL of the form scheme://authority[path][?query][#fragment]
 */
struct UrlParts {
    std::string_view head;          ///< Everything before '?' (or '#')
    std::string_view query;         ///< Without the leading '?'
    std::string_view fragment;      ///< Including the leading '#'
    bool hasQuery = false;
    std::string host;               ///< Lowercased, port and userinfo removed
};

bool IsSchemeChar(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

bool IsAlpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool ParseUrl(std::string_view url, UrlParts& out) {
    if (url.empty() || url.size() > SanitizationConstants::MAX_URL_LENGTH) {
        return false;
    }
    if (!IsAlpha(url[0])) {
        return false;
    }

    size_t pos = 1;
    while (pos < url.size() && IsSchemeChar(url[pos])) {
        ++pos;
    }
    if (url.substr(pos, 3) != "://") {
        return false;
    }

    const size_t authorityBegin = pos + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityBegin);
    if (authorityEnd == std::string_view::npos) {
        authorityEnd = url.size();
    }

    std::string_view authority = url.substr(authorityBegin, authorityEnd - authorityBegin);
    for (char c : authority) {
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7F) {
            return false;
        }
    }

    if (const size_t at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    if (!authority.empty() && authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host = authority.substr(0, close + 1);
    }
    else {
        host = authority.substr(0, authority.find(':'));
    }
    if (host.empty() || host == "[]") {
        return false;
    }
    out.host = StringUtils::ToLowerAscii(host);

    const size_t hashPos = url.find('#', authorityEnd);
    const size_t queryPos = url.find('?', authorityEnd);
    const size_t tailEnd = (hashPos == std::string_view::npos) ? url.size() : hashPos;

    out.fragment = (hashPos == std::string_view::npos) ? std::string_view{} : url.substr(hashPos);

    if (queryPos != std::string_view::npos && queryPos < tailEnd) {
        out.hasQuery = true;
        out.head = url.substr(0, queryPos);
        out.query = url.substr(queryPos + 1, tailEnd - queryPos - 1);
    }
    else {
        out.hasQuery = false;
        out.head = url.substr(0, tailEnd);
        out.query = {};
    }
    return true;
}

std::string_view ParamName(std::string_view segment) noexcept {
    const size_t eq = segment.find('=');
    return (eq != std::string_view::npos && eq > 0) ? segment.substr(0, eq) : segment;
}

int64_t ToUnixMillis(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/**
 * @brief Read an optional string array under either of two keys.
 * @return false when the key is present with the wrong type
 */
bool ReadStringArray(const json& root, const char* camel, const char* pascal,
                     std::optional<std::vector<std::string>>& out, std::string& error) {
    const char* key = root.contains(camel) ? camel : (root.contains(pascal) ? pascal : nullptr);
    if (!key) {
        return true;
    }
    std::vector<std::string> values;
    if (!JSON::Get(root, key, values)) {
        error = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    out = std::move(values);
    return true;
}

}  // namespace

// ============================================================================
// STRUCTURE METHODS
// ============================================================================

std::string SanitizationResult::ToJson() const {
    json j;
    j["originalUrl"] = originalUrl;
    j["sanitizedUrl"] = sanitizedUrl;
    j["removedParams"] = removedParams;
    j["elapsedUs"] = elapsed.count();
    return j.dump();
}

std::string DomainMetrics::ToJson() const {
    json j;
    j["domain"] = domain;
    j["totalRequests"] = totalRequests;
    j["modifiedRequests"] = modifiedRequests;
    j["averageLatencyMs"] = averageLatencyMs;
    j["lastUpdatedMs"] = ToUnixMillis(lastUpdated);
    return j.dump();
}

bool UrlSanitizerConfiguration::IsValid() const noexcept {
    return true;
}

void UrlSanitizerStatistics::Reset() noexcept {
    totalRequests = 0;
    modifiedRequests = 0;
    unparsableUrls = 0;
    parametersRemoved = 0;
    rulesReloaded = 0;
    rulesRejected = 0;
    totalProcessingTimeUs = 0;
}

std::string UrlSanitizerStatistics::ToJson() const {
    json j;
    j["totalRequests"] = totalRequests.load();
    j["modifiedRequests"] = modifiedRequests.load();
    j["unparsableUrls"] = unparsableUrls.load();
    j["parametersRemoved"] = parametersRemoved.load();
    j["rulesReloaded"] = rulesReloaded.load();
    j["rulesRejected"] = rulesRejected.load();
    j["totalProcessingTimeUs"] = totalProcessingTimeUs.load();
    return j.dump();
}

// ============================================================================
// IMPLEMENTATION CLASS
// ============================================================================

class UrlSanitizerImpl {
public:
    explicit UrlSanitizerImpl(UrlSanitizerConfiguration config)
        : m_config(std::move(config))
        , m_rules(SanitizationRuleSet::CreateDefault()) {
    }

    std::shared_ptr<const SanitizationRuleSet> Rules() const {
        std::lock_guard lock(m_rulesMutex);
        return m_rules;
    }

    void SwapRules(std::shared_ptr<const SanitizationRuleSet> rules) {
        std::lock_guard lock(m_rulesMutex);
        m_rules = std::move(rules);
    }

    SanitizationResult Sanitize(std::string_view url) {
        const auto start = std::chrono::steady_clock::now();

        SanitizationResult result;
        result.originalUrl.assign(url.data(), url.size());

        if (!m_config.enabled) {
            result.sanitizedUrl = result.originalUrl;
            return result;
        }

        m_stats.totalRequests++;

        UrlParts parts;
        if (!ParseUrl(url, parts)) {
            m_stats.unparsableUrls++;
            result.sanitizedUrl = result.originalUrl;
            US_LOG_DEBUG("Unparsable URL left unchanged: %s",
                         StringUtils::Truncate(url, 128).c_str());
            return result;
        }

        std::string sanitized;
        if (parts.hasQuery && !parts.query.empty()) {
            const auto rules = Rules();

            std::vector<std::string_view> kept;
            for (const auto segment : StringUtils::Split(parts.query, '&', true)) {
                const std::string_view name = ParamName(segment);
                if (rules->ShouldStrip(parts.host, name)) {
                    result.removedParams.emplace_back(name);
                }
                else {
                    kept.push_back(segment);
                }
            }

            if (!result.removedParams.empty()) {
                sanitized.reserve(url.size());
                sanitized.append(parts.head);
                for (size_t i = 0; i < kept.size(); ++i) {
                    sanitized += (i == 0) ? '?' : '&';
                    sanitized.append(kept[i]);
                }
                sanitized.append(parts.fragment);
            }
        }

        result.sanitizedUrl = result.removedParams.empty() ? result.originalUrl : std::move(sanitized);
        result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);

        m_stats.totalProcessingTimeUs += static_cast<uint64_t>(result.elapsed.count());
        if (result.WasModified()) {
            m_stats.modifiedRequests++;
            m_stats.parametersRemoved += result.removedParams.size();
            US_LOG_DEBUG("Removed %zu tracking parameter(s) for %s",
                         result.removedParams.size(), parts.host.c_str());
        }

        UpdateDomainMetrics(parts.host, result.WasModified(), result.elapsed);
        return result;
    }

    void UpdateDomainMetrics(const std::string& host, bool modified, std::chrono::microseconds elapsed) {
        try {
            const double latencyMs = static_cast<double>(elapsed.count()) / 1000.0;

            std::unique_lock lock(m_metricsMutex);
            auto it = m_metrics.find(host);
            if (it == m_metrics.end()) {
                if (m_metrics.size() >= UrlSanitizerConstants::MAX_TRACKED_DOMAINS) {
                    return;
                }
                it = m_metrics.emplace(host, DomainMetrics{}).first;
                it->second.domain = host;
            }

            DomainMetrics& m = it->second;
            const uint64_t newTotal = m.totalRequests + 1;
            m.averageLatencyMs = (m.averageLatencyMs * static_cast<double>(m.totalRequests) + latencyMs) /
                                 static_cast<double>(newTotal);
            m.totalRequests = newTotal;
            if (modified) {
                m.modifiedRequests++;
            }
            m.lastUpdated = std::chrono::system_clock::now();
        }
        catch (const std::bad_alloc&) {
            US_LOG_WARN("Metrics update for %s dropped: out of memory", host.c_str());
        }
    }

    DomainMetrics GetDomainMetrics(std::string_view domain) const {
        const std::string key = StringUtils::ToLowerAscii(StringUtils::Trim(domain));
        std::shared_lock lock(m_metricsMutex);
        const auto it = m_metrics.find(key);
        if (it == m_metrics.end()) {
            DomainMetrics empty;
            empty.domain = key;
            return empty;
        }
        return it->second;
    }

    std::vector<DomainMetrics> GetAllDomainMetrics() const {
        std::vector<DomainMetrics> out;
        {
            std::shared_lock lock(m_metricsMutex);
            out.reserve(m_metrics.size());
            for (const auto& [domain, metrics] : m_metrics) {
                out.push_back(metrics);
            }
        }
        std::sort(out.begin(), out.end(), [](const DomainMetrics& a, const DomainMetrics& b) {
            return a.domain < b.domain;
        });
        return out;
    }

    bool ApplyRuleDocument(const json& root, std::string& error) {
        if (!root.is_object()) {
            error = "rule document root must be an object";
            return false;
        }

        // Writers merge against the current set; readers only take m_rulesMutex.
        std::lock_guard load(m_loadMutex);
        const auto current = Rules();

        std::optional<std::vector<std::string>> params;
        std::optional<std::vector<std::string>> patterns;
        if (!ReadStringArray(root, "trackingParams", "TrackingParams", params, error) ||
            !ReadStringArray(root, "trackingPatterns", "TrackingPatterns", patterns, error)) {
            return false;
        }

        SanitizationRuleSet::DomainAllowList domains = current->GetDomainAllowedParams();
        const char* domainKey = root.contains("domainAllowedParams") ? "domainAllowedParams"
                              : (root.contains("DomainAllowedParams") ? "DomainAllowedParams" : nullptr);
        if (domainKey) {
            const json& node = root.at(domainKey);
            if (!node.is_object()) {
                error = std::string("'") + domainKey + "' must be an object";
                return false;
            }
            domains.clear();
            for (const auto& [domain, names] : node.items()) {
                std::vector<std::string> values;
                if (!JSON::Get(names, "", values)) {
                    error = "exemptions for '" + domain + "' must be an array of strings";
                    return false;
                }
                auto& merged = domains[StringUtils::ToLowerAscii(domain)];
                merged.insert(merged.end(), values.begin(), values.end());
            }
        }

        auto rebuilt = SanitizationRuleSet::Build(
            params ? std::move(*params) : current->GetTrackingParams(),
            patterns ? std::move(*patterns) : current->GetTrackingPatterns(),
            domains,
            &error);
        if (!rebuilt) {
            return false;
        }

        SwapRules(std::move(rebuilt));
        return true;
    }

    UrlSanitizerConfiguration m_config;
    UrlSanitizerStatistics m_stats;

private:
    std::mutex m_loadMutex;
    mutable std::mutex m_rulesMutex;
    std::shared_ptr<const SanitizationRuleSet> m_rules;

    mutable std::shared_mutex m_metricsMutex;
    std::unordered_map<std::string, DomainMetrics> m_metrics;
};

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

UrlSanitizer::UrlSanitizer(UrlSanitizerConfiguration config)
    : m_impl(std::make_unique<UrlSanitizerImpl>(std::move(config))) {
}

UrlSanitizer::~UrlSanitizer() = default;

bool UrlSanitizer::Initialize() {
    if (m_impl->m_config.rulesFile.empty()) {
        US_LOG_INFO("Using default sanitization rules");
        return true;
    }
    return LoadRulesFromFile(m_impl->m_config.rulesFile);
}

SanitizationResult UrlSanitizer::Sanitize(std::string_view url) {
    return m_impl->Sanitize(url);
}

NavigationDecision UrlSanitizer::OnNavigationStarting(std::string_view uri) {
    NavigationDecision decision;
    SanitizationResult result = m_impl->Sanitize(uri);
    if (result.WasModified() && result.sanitizedUrl != result.originalUrl) {
        decision.action = NavigationDecision::Action::Redirect;
        decision.redirectUri = std::move(result.sanitizedUrl);
    }
    return decision;
}

bool UrlSanitizer::LoadRules(std::string_view jsonText) {
    if (StringUtils::Trim(jsonText).empty()) {
        m_impl->m_stats.rulesRejected++;
        US_LOG_WARN("Empty rule document ignored");
        return false;
    }

    JSON::Json root;
    JSON::Error jerr;
    if (!JSON::Parse(jsonText, root, &jerr)) {
        m_impl->m_stats.rulesRejected++;
        US_LOG_WARN("Rule document rejected: %s (offset %zu)", jerr.message.c_str(), jerr.byteOffset);
        return false;
    }

    std::string error;
    if (!m_impl->ApplyRuleDocument(root, error)) {
        m_impl->m_stats.rulesRejected++;
        US_LOG_WARN("Rule document rejected: %s", error.c_str());
        return false;
    }

    m_impl->m_stats.rulesReloaded++;
    const auto rules = m_impl->Rules();
    US_LOG_INFO("Loaded %zu tracking parameters, %zu patterns, %zu domain exemptions",
                rules->GetTrackingParams().size(),
                rules->GetTrackingPatterns().size(),
                rules->GetDomainAllowedParams().size());
    return true;
}

bool UrlSanitizer::LoadRulesFromFile(const fs::path& path) {
    JSON::Json root;
    JSON::Error jerr;
    if (!JSON::LoadFromFile(path, root, &jerr)) {
        m_impl->m_stats.rulesRejected++;
        US_LOG_WARN("Cannot load rules from %s: %s", path.c_str(), jerr.message.c_str());
        return false;
    }

    std::string error;
    if (!m_impl->ApplyRuleDocument(root, error)) {
        m_impl->m_stats.rulesRejected++;
        US_LOG_WARN("Rules in %s rejected: %s", path.c_str(), error.c_str());
        return false;
    }

    m_impl->m_stats.rulesReloaded++;
    US_LOG_INFO("Loaded sanitization rules from %s", path.c_str());
    return true;
}

DomainMetrics UrlSanitizer::GetDomainMetrics(std::string_view domain) const {
    return m_impl->GetDomainMetrics(domain);
}

std::vector<DomainMetrics> UrlSanitizer::GetAllDomainMetrics() const {
    return m_impl->GetAllDomainMetrics();
}

std::shared_ptr<const SanitizationRuleSet> UrlSanitizer::GetRuleSet() const {
    return m_impl->Rules();
}

const UrlSanitizerConfiguration& UrlSanitizer::GetConfiguration() const noexcept {
    return m_impl->m_config;
}

const UrlSanitizerStatistics& UrlSanitizer::GetStatistics() const noexcept {
    return m_impl->m_stats;
}

void UrlSanitizer::ResetStatistics() noexcept {
    m_impl->m_stats.Reset();
}

}  // namespace WebProtection
}  // namespace ShadowVeil
