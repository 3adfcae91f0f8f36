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
 * ShadowVeil - SANITIZATION RULE SET IMPLEMENTATION
 * ============================================================================
 *
 * @file SanitizationRuleSet.cpp
 * ============================================================================
 */

#include "pch.h"
#include "SanitizationRuleSet.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace ShadowVeil {
namespace WebProtection {

using namespace Utils;
using json = nlohmann::json;

std::shared_ptr<const SanitizationRuleSet> SanitizationRuleSet::CreateDefault() {
    std::vector<std::string> params(SanitizationConstants::DEFAULT_TRACKING_PARAMS.begin(),
                                    SanitizationConstants::DEFAULT_TRACKING_PARAMS.end());
    std::vector<std::string> patterns(SanitizationConstants::DEFAULT_TRACKING_PATTERNS.begin(),
                                      SanitizationConstants::DEFAULT_TRACKING_PATTERNS.end());
    return Build(std::move(params), std::move(patterns), {});
}

std::shared_ptr<const SanitizationRuleSet> SanitizationRuleSet::Build(
    std::vector<std::string> trackingParams,
    std::vector<std::string> trackingPatterns,
    const DomainAllowList& domainAllowedParams,
    std::string* error) {

    std::shared_ptr<SanitizationRuleSet> rules(new SanitizationRuleSet());

    for (auto& name : trackingParams) {
        if (name.empty()) {
            continue;
        }
        if (rules->m_exactLower.insert(StringUtils::ToLowerAscii(name)).second) {
            rules->m_trackingParams.push_back(std::move(name));
        }
    }

    rules->m_patterns.reserve(trackingPatterns.size());
    for (auto& pattern : trackingPatterns) {
        if (pattern.empty()) {
            continue;
        }
        try {
            rules->m_patterns.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
        }
        catch (const std::regex_error& ex) {
            if (error) {
                *error = "invalid pattern '" + pattern + "': " + ex.what();
            }
            return nullptr;
        }
        rules->m_patternSources.push_back(std::move(pattern));
    }

    for (const auto& [domain, names] : domainAllowedParams) {
        const std::string host = StringUtils::ToLowerAscii(StringUtils::Trim(domain));
        if (host.empty()) {
            continue;
        }
        auto& listed = rules->m_domainAllowed[host];
        auto& lookup = rules->m_exemptLower[host];
        for (const auto& name : names) {
            if (!name.empty() && lookup.insert(StringUtils::ToLowerAscii(name)).second) {
                listed.push_back(name);
            }
        }
    }

    return rules;
}

bool SanitizationRuleSet::IsTrackingParam(std::string_view name) const {
    if (name.empty()) {
        return false;
    }
    if (m_exactLower.count(StringUtils::ToLowerAscii(name)) != 0) {
        return true;
    }
    return std::any_of(m_patterns.begin(), m_patterns.end(), [name](const std::regex& re) {
        return std::regex_search(name.begin(), name.end(), re);
    });
}

bool SanitizationRuleSet::IsExempt(std::string_view lowerHost, std::string_view name) const {
    if (m_exemptLower.empty()) {
        return false;
    }
    const auto it = m_exemptLower.find(std::string(lowerHost));
    if (it == m_exemptLower.end()) {
        return false;
    }
    return it->second.count(StringUtils::ToLowerAscii(name)) != 0;
}

bool SanitizationRuleSet::ShouldStrip(std::string_view lowerHost, std::string_view name) const {
    return !IsExempt(lowerHost, name) && IsTrackingParam(name);
}

std::string SanitizationRuleSet::ToJson() const {
    json j;
    j["trackingParams"] = m_trackingParams;
    j["trackingPatterns"] = m_patternSources;
    j["domainAllowedParams"] = json::object();
    for (const auto& [domain, names] : m_domainAllowed) {
        j["domainAllowedParams"][domain] = names;
    }
    return j.dump();
}

}  // namespace WebProtection
}  // namespace ShadowVeil
