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
 * ShadowVeil - CONTENT MARKER IMPLEMENTATION
 * ============================================================================
 *
 * @file ContentMarker.cpp
 * ============================================================================
 */

#include "pch.h"
#include "ContentMarker.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <sys/xattr.h>

#include <cerrno>

namespace ShadowVeil {
namespace WebProtection {

using namespace Utils;
namespace fs = std::filesystem;

#define CM_LOG_DEBUG(fmt, ...)   SV_LOG_DEBUG("ContentMarker", fmt, ##__VA_ARGS__)
#define CM_LOG_WARN(fmt, ...)    SV_LOG_WARN("ContentMarker", fmt, ##__VA_ARGS__)

namespace {

std::string StripLineBreaks(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '\r' && c != '\n') {
            out.push_back(c);
        }
    }
    return out;
}

bool SetAttribute(const fs::path& path, std::string_view name, std::string_view value) {
    const std::string key(name);
    if (::setxattr(path.c_str(), key.c_str(), value.data(), value.size(), 0) != 0) {
        const int code = errno;
        CM_LOG_DEBUG("setxattr(%s, %s) failed: errno %d", path.c_str(), key.c_str(), code);
        return false;
    }
    return true;
}

}  // namespace

// ============================================================================
// XATTR MARKER
// ============================================================================

bool XattrContentMarker::Mark(const fs::path& path, std::string_view sourceUrl) {
    const std::string zone = std::to_string(ContentMarkerConstants::INTERNET_ZONE_ID);
    if (!SetAttribute(path, ContentMarkerConstants::XATTR_ZONE, zone)) {
        return false;
    }
    const std::string url = StripLineBreaks(sourceUrl);
    return url.empty() || SetAttribute(path, ContentMarkerConstants::XATTR_ORIGIN_URL, url);
}

// ============================================================================
// SIDECAR MARKER
// ============================================================================

fs::path SidecarContentMarker::SidecarPathFor(const fs::path& path) {
    fs::path sidecar = path;
    sidecar += std::string(ContentMarkerConstants::SIDECAR_SUFFIX);
    return sidecar;
}

std::string SidecarContentMarker::FormatZoneIdentifier(std::string_view sourceUrl) {
    std::string body = "[ZoneTransfer]\nZoneId=";
    body += std::to_string(ContentMarkerConstants::INTERNET_ZONE_ID);
    body += "\nReferrerUrl=";
    body += StripLineBreaks(sourceUrl);
    body += "\n";
    return body;
}

bool SidecarContentMarker::Mark(const fs::path& path, std::string_view sourceUrl) {
    FileUtils::Error err;
    if (!FileUtils::WriteAllTextUtf8Atomic(SidecarPathFor(path), FormatZoneIdentifier(sourceUrl), &err)) {
        CM_LOG_WARN("Sidecar marker for %s not written: %s", path.c_str(), err.message.c_str());
        return false;
    }
    return true;
}

// ============================================================================
// FALLBACK MARKER
// ============================================================================

FallbackContentMarker::FallbackContentMarker(std::shared_ptr<IContentMarker> primary,
                                             std::shared_ptr<IContentMarker> secondary)
    : m_primary(std::move(primary))
    , m_secondary(std::move(secondary)) {
}

bool FallbackContentMarker::Mark(const fs::path& path, std::string_view sourceUrl) {
    if (m_primary && m_primary->Mark(path, sourceUrl)) {
        return true;
    }
    if (m_secondary) {
        CM_LOG_DEBUG("Falling back to %s marker for %s",
                     std::string(m_secondary->GetName()).c_str(), path.c_str());
        return m_secondary->Mark(path, sourceUrl);
    }
    return false;
}

std::shared_ptr<IContentMarker> CreateDefaultContentMarker() {
    return std::make_shared<FallbackContentMarker>(std::make_shared<XattrContentMarker>(),
                                                   std::make_shared<SidecarContentMarker>());
}

}  // namespace WebProtection
}  // namespace ShadowVeil
