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
 * ShadowVeil - CONTENT MARKER
 * ============================================================================
 *
 * @file ContentMarker.hpp
 * @brief Tags quarantined downloads as originating from the internet.
 *
 * MARKERS:
 * ========
 * - XattrContentMarker:   user.xdg.origin.url and user.shadowveil.zone=3
 *                         extended attributes (freedesktop convention)
 * - SidecarContentMarker: "<file>.Zone.Identifier" text file next to the
 *                         download, used where the file system has no
 *                         user xattr support
 * - FallbackContentMarker: primary first, secondary when it fails
 *
 * Marking is best-effort; the quarantine gate logs failures and continues.
 * ============================================================================
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace ShadowVeil {
namespace WebProtection {

namespace ContentMarkerConstants {

    /// @brief Zone id of content downloaded from the internet
    inline constexpr int INTERNET_ZONE_ID = 3;

    inline constexpr std::string_view XATTR_ORIGIN_URL = "user.xdg.origin.url";
    inline constexpr std::string_view XATTR_ZONE = "user.shadowveil.zone";

    inline constexpr std::string_view SIDECAR_SUFFIX = ".Zone.Identifier";

}  // namespace ContentMarkerConstants

/**
 * @brief Platform capability for marking a file's origin.
 */
class IContentMarker {
public:
    virtual ~IContentMarker() = default;

    /// @return true when the mark was written
    [[nodiscard]] virtual bool Mark(const std::filesystem::path& path, std::string_view sourceUrl) = 0;

    [[nodiscard]] virtual std::string_view GetName() const noexcept = 0;
};

class XattrContentMarker final : public IContentMarker {
public:
    [[nodiscard]] bool Mark(const std::filesystem::path& path, std::string_view sourceUrl) override;

    [[nodiscard]] std::string_view GetName() const noexcept override { return "xattr"; }
};

class SidecarContentMarker final : public IContentMarker {
public:
    [[nodiscard]] bool Mark(const std::filesystem::path& path, std::string_view sourceUrl) override;

    [[nodiscard]] std::string_view GetName() const noexcept override { return "sidecar"; }

    /// @brief "<path>.Zone.Identifier"
    [[nodiscard]] static std::filesystem::path SidecarPathFor(const std::filesystem::path& path);

    /// @brief Sidecar file body for a source URL (CR and LF removed from the URL)
    [[nodiscard]] static std::string FormatZoneIdentifier(std::string_view sourceUrl);
};

class FallbackContentMarker final : public IContentMarker {
public:
    FallbackContentMarker(std::shared_ptr<IContentMarker> primary,
                          std::shared_ptr<IContentMarker> secondary);

    [[nodiscard]] bool Mark(const std::filesystem::path& path, std::string_view sourceUrl) override;

    [[nodiscard]] std::string_view GetName() const noexcept override { return "fallback"; }

private:
    std::shared_ptr<IContentMarker> m_primary;
    std::shared_ptr<IContentMarker> m_secondary;
};

/**
 * @brief xattr marker falling back to the sidecar file.
 */
[[nodiscard]] std::shared_ptr<IContentMarker> CreateDefaultContentMarker();

}  // namespace WebProtection
}  // namespace ShadowVeil
