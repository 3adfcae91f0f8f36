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
 * ShadowVeil - CORE CONFIGURATION
 * ============================================================================
 *
 * @file CoreConfiguration.hpp
 * @brief Aggregate configuration of the privacy core and the JSON loader
 *        that produces it.
 *
 * DOCUMENT LAYOUT:
 * ================
 * @code
 * {
 *   "sessions": {
 *     "basePath": "/tmp/ShadowVeil",
 *     "sweepIntervalSeconds": 300,
 *     "orphanStalenessSeconds": 3600,
 *     "environmentExitTimeoutMs": 2000,
 *     "browserArguments": ["--no-first-run"]
 *   },
 *   "secureDeletion": {
 *     "overwriteCeilingBytes": 1048576, "maxAttempts": 3, "retryBaseDelayMs": 100
 *   },
 *   "downloads": {
 *     "allowedContentTypes": ["application/pdf"], "blockedExtensions": [".exe"]
 *   },
 *   "sanitizer": { "enabled": true, "rulesFile": "rules.json" },
 *   "logging": {
 *     "level": "info", "directory": "logs", "baseFileName": "ShadowVeil",
 *     "toConsole": true, "toFile": false, "async": true, "jsonLines": false
 *   }
 * }
 * @endcode
 *
 * Every section and key is optional. Unknown keys are ignored. A value of
 * the wrong type or outside its range rejects the whole document and the
 * caller's configuration is left unchanged.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "../Utils/Logger.hpp"
#include "../Privacy/EphemeralSessionManager.hpp"
#include "../Privacy/SecureDeletion.hpp"
#include "../WebProtection/DownloadQuarantineGate.hpp"
#include "../WebProtection/UrlSanitizer.hpp"

namespace ShadowVeil {
namespace Config {

enum class ConfigErrorCode : uint8_t {
    None            = 0,
    IoError         = 1,    ///< File missing or unreadable
    ParseError      = 2,    ///< Not valid JSON, or root is not an object
    InvalidValue    = 3     ///< Wrong type or out of range
};

[[nodiscard]] std::string_view GetConfigErrorCodeName(ConfigErrorCode code) noexcept;

struct ConfigError {
    ConfigErrorCode code = ConfigErrorCode::None;
    std::string message;
    std::string key;            ///< Dotted key of the offending value, if any

    [[nodiscard]] bool hasError() const noexcept { return code != ConfigErrorCode::None; }

    void clear() noexcept {
        code = ConfigErrorCode::None;
        message.clear();
        key.clear();
    }
};

/**
 * @brief Configuration of every component of the privacy core
 */
struct CoreConfiguration {
    Privacy::SessionManagerConfiguration sessions = Privacy::SessionManagerConfiguration::CreateDefault();
    Privacy::SecureDeletionConfiguration secureDeletion;
    WebProtection::QuarantineGateConfiguration downloads;
    WebProtection::UrlSanitizerConfiguration sanitizer;
    Utils::LoggerConfig logging;

    [[nodiscard]] bool IsValid() const noexcept;

    [[nodiscard]] std::string ToJson() const;

    [[nodiscard]] static CoreConfiguration Default();
};

/**
 * @brief Reads CoreConfiguration documents.
 */
class ConfigLoader final {
public:
    /**
     * @brief Apply a JSON file on top of out.
     * @return false (out unchanged) on I/O, parse or validation errors
     */
    [[nodiscard]] static bool LoadFromFile(const std::filesystem::path& path,
                                           CoreConfiguration& out,
                                           ConfigError* err = nullptr);

    [[nodiscard]] static bool LoadFromJson(std::string_view jsonText,
                                           CoreConfiguration& out,
                                           ConfigError* err = nullptr);

    /**
     * @brief Write the document layout above for a configuration.
     */
    [[nodiscard]] static bool SaveToFile(const std::filesystem::path& path,
                                         const CoreConfiguration& config,
                                         ConfigError* err = nullptr);
};

}  // namespace Config
}  // namespace ShadowVeil
