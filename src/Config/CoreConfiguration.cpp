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
 * ShadowVeil - CORE CONFIGURATION IMPLEMENTATION
 * ============================================================================
 *
 * @file CoreConfiguration.cpp
 * ============================================================================
 */

#include "pch.h"
#include "CoreConfiguration.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <array>
#include <limits>

namespace ShadowVeil {
namespace Config {

using namespace Utils;
using Json = JSON::Json;
namespace fs = std::filesystem;

#define CFG_LOG_INFO(fmt, ...)   SV_LOG_INFO("Config", fmt, ##__VA_ARGS__)
#define CFG_LOG_WARN(fmt, ...)   SV_LOG_WARN("Config", fmt, ##__VA_ARGS__)

std::string_view GetConfigErrorCodeName(ConfigErrorCode code) noexcept {
    switch (code) {
        case ConfigErrorCode::None:         return "None";
        case ConfigErrorCode::IoError:      return "IoError";
        case ConfigErrorCode::ParseError:   return "ParseError";
        case ConfigErrorCode::InvalidValue: return "InvalidValue";
        default:                            return "Unknown";
    }
}

namespace {

constexpr std::array<std::string_view, 8> LOG_LEVEL_NAMES = {
    "trace", "debug", "info", "warn", "warning", "error", "fatal", "critical"
};

void SetConfigError(ConfigError* err, ConfigErrorCode code, std::string key, std::string message) {
    if (err) {
        err->code = code;
        err->key = std::move(key);
        err->message = std::move(message);
    }
}

/**
 * @brief Typed reads from one section. Absent keys leave the target alone;
 *        present keys of the wrong type record an error.
 */
class SectionReader {
public:
    SectionReader(const Json& root, std::string name, ConfigError* err)
        : m_name(std::move(name)), m_err(err) {
        const auto it = root.find(m_name);
        if (it == root.end()) {
            return;
        }
        if (!it->is_object()) {
            Fail(m_name, "section must be an object");
            return;
        }
        m_section = &*it;
    }

    [[nodiscard]] bool Ok() const noexcept { return m_ok; }

    void Unsigned(const char* key, uint64_t& out, uint64_t maxValue = std::numeric_limits<uint64_t>::max()) {
        const Json* v = Find(key);
        if (!v) return;
        if (!v->is_number_integer() || (!v->is_number_unsigned() && v->get<int64_t>() < 0)) {
            Fail(Key(key), "expected a non-negative integer");
            return;
        }
        const uint64_t value = v->get<uint64_t>();
        if (value > maxValue) {
            Fail(Key(key), "value out of range");
            return;
        }
        out = value;
    }

    void Bool(const char* key, bool& out) {
        const Json* v = Find(key);
        if (!v) return;
        if (!v->is_boolean()) {
            Fail(Key(key), "expected a boolean");
            return;
        }
        out = v->get<bool>();
    }

    void String(const char* key, std::string& out) {
        const Json* v = Find(key);
        if (!v) return;
        if (!v->is_string()) {
            Fail(Key(key), "expected a string");
            return;
        }
        out = v->get<std::string>();
    }

    void StringList(const char* key, std::vector<std::string>& out) {
        const Json* v = Find(key);
        if (!v) return;
        std::vector<std::string> values;
        if (!JSON::Get(*v, "", values)) {
            Fail(Key(key), "expected an array of strings");
            return;
        }
        out = std::move(values);
    }

private:
    const Json* Find(const char* key) const {
        if (!m_ok || !m_section) {
            return nullptr;
        }
        const auto it = m_section->find(key);
        return it == m_section->end() ? nullptr : &*it;
    }

    std::string Key(const char* key) const { return m_name + "." + key; }

    void Fail(std::string key, std::string message) {
        if (m_ok) {
            SetConfigError(m_err, ConfigErrorCode::InvalidValue, std::move(key), std::move(message));
        }
        m_ok = false;
    }

    const Json* m_section = nullptr;
    std::string m_name;
    ConfigError* m_err;
    bool m_ok = true;
};

bool ApplyDocument(const Json& root, CoreConfiguration& out, ConfigError* err) {
    if (!root.is_object()) {
        SetConfigError(err, ConfigErrorCode::ParseError, {}, "configuration root must be an object");
        return false;
    }

    CoreConfiguration next = out;

    SectionReader sessions(root, "sessions", err);
    std::string basePath;
    uint64_t sweepSeconds = static_cast<uint64_t>(next.sessions.sweepInterval.count());
    uint64_t stalenessSeconds = static_cast<uint64_t>(next.sessions.orphanStaleness.count());
    uint64_t exitTimeoutMs = static_cast<uint64_t>(next.sessions.environmentExitTimeout.count());
    constexpr uint64_t maxSeconds = 365ULL * 24 * 3600;
    sessions.String("basePath", basePath);
    sessions.Unsigned("sweepIntervalSeconds", sweepSeconds, maxSeconds);
    sessions.Unsigned("orphanStalenessSeconds", stalenessSeconds, maxSeconds);
    sessions.Unsigned("environmentExitTimeoutMs", exitTimeoutMs, maxSeconds * 1000);
    sessions.StringList("browserArguments", next.sessions.browserArguments);
    if (!sessions.Ok()) return false;
    if (!basePath.empty()) {
        next.sessions.basePath = basePath;
    }
    next.sessions.sweepInterval = std::chrono::seconds(static_cast<int64_t>(sweepSeconds));
    next.sessions.orphanStaleness = std::chrono::seconds(static_cast<int64_t>(stalenessSeconds));
    next.sessions.environmentExitTimeout = std::chrono::milliseconds(static_cast<int64_t>(exitTimeoutMs));

    SectionReader deletion(root, "secureDeletion", err);
    uint64_t ceiling = next.secureDeletion.overwriteCeilingBytes;
    uint64_t attempts = next.secureDeletion.maxAttempts;
    uint64_t delayMs = static_cast<uint64_t>(next.secureDeletion.retryBaseDelay.count());
    deletion.Unsigned("overwriteCeilingBytes", ceiling, Privacy::SecureDeletionConstants::MAX_OVERWRITE_CEILING_BYTES);
    deletion.Unsigned("maxAttempts", attempts, Privacy::SecureDeletionConstants::MAX_ATTEMPTS_LIMIT);
    deletion.Unsigned("retryBaseDelayMs", delayMs, 60000);
    if (!deletion.Ok()) return false;
    next.secureDeletion.overwriteCeilingBytes = ceiling;
    next.secureDeletion.maxAttempts = static_cast<uint32_t>(attempts);
    next.secureDeletion.retryBaseDelay = std::chrono::milliseconds(static_cast<int64_t>(delayMs));

    SectionReader downloads(root, "downloads", err);
    downloads.StringList("allowedContentTypes", next.downloads.allowedContentTypes);
    downloads.StringList("blockedExtensions", next.downloads.blockedExtensions);
    if (!downloads.Ok()) return false;

    SectionReader sanitizer(root, "sanitizer", err);
    std::string rulesFile;
    sanitizer.Bool("enabled", next.sanitizer.enabled);
    sanitizer.String("rulesFile", rulesFile);
    if (!sanitizer.Ok()) return false;
    if (!rulesFile.empty()) {
        next.sanitizer.rulesFile = rulesFile;
    }

    SectionReader logging(root, "logging", err);
    std::string level;
    logging.String("level", level);
    logging.String("directory", next.logging.logDirectory);
    logging.String("baseFileName", next.logging.baseFileName);
    logging.Bool("toConsole", next.logging.toConsole);
    logging.Bool("toFile", next.logging.toFile);
    logging.Bool("async", next.logging.async);
    logging.Bool("jsonLines", next.logging.jsonLines);
    if (!logging.Ok()) return false;
    if (!level.empty()) {
        const std::string lower = StringUtils::ToLowerAscii(level);
        if (std::find(LOG_LEVEL_NAMES.begin(), LOG_LEVEL_NAMES.end(), lower) == LOG_LEVEL_NAMES.end()) {
            SetConfigError(err, ConfigErrorCode::InvalidValue, "logging.level", "unknown log level '" + level + "'");
            return false;
        }
        next.logging.minimalLevel = ParseLogLevel(lower);
    }

    if (!next.IsValid()) {
        SetConfigError(err, ConfigErrorCode::InvalidValue, {}, "configuration failed validation");
        return false;
    }

    out = std::move(next);
    return true;
}

Json BuildDocument(const CoreConfiguration& c) {
    Json j;
    j["sessions"] = {
        {"basePath", c.sessions.basePath.string()},
        {"sweepIntervalSeconds", c.sessions.sweepInterval.count()},
        {"orphanStalenessSeconds", c.sessions.orphanStaleness.count()},
        {"environmentExitTimeoutMs", c.sessions.environmentExitTimeout.count()},
        {"browserArguments", c.sessions.browserArguments}
    };
    j["secureDeletion"] = {
        {"overwriteCeilingBytes", c.secureDeletion.overwriteCeilingBytes},
        {"maxAttempts", c.secureDeletion.maxAttempts},
        {"retryBaseDelayMs", c.secureDeletion.retryBaseDelay.count()}
    };
    j["downloads"] = {
        {"allowedContentTypes", c.downloads.allowedContentTypes},
        {"blockedExtensions", c.downloads.blockedExtensions}
    };
    j["sanitizer"] = {
        {"enabled", c.sanitizer.enabled},
        {"rulesFile", c.sanitizer.rulesFile.string()}
    };
    j["logging"] = {
        {"level", StringUtils::ToLowerAscii(LogLevelName(c.logging.minimalLevel))},
        {"directory", c.logging.logDirectory},
        {"baseFileName", c.logging.baseFileName},
        {"toConsole", c.logging.toConsole},
        {"toFile", c.logging.toFile},
        {"async", c.logging.async},
        {"jsonLines", c.logging.jsonLines}
    };
    return j;
}

}  // namespace

// ============================================================================
// CORE CONFIGURATION
// ============================================================================

bool CoreConfiguration::IsValid() const noexcept {
    return sessions.IsValid() &&
           secureDeletion.IsValid() &&
           downloads.IsValid() &&
           sanitizer.IsValid() &&
           !logging.baseFileName.empty();
}

std::string CoreConfiguration::ToJson() const {
    return BuildDocument(*this).dump();
}

CoreConfiguration CoreConfiguration::Default() {
    return CoreConfiguration{};
}

// ============================================================================
// CONFIG LOADER
// ============================================================================

bool ConfigLoader::LoadFromFile(const fs::path& path, CoreConfiguration& out, ConfigError* err) {
    FileUtils::Error ferr;
    if (!FileUtils::Exists(path, &ferr)) {
        SetConfigError(err, ConfigErrorCode::IoError, {}, "configuration file not found: " + path.string());
        return false;
    }

    Json root;
    JSON::Error jerr;
    if (!JSON::LoadFromFile(path, root, &jerr)) {
        SetConfigError(err, ConfigErrorCode::ParseError, {}, jerr.message);
        CFG_LOG_WARN("Cannot parse %s: %s", path.c_str(), jerr.message.c_str());
        return false;
    }

    if (!ApplyDocument(root, out, err)) {
        CFG_LOG_WARN("Configuration %s rejected", path.c_str());
        return false;
    }

    CFG_LOG_INFO("Loaded configuration from %s", path.c_str());
    return true;
}

bool ConfigLoader::LoadFromJson(std::string_view jsonText, CoreConfiguration& out, ConfigError* err) {
    Json root;
    JSON::Error jerr;
    if (!JSON::Parse(jsonText, root, &jerr)) {
        SetConfigError(err, ConfigErrorCode::ParseError, {}, jerr.message);
        return false;
    }
    return ApplyDocument(root, out, err);
}

bool ConfigLoader::SaveToFile(const fs::path& path, const CoreConfiguration& config, ConfigError* err) {
    JSON::Error jerr;
    JSON::StringifyOptions opt;
    opt.pretty = true;
    if (!JSON::SaveToFile(path, BuildDocument(config), &jerr, opt)) {
        SetConfigError(err, ConfigErrorCode::IoError, {}, jerr.message);
        return false;
    }
    return true;
}

}  // namespace Config
}  // namespace ShadowVeil
