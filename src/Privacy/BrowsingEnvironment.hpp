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
 * ShadowVeil - BROWSING ENVIRONMENT INTERFACES
 * ============================================================================
 *
 * @file BrowsingEnvironment.hpp
 * @brief Outbound seam to the web-rendering collaborator.
 *
 * The rendering engine creates one isolated environment per session, bound
 * to the session's storage directory. The core only needs to create it,
 * hand it to the shell, and tear it down before the storage is wiped.
 * ============================================================================
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ShadowVeil {
namespace Privacy {

/**
 * @brief Handle to one isolated browsing environment.
 *
 * Owned exclusively by its session. Release() asks the environment to
 * close; WaitForExit() blocks until every dependent process has exited or
 * the timeout elapses.
 */
class IBrowsingEnvironment {
public:
    virtual ~IBrowsingEnvironment() = default;

    /// @brief Close the environment and drop its handles on the storage directory
    virtual void Release() = 0;

    /// @return true when the dependent process exited within the timeout
    [[nodiscard]] virtual bool WaitForExit(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Factory for browsing environments.
 *
 * Implementations return nullptr (or throw std::exception) on failure.
 */
class IEnvironmentProvider {
public:
    virtual ~IEnvironmentProvider() = default;

    [[nodiscard]] virtual std::unique_ptr<IBrowsingEnvironment> CreateEnvironment(
        const std::filesystem::path& storagePath,
        const std::vector<std::string>& arguments) = 0;
};

}  // namespace Privacy
}  // namespace ShadowVeil
