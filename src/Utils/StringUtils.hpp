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
#pragma once
/**
 * @file StringUtils.hpp
 * @brief ASCII string helpers shared by the sanitizer and the quarantine gate.
 *
 * All case folding is ASCII-only; URL components and MIME types are
 * compared the way browsers compare them.
 */

#include <string>
#include <string_view>
#include <vector>

namespace ShadowVeil {
	namespace Utils {
		namespace StringUtils {

			[[nodiscard]] std::string ToLowerAscii(std::string_view s);

			void ToLowerAsciiInPlace(std::string& s) noexcept;

			[[nodiscard]] bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept;

			[[nodiscard]] bool StartsWithIgnoreCase(std::string_view s, std::string_view prefix) noexcept;

			[[nodiscard]] bool EndsWithIgnoreCase(std::string_view s, std::string_view suffix) noexcept;

			/**
			 * @brief Trim ASCII whitespace from both ends.
			 */
			[[nodiscard]] std::string_view Trim(std::string_view s) noexcept;

			/**
			 * @brief Split on a single delimiter.
			 * @param skipEmpty Drop empty segments (e.g. "a&&b" -> {"a","b"})
			 */
			[[nodiscard]] std::vector<std::string_view> Split(std::string_view s, char delim, bool skipEmpty = false);

			/**
			 * @brief Join with a separator.
			 */
			[[nodiscard]] std::string Join(const std::vector<std::string>& parts, std::string_view sep);

			/**
			 * @brief Truncate for log output, appending "..." when shortened.
			 */
			[[nodiscard]] std::string Truncate(std::string_view s, size_t maxLen);

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace ShadowVeil
