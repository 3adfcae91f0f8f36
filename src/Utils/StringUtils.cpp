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
#include "pch.h"
#include "StringUtils.hpp"

namespace ShadowVeil {
	namespace Utils {
		namespace StringUtils {

			namespace {
				inline char LowerAscii(char c) noexcept {
					return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
				}

				inline bool IsSpaceAscii(char c) noexcept {
					return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
				}
			}

			std::string ToLowerAscii(std::string_view s) {
				std::string out(s);
				ToLowerAsciiInPlace(out);
				return out;
			}

			void ToLowerAsciiInPlace(std::string& s) noexcept {
				for (auto& c : s) {
					c = LowerAscii(c);
				}
			}

			bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) {
					return false;
				}
				for (size_t i = 0; i < a.size(); ++i) {
					if (LowerAscii(a[i]) != LowerAscii(b[i])) {
						return false;
					}
				}
				return true;
			}

			bool StartsWithIgnoreCase(std::string_view s, std::string_view prefix) noexcept {
				return s.size() >= prefix.size() && EqualsIgnoreCase(s.substr(0, prefix.size()), prefix);
			}

			bool EndsWithIgnoreCase(std::string_view s, std::string_view suffix) noexcept {
				return s.size() >= suffix.size() &&
					EqualsIgnoreCase(s.substr(s.size() - suffix.size()), suffix);
			}

			std::string_view Trim(std::string_view s) noexcept {
				size_t begin = 0;
				size_t end = s.size();
				while (begin < end && IsSpaceAscii(s[begin])) ++begin;
				while (end > begin && IsSpaceAscii(s[end - 1])) --end;
				return s.substr(begin, end - begin);
			}

			std::vector<std::string_view> Split(std::string_view s, char delim, bool skipEmpty) {
				std::vector<std::string_view> parts;
				size_t start = 0;
				while (start <= s.size()) {
					const size_t pos = s.find(delim, start);
					const size_t end = (pos == std::string_view::npos) ? s.size() : pos;
					std::string_view piece = s.substr(start, end - start);
					if (!skipEmpty || !piece.empty()) {
						parts.push_back(piece);
					}
					if (pos == std::string_view::npos) {
						break;
					}
					start = pos + 1;
				}
				return parts;
			}

			std::string Join(const std::vector<std::string>& parts, std::string_view sep) {
				std::string out;
				for (size_t i = 0; i < parts.size(); ++i) {
					if (i > 0) out += sep;
					out += parts[i];
				}
				return out;
			}

			std::string Truncate(std::string_view s, size_t maxLen) {
				if (s.size() <= maxLen) {
					return std::string(s);
				}
				if (maxLen <= 3) {
					return std::string(s.substr(0, maxLen));
				}
				return std::string(s.substr(0, maxLen - 3)) + "...";
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace ShadowVeil
