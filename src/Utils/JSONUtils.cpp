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
#include "JSONUtils.hpp"
#include "FileUtils.hpp"

namespace ShadowVeil {
	namespace Utils {
		namespace JSON {

			namespace {
				void SetError(Error* err, std::string message, size_t offset = 0,
				              const std::filesystem::path& path = {}) noexcept {
					if (!err) return;
					try {
						err->message = std::move(message);
						err->byteOffset = offset;
						err->path = path;
					}
					catch (const std::bad_alloc&) {
					}
				}
			}

			// ============================================================================
			// Text Parsing
			// ============================================================================

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				if (err) err->clear();
				out = Json();

				bool tooDeep = false;
				const size_t maxDepth = opt.maxDepth;
				Json::parser_callback_t depthGuard =
					[&tooDeep, maxDepth](int depth, Json::parse_event_t, Json&) {
						if (static_cast<size_t>(depth) > maxDepth) {
							tooDeep = true;
						}
						return true;
					};

				try {
					Json parsed = Json::parse(jsonText.begin(), jsonText.end(), depthGuard,
					                          /*allow_exceptions*/ true, opt.allowComments);
					if (tooDeep) {
						SetError(err, "JSON nesting exceeds maximum depth of " + std::to_string(maxDepth));
						return false;
					}
					out = std::move(parsed);
					return true;
				}
				catch (const Json::parse_error& e) {
					SetError(err, e.what(), e.byte);
				}
				catch (const Json::exception& e) {
					SetError(err, e.what());
				}
				catch (const std::bad_alloc&) {
					SetError(err, "out of memory");
				}
				out = Json();
				return false;
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = opt.pretty ? j.dump(opt.indentSpaces) : j.dump();
					return true;
				}
				catch (const Json::exception&) {
				}
				catch (const std::bad_alloc&) {
				}
				out.clear();
				return false;
			}

			// ============================================================================
			// File I/O
			// ============================================================================

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				if (err) err->clear();
				try {
					FileUtils::FileStat st;
					FileUtils::Error ferr;
					if (!FileUtils::Stat(path, st, &ferr)) {
						SetError(err, ferr.message, 0, path);
						return false;
					}
					if (!st.exists || !st.isRegularFile) {
						SetError(err, "not a regular file", 0, path);
						return false;
					}
					if (st.size > maxBytes) {
						SetError(err, "file exceeds " + std::to_string(maxBytes) + " bytes", 0, path);
						return false;
					}

					std::string text;
					if (!FileUtils::ReadAllTextUtf8(path, text, &ferr)) {
						SetError(err, ferr.message, 0, path);
						return false;
					}
					if (!Parse(text, out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::bad_alloc&) {
					SetError(err, "out of memory", 0, path);
					return false;
				}
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err,
			                const StringifyOptions& opt) noexcept {
				if (err) err->clear();
				std::string text;
				if (!Stringify(j, text, opt)) {
					SetError(err, "serialization failed", 0, path);
					return false;
				}
				FileUtils::Error ferr;
				if (!FileUtils::WriteAllTextUtf8Atomic(path, text, &ferr)) {
					SetError(err, ferr.message, 0, path);
					return false;
				}
				return true;
			}

			// ============================================================================
			// JSON Pointer / Path Helpers
			// ============================================================================

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty()) return {};
					if (pathLike.front() == '/') return std::string(pathLike);

					std::string out;
					out.reserve(pathLike.size() + 8);
					std::string token;
					auto flush = [&]() {
						if (token.empty()) return;
						out.push_back('/');
						for (char c : token) {
							if (c == '~') out += "~0";
							else if (c == '/') out += "~1";
							else out.push_back(c);
						}
						token.clear();
					};

					for (char c : pathLike) {
						if (c == '.' || c == '[' || c == ']') {
							flush();
						}
						else {
							token.push_back(c);
						}
					}
					flush();
					return out;
				}
				catch (const std::bad_alloc&) {
					return {};
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty()) return true;
					return j.contains(Json::json_pointer(jp));
				}
				catch (const Json::exception&) {
					return false;
				}
				catch (const std::bad_alloc&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace ShadowVeil
