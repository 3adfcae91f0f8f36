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
 * @file FileUtils.hpp
 * @brief POSIX file system helpers for ShadowVeil.
 *
 * Thin, error-reporting wrappers over std::filesystem and POSIX calls.
 * Every function reports failure through its return value and an optional
 * Error out-parameter; none of them throw.
 */

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <chrono>
#include <filesystem>

#include "Logger.hpp"

namespace ShadowVeil {
	namespace Utils {
		namespace FileUtils {

			namespace fs = std::filesystem;

			/// Maximum file size for in-memory operations (64MB)
			inline constexpr uint64_t MAX_READ_FILE_SIZE = 64ULL * 1024 * 1024;

			/// Buffer size for streamed copies
			inline constexpr size_t COPY_BUFFER_SIZE = 256 * 1024;

			/**
			 * @brief Error information structure for file operations.
			 *
			 * Carries the errno value of the failing call and a readable message.
			 */
			struct Error {
				int code = 0;               ///< errno value (0 = success)
				std::string message;        ///< Human-readable error description

				[[nodiscard]] constexpr bool hasError() const noexcept { return code != 0; }
				void clear() noexcept { code = 0; message.clear(); }
			};

			/**
			 * @brief File metadata.
			 *
			 * changeTime is the inode status-change time (st_ctime), the closest
			 * POSIX analogue of a creation timestamp.
			 */
			struct FileStat {
				bool exists = false;
				bool isDirectory = false;
				bool isRegularFile = false;
				bool isSymlink = false;
				uint64_t size = 0;
				uint32_t mode = 0;
				std::chrono::system_clock::time_point changeTime{};
				std::chrono::system_clock::time_point lastWrite{};
			};

			// ============================================================================
			// Path Helpers
			// ============================================================================

			/**
			 * @brief Verify that a path resides within an expected root directory.
			 *
			 * Both paths are made absolute and lexically normalized. Existing
			 * components are resolved through weakly_canonical so a symlink cannot
			 * be used to escape the root.
			 */
			[[nodiscard]] bool IsPathUnderRoot(const fs::path& path, const fs::path& root, Error* err = nullptr);

			/**
			 * @brief Reduce an untrusted file name to a single safe path component.
			 *
			 * Strips directory separators, NUL and control characters, and leading
			 * dots. Returns an empty string when nothing usable remains.
			 */
			[[nodiscard]] std::string SanitizeFileName(std::string_view name);

			// ============================================================================
			// File Existence and Status
			// ============================================================================

			[[nodiscard]] bool Exists(const fs::path& path, Error* err = nullptr);

			[[nodiscard]] bool IsDirectory(const fs::path& path, Error* err = nullptr);

			/**
			 * @brief lstat() the path. A missing path is success with exists=false.
			 */
			[[nodiscard]] bool Stat(const fs::path& path, FileStat& out, Error* err = nullptr);

			// ============================================================================
			// File Reading/Writing
			// ============================================================================

			/**
			 * @brief Read file as UTF-8 text.
			 * @warning Limited to MAX_READ_FILE_SIZE to prevent memory exhaustion
			 */
			[[nodiscard]] bool ReadAllTextUtf8(const fs::path& path, std::string& out, Error* err = nullptr);

			/**
			 * @brief Write UTF-8 text atomically (temp file, fsync, rename).
			 */
			[[nodiscard]] bool WriteAllTextUtf8Atomic(const fs::path& path, std::string_view utf8, Error* err = nullptr);

			/**
			 * @brief Overwrite a file in place with caller-supplied bytes and fsync.
			 *
			 * The file must already exist; its length is not changed.
			 */
			[[nodiscard]] bool OverwriteInPlace(const fs::path& path, const uint8_t* data, size_t len, Error* err = nullptr);

			// ============================================================================
			// Atomic Operations
			// ============================================================================

			/**
			 * @brief Move a file so the destination either receives all of it or nothing.
			 *
			 * Uses rename(2) when source and destination share a filesystem. On
			 * EXDEV the file is copied to a temporary sibling of the destination,
			 * fsynced and renamed into place, and only then is the source removed.
			 * On failure the source is left untouched and no partial destination
			 * remains.
			 */
			[[nodiscard]] bool MoveFileAtomic(const fs::path& src, const fs::path& dst, Error* err = nullptr);

			// ============================================================================
			// Directory Operations
			// ============================================================================

			/**
			 * @brief Create directory and all parent directories.
			 * @return true on success (or if already exists)
			 */
			[[nodiscard]] bool CreateDirectories(const fs::path& dir, Error* err = nullptr);

			/**
			 * @brief Remove a single file. A missing file is success.
			 */
			[[nodiscard]] bool RemoveFile(const fs::path& path, Error* err = nullptr);

			/**
			 * @brief Recursively remove a directory and all contents.
			 * @warning Cannot be undone - use with caution
			 */
			[[nodiscard]] bool RemoveDirectoryRecursive(const fs::path& dir, Error* err = nullptr);

			/**
			 * @brief Grant the owner rwx on directories and rw on files, recursively.
			 *
			 * Best effort; returns the number of entries whose mode was changed.
			 */
			size_t ClearRestrictivePermissions(const fs::path& root) noexcept;

			/**
			 * @brief List immediate subdirectories (symlinks excluded).
			 */
			[[nodiscard]] bool ListSubdirectories(const fs::path& dir, std::vector<fs::path>& out, Error* err = nullptr);

			/**
			 * @brief Fill an Error from a std::error_code.
			 */
			void SetError(Error* err, const std::error_code& ec, std::string_view context);

			/**
			 * @brief Fill an Error from an errno value.
			 */
			void SetErrno(Error* err, int code, std::string_view context);

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace ShadowVeil
