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
 * @file HashUtils.hpp
 * @brief Cryptographic hashing utilities for ShadowVeil.
 *
 * Provides:
 * - SHA-256 through OpenSSL EVP
 * - Streaming hash computation for large data
 * - File hashing with buffered I/O
 * - Hex encoding utilities
 *
 * @warning Thread-safe for independent Hasher instances.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

#include "Logger.hpp"

// Forward declaration keeps <openssl/evp.h> out of dependents.
struct evp_md_ctx_st;

namespace ShadowVeil {
	namespace Utils {
		namespace HashUtils {

			// ============================================================================
			// Security Constants
			// ============================================================================

			/// Maximum file size for single-pass hashing (4GB)
			inline constexpr uint64_t MAX_HASH_FILE_SIZE = 4ULL * 1024 * 1024 * 1024;

			/// Default buffer size for file hashing (1MB)
			inline constexpr size_t FILE_HASH_BUFFER_SIZE = 1 << 20;

			// ============================================================================
			// Types and Enumerations
			// ============================================================================

			/**
			 * @brief Supported cryptographic hash algorithms.
			 */
			enum class Algorithm : uint8_t {
				SHA256      ///< SHA-256 (256-bit)
			};

			/**
			 * @brief Error information structure for hash operations.
			 *
			 * Captures the OpenSSL error queue head and the errno of a failed
			 * file operation.
			 */
			struct Error {
				unsigned long openssl = 0;      ///< ERR_get_error() value (0 = none)
				int sysErrno = 0;               ///< errno from file I/O (0 = none)
				std::string message;            ///< Human-readable description

				[[nodiscard]] bool hasError() const noexcept {
					return openssl != 0 || sysErrno != 0 || !message.empty();
				}

				void clear() noexcept {
					openssl = 0;
					sysErrno = 0;
					message.clear();
				}
			};

			// ============================================================================
			// Comparison Utilities
			// ============================================================================

			/**
			 * @brief Constant-time, case-insensitive comparison of hex digests.
			 */
			[[nodiscard]] bool EqualHex(std::string_view a, std::string_view b) noexcept;

			// ============================================================================
			// Hex Encoding
			// ============================================================================

			/**
			 * @brief Convert binary data to lowercase hexadecimal string.
			 */
			[[nodiscard]] std::string ToHexLower(const uint8_t* data, size_t len);

			[[nodiscard]] inline std::string ToHexLower(const std::vector<uint8_t>& v) {
				return ToHexLower(v.data(), v.size());
			}

			// ============================================================================
			// Algorithm Information
			// ============================================================================

			/**
			 * @brief Get digest size for an algorithm.
			 * @return Digest size in bytes
			 */
			[[nodiscard]] size_t DigestSize(Algorithm alg) noexcept;

			/**
			 * @brief Get display name of an algorithm ("SHA-256", ...).
			 */
			[[nodiscard]] const char* AlgorithmName(Algorithm alg) noexcept;

			// ============================================================================
			// Streaming Hasher Class
			// ============================================================================

			/**
			 * @brief Streaming cryptographic hash computation.
			 *
			 * Usage:
			 * @code
			 *   Hasher h(Algorithm::SHA256);
			 *   if (!h.Init()) return false;
			 *   if (!h.Update(data1, len1)) return false;
			 *   std::string hex;
			 *   if (!h.FinalHex(hex)) return false;
			 * @endcode
			 *
			 * @note Non-copyable, move-only.
			 */
			class Hasher {
			public:
				explicit Hasher(Algorithm alg = Algorithm::SHA256) noexcept;

				~Hasher();

				// Non-copyable
				Hasher(const Hasher&) = delete;
				Hasher& operator=(const Hasher&) = delete;

				// Move operations
				Hasher(Hasher&& other) noexcept;
				Hasher& operator=(Hasher&& other) noexcept;

				/**
				 * @brief Initialize hasher for new computation. Can be called again to reset.
				 */
				[[nodiscard]] bool Init(Error* err = nullptr) noexcept;

				/**
				 * @brief Feed data into the hash computation. Init() must be called first.
				 */
				[[nodiscard]] bool Update(const void* data, size_t len, Error* err = nullptr) noexcept;

				/**
				 * @brief Finalize hash and retrieve digest.
				 *
				 * The hasher can be reused by calling Init() again.
				 */
				[[nodiscard]] bool Final(std::vector<uint8_t>& out, Error* err = nullptr) noexcept;

				/**
				 * @brief Finalize hash and retrieve as lowercase hex string.
				 */
				[[nodiscard]] bool FinalHex(std::string& outHex, Error* err = nullptr) noexcept;

				[[nodiscard]] size_t GetDigestSize() const noexcept { return m_hashLen; }

				[[nodiscard]] Algorithm GetAlgorithm() const noexcept { return m_alg; }

				[[nodiscard]] bool IsInitialized() const noexcept { return m_inited; }

			private:
				evp_md_ctx_st* m_ctx = nullptr;     ///< OpenSSL digest context
				Algorithm m_alg;                    ///< Selected algorithm
				size_t m_hashLen = 0;               ///< Digest size in bytes
				bool m_inited = false;              ///< Initialization state

				void resetState() noexcept;
			};

			// ============================================================================
			// One-Shot Hash Functions
			// ============================================================================

			[[nodiscard]] bool ComputeHex(Algorithm alg, const void* data, size_t len,
			                              std::string& outHex, Error* err = nullptr) noexcept;

			[[nodiscard]] inline bool ComputeHex(Algorithm alg, std::string_view data,
			                                     std::string& outHex, Error* err = nullptr) noexcept {
				return ComputeHex(alg, data.data(), data.size(), outHex, err);
			}

			// ============================================================================
			// File Hashing
			// ============================================================================

			/**
			 * @brief Compute hash of file contents.
			 *
			 * Reads the file in FILE_HASH_BUFFER_SIZE chunks. Files larger than
			 * MAX_HASH_FILE_SIZE are rejected.
			 *
			 * @param bytesRead Optional output: number of bytes hashed
			 */
			[[nodiscard]] bool ComputeFile(Algorithm alg, const std::filesystem::path& path,
			                               std::vector<uint8_t>& out, Error* err = nullptr,
			                               uint64_t* bytesRead = nullptr) noexcept;

			[[nodiscard]] bool ComputeFileHex(Algorithm alg, const std::filesystem::path& path,
			                                  std::string& outHex, Error* err = nullptr,
			                                  uint64_t* bytesRead = nullptr) noexcept;

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace ShadowVeil
