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
 * @file CryptoUtils.hpp
 * @brief Cryptographic random generation for ShadowVeil
 *
 * Provides:
 * - Secure random number generation (OpenSSL RAND_bytes)
 * - Random identifiers in lowercase hex
 * - Secure memory wiping
 *
 * @note Thread Safety: RAND_bytes is thread-safe; a SecureRandom instance
 *       holds no mutable state and may be shared.
 */

#pragma once

// ============================================================================
// Standard Library Headers
// ============================================================================
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "Logger.hpp"

namespace ShadowVeil {
    namespace Utils {
        namespace CryptoUtils {

            // ============================================================================
            // Constants
            // ============================================================================

            /// Largest single request passed to RAND_bytes (it takes an int length)
            inline constexpr size_t MAX_RANDOM_CHUNK = 1u << 30;

            // ============================================================================
            // Error Handling
            // ============================================================================

            /**
             * @brief Error information for cryptographic operations
             */
            struct Error {
                unsigned long openssl = 0;         ///< ERR_get_error() value
                std::string message;               ///< Human-readable error message
                std::string context;               ///< Operation context where error occurred

                /**
                 * @brief Check if an error occurred
                 */
                [[nodiscard]] bool HasError() const noexcept {
                    return openssl != 0 || !message.empty();
                }

                /**
                 * @brief Reset error state to success
                 */
                void Clear() noexcept {
                    openssl = 0;
                    message.clear();
                    context.clear();
                }
            };

            // ============================================================================
            // Secure Random Number Generator
            // ============================================================================

            /**
             * @brief Cryptographically secure random number generator
             *
             * Backed by the OpenSSL DRBG, seeded from the operating system.
             *
             * Example:
             * @code
             * SecureRandom rng;
             * std::string id = rng.GenerateHex(16);
             * @endcode
             */
            class SecureRandom {
            public:
                SecureRandom() noexcept = default;
                ~SecureRandom() = default;

                SecureRandom(const SecureRandom&) = delete;
                SecureRandom& operator=(const SecureRandom&) = delete;

                /**
                 * @brief Generate random bytes into a raw buffer
                 * @param buffer Output buffer (must be valid and sized >= size)
                 * @param size Number of bytes to generate
                 * @param err Optional error output
                 * @return true on success, false on failure
                 */
                [[nodiscard]] bool Generate(uint8_t* buffer, size_t size, Error* err = nullptr) noexcept;

                /**
                 * @brief Generate random bytes into a vector (resized to size)
                 */
                [[nodiscard]] bool Generate(std::vector<uint8_t>& out, size_t size, Error* err = nullptr) noexcept;

                /**
                 * @brief Generate random bytes and encode as lowercase hex
                 * @param byteCount Number of random bytes (output is 2x characters)
                 * @return Hex string (empty on failure)
                 */
                [[nodiscard]] std::string GenerateHex(size_t byteCount, Error* err = nullptr) noexcept;
            };

            // ============================================================================
            // Secure Memory
            // ============================================================================

            /**
             * @brief Zero memory in a way the optimizer cannot elide
             */
            void SecureZeroMemory(void* ptr, size_t size) noexcept;

        } // namespace CryptoUtils
    } // namespace Utils
} // namespace ShadowVeil
