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
#include "CryptoUtils.hpp"
#include "HashUtils.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace ShadowVeil {
    namespace Utils {
        namespace CryptoUtils {

            namespace {
                void SetOpenSslError(Error* err, const char* context) noexcept {
                    const unsigned long code = ERR_get_error();
                    ERR_clear_error();
                    if (!err) return;
                    err->openssl = code != 0 ? code : 1;
                    try {
                        char buf[256] = {};
                        ERR_error_string_n(err->openssl, buf, sizeof(buf));
                        err->message = buf;
                        err->context = context;
                    }
                    catch (const std::bad_alloc&) {
                    }
                }
            }

            // ============================================================================
            // SecureRandom
            // ============================================================================

            bool SecureRandom::Generate(uint8_t* buffer, size_t size, Error* err) noexcept {
                if (err) err->Clear();
                if (size == 0) return true;
                if (!buffer) {
                    if (err) {
                        err->message = "null output buffer";
                        err->context = "SecureRandom::Generate";
                    }
                    return false;
                }

                size_t offset = 0;
                while (offset < size) {
                    const size_t chunk = std::min(size - offset, MAX_RANDOM_CHUNK);
                    if (RAND_bytes(buffer + offset, static_cast<int>(chunk)) != 1) {
                        SetOpenSslError(err, "RAND_bytes");
                        SV_LOG_ERROR("CryptoUtils", "RAND_bytes failed for %zu bytes", chunk);
                        return false;
                    }
                    offset += chunk;
                }
                return true;
            }

            bool SecureRandom::Generate(std::vector<uint8_t>& out, size_t size, Error* err) noexcept {
                try {
                    out.resize(size);
                }
                catch (const std::bad_alloc&) {
                    if (err) {
                        err->message = "out of memory";
                        err->context = "SecureRandom::Generate";
                    }
                    out.clear();
                    return false;
                }
                if (!Generate(out.data(), size, err)) {
                    out.clear();
                    return false;
                }
                return true;
            }

            std::string SecureRandom::GenerateHex(size_t byteCount, Error* err) noexcept {
                std::vector<uint8_t> bytes;
                if (!Generate(bytes, byteCount, err)) {
                    return {};
                }
                std::string hex;
                try {
                    hex = HashUtils::ToHexLower(bytes);
                }
                catch (const std::bad_alloc&) {
                    if (err) {
                        err->message = "out of memory";
                        err->context = "SecureRandom::GenerateHex";
                    }
                }
                SecureZeroMemory(bytes.data(), bytes.size());
                return hex;
            }

            // ============================================================================
            // Secure Memory
            // ============================================================================

            void SecureZeroMemory(void* ptr, size_t size) noexcept {
                if (ptr && size > 0) {
                    OPENSSL_cleanse(ptr, size);
                }
            }

        } // namespace CryptoUtils
    } // namespace Utils
} // namespace ShadowVeil
