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
#include "HashUtils.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace ShadowVeil {
	namespace Utils {
		namespace HashUtils {

			namespace {

				const EVP_MD* ResolveMd(Algorithm alg) noexcept {
					switch (alg) {
					case Algorithm::SHA256: return EVP_sha256();
					}
					return nullptr;
				}

				void SetOpenSslError(Error* err, const char* what) noexcept {
					const unsigned long code = ERR_get_error();
					ERR_clear_error();
					if (!err) return;
					err->openssl = code != 0 ? code : 1;
					try {
						char buf[256] = {};
						if (code != 0) {
							ERR_error_string_n(code, buf, sizeof(buf));
							err->message = std::string(what) + ": " + buf;
						}
						else {
							err->message = what;
						}
					}
					catch (const std::bad_alloc&) {
						// message stays empty; the code is still set
					}
				}

				void SetSysError(Error* err, int code, const std::string& context) noexcept {
					if (!err) return;
					err->sysErrno = code != 0 ? code : EIO;
					try {
						err->message = context + ": " + std::strerror(err->sysErrno);
					}
					catch (const std::bad_alloc&) {
					}
				}

				inline char HexDigit(uint8_t v) noexcept {
					return static_cast<char>(v < 10 ? '0' + v : 'a' + (v - 10));
				}

				inline int HexValue(char c) noexcept {
					if (c >= '0' && c <= '9') return c - '0';
					if (c >= 'a' && c <= 'f') return c - 'a' + 10;
					if (c >= 'A' && c <= 'F') return c - 'A' + 10;
					return -1;
				}

			}  // namespace

			// ============================================================================
			// Comparison / Hex
			// ============================================================================

			bool EqualHex(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) return false;
				unsigned diff = 0;
				for (size_t i = 0; i < a.size(); ++i) {
					const int va = HexValue(a[i]);
					const int vb = HexValue(b[i]);
					diff |= static_cast<unsigned>(va ^ vb);
					diff |= static_cast<unsigned>(va < 0 || vb < 0);
				}
				return diff == 0;
			}

			std::string ToHexLower(const uint8_t* data, size_t len) {
				std::string out;
				if (!data || len == 0) return out;
				out.resize(len * 2);
				for (size_t i = 0; i < len; ++i) {
					out[2 * i] = HexDigit(static_cast<uint8_t>(data[i] >> 4));
					out[2 * i + 1] = HexDigit(static_cast<uint8_t>(data[i] & 0x0F));
				}
				return out;
			}

			size_t DigestSize(Algorithm alg) noexcept {
				switch (alg) {
				case Algorithm::SHA256: return 32;
				}
				return 0;
			}

			const char* AlgorithmName(Algorithm alg) noexcept {
				switch (alg) {
				case Algorithm::SHA256: return "SHA-256";
				}
				return "Unknown";
			}

			// ============================================================================
			// Hasher
			// ============================================================================

			Hasher::Hasher(Algorithm alg) noexcept
				: m_alg(alg), m_hashLen(DigestSize(alg)) {
			}

			Hasher::~Hasher() {
				resetState();
			}

			Hasher::Hasher(Hasher&& other) noexcept
				: m_ctx(other.m_ctx), m_alg(other.m_alg), m_hashLen(other.m_hashLen), m_inited(other.m_inited) {
				other.m_ctx = nullptr;
				other.m_inited = false;
			}

			Hasher& Hasher::operator=(Hasher&& other) noexcept {
				if (this != &other) {
					resetState();
					m_ctx = other.m_ctx;
					m_alg = other.m_alg;
					m_hashLen = other.m_hashLen;
					m_inited = other.m_inited;
					other.m_ctx = nullptr;
					other.m_inited = false;
				}
				return *this;
			}

			void Hasher::resetState() noexcept {
				if (m_ctx) {
					EVP_MD_CTX_free(m_ctx);
					m_ctx = nullptr;
				}
				m_inited = false;
			}

			bool Hasher::Init(Error* err) noexcept {
				if (err) err->clear();

				const EVP_MD* md = ResolveMd(m_alg);
				if (!md) {
					if (err) err->message = "unsupported algorithm";
					return false;
				}

				if (!m_ctx) {
					m_ctx = EVP_MD_CTX_new();
					if (!m_ctx) {
						SetOpenSslError(err, "EVP_MD_CTX_new");
						return false;
					}
				}

				if (EVP_DigestInit_ex(m_ctx, md, nullptr) != 1) {
					SetOpenSslError(err, "EVP_DigestInit_ex");
					resetState();
					return false;
				}
				m_inited = true;
				return true;
			}

			bool Hasher::Update(const void* data, size_t len, Error* err) noexcept {
				if (!m_inited) {
					if (err) err->message = "hasher not initialized";
					return false;
				}
				if (len == 0) return true;
				if (!data) {
					if (err) err->message = "null input buffer";
					return false;
				}
				if (EVP_DigestUpdate(m_ctx, data, len) != 1) {
					SetOpenSslError(err, "EVP_DigestUpdate");
					m_inited = false;
					return false;
				}
				return true;
			}

			bool Hasher::Final(std::vector<uint8_t>& out, Error* err) noexcept {
				out.clear();
				if (!m_inited) {
					if (err) err->message = "hasher not initialized";
					return false;
				}

				unsigned char digest[EVP_MAX_MD_SIZE];
				unsigned int digestLen = 0;
				const int rc = EVP_DigestFinal_ex(m_ctx, digest, &digestLen);
				m_inited = false;
				if (rc != 1) {
					SetOpenSslError(err, "EVP_DigestFinal_ex");
					return false;
				}

				try {
					out.assign(digest, digest + digestLen);
				}
				catch (const std::bad_alloc&) {
					if (err) err->sysErrno = ENOMEM;
					return false;
				}
				OPENSSL_cleanse(digest, sizeof(digest));
				return true;
			}

			bool Hasher::FinalHex(std::string& outHex, Error* err) noexcept {
				outHex.clear();
				std::vector<uint8_t> digest;
				if (!Final(digest, err)) {
					return false;
				}
				try {
					outHex = ToHexLower(digest);
				}
				catch (const std::bad_alloc&) {
					if (err) err->sysErrno = ENOMEM;
					return false;
				}
				return true;
			}

			// ============================================================================
			// One-Shot Hash Functions
			// ============================================================================

			bool ComputeHex(Algorithm alg, const void* data, size_t len,
			                std::string& outHex, Error* err) noexcept {
				Hasher h(alg);
				return h.Init(err) && h.Update(data, len, err) && h.FinalHex(outHex, err);
			}

			// ============================================================================
			// File Hashing
			// ============================================================================

			bool ComputeFile(Algorithm alg, const std::filesystem::path& path,
			                 std::vector<uint8_t>& out, Error* err, uint64_t* bytesRead) noexcept {
				out.clear();
				if (bytesRead) *bytesRead = 0;

				const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
				if (fd < 0) {
					SetSysError(err, errno, "open " + path.string());
					return false;
				}

				struct stat st {};
				if (::fstat(fd, &st) != 0) {
					SetSysError(err, errno, "fstat " + path.string());
					::close(fd);
					return false;
				}
				if (!S_ISREG(st.st_mode)) {
					SetSysError(err, EINVAL, "not a regular file " + path.string());
					::close(fd);
					return false;
				}
				if (static_cast<uint64_t>(st.st_size) > MAX_HASH_FILE_SIZE) {
					SetSysError(err, EFBIG, "hash " + path.string());
					::close(fd);
					return false;
				}

#ifdef POSIX_FADV_SEQUENTIAL
				(void)::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif

				Hasher h(alg);
				if (!h.Init(err)) {
					::close(fd);
					return false;
				}

				std::vector<uint8_t> buffer;
				try {
					buffer.resize(FILE_HASH_BUFFER_SIZE);
				}
				catch (const std::bad_alloc&) {
					SetSysError(err, ENOMEM, "allocate hash buffer");
					::close(fd);
					return false;
				}

				uint64_t total = 0;
				for (;;) {
					const ssize_t n = ::read(fd, buffer.data(), buffer.size());
					if (n < 0) {
						if (errno == EINTR) continue;
						SetSysError(err, errno, "read " + path.string());
						::close(fd);
						return false;
					}
					if (n == 0) break;
					if (!h.Update(buffer.data(), static_cast<size_t>(n), err)) {
						::close(fd);
						return false;
					}
					total += static_cast<uint64_t>(n);
					if (total > MAX_HASH_FILE_SIZE) {
						SetSysError(err, EFBIG, "hash " + path.string());
						::close(fd);
						return false;
					}
				}
				::close(fd);

				if (!h.Final(out, err)) {
					return false;
				}
				if (bytesRead) *bytesRead = total;
				return true;
			}

			bool ComputeFileHex(Algorithm alg, const std::filesystem::path& path,
			                    std::string& outHex, Error* err, uint64_t* bytesRead) noexcept {
				outHex.clear();
				std::vector<uint8_t> digest;
				if (!ComputeFile(alg, path, digest, err, bytesRead)) {
					return false;
				}
				try {
					outHex = ToHexLower(digest);
				}
				catch (const std::bad_alloc&) {
					SetSysError(err, ENOMEM, "hex encode");
					return false;
				}
				return true;
			}

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace ShadowVeil
