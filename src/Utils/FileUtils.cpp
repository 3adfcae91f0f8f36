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
#include "FileUtils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ShadowVeil {
	namespace Utils {
		namespace FileUtils {

			namespace {

				/// Closes a POSIX descriptor on scope exit.
				class ScopedFd {
				public:
					explicit ScopedFd(int fd = -1) noexcept : m_fd(fd) {}
					~ScopedFd() { reset(); }

					ScopedFd(const ScopedFd&) = delete;
					ScopedFd& operator=(const ScopedFd&) = delete;

					[[nodiscard]] int get() const noexcept { return m_fd; }
					[[nodiscard]] bool valid() const noexcept { return m_fd >= 0; }

					/// Close explicitly and report the close() result.
					bool close() noexcept {
						if (m_fd < 0) return true;
						const int rc = ::close(m_fd);
						m_fd = -1;
						return rc == 0;
					}

					void reset() noexcept { (void)close(); }

				private:
					int m_fd;
				};

				std::chrono::system_clock::time_point ToTimePoint(const struct timespec& ts) {
					return std::chrono::system_clock::from_time_t(ts.tv_sec) +
						std::chrono::duration_cast<std::chrono::system_clock::duration>(
							std::chrono::nanoseconds(ts.tv_nsec));
				}

				bool WriteAll(int fd, const uint8_t* data, size_t len) noexcept {
					size_t written = 0;
					while (written < len) {
						const ssize_t n = ::write(fd, data + written, len - written);
						if (n < 0) {
							if (errno == EINTR) continue;
							return false;
						}
						written += static_cast<size_t>(n);
					}
					return true;
				}

				bool CopyToTempAndRename(const fs::path& src, const fs::path& dst, Error* err) {
					ScopedFd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
					if (!in.valid()) {
						SetErrno(err, errno, "open source " + src.string());
						return false;
					}

					struct stat st {};
					if (::fstat(in.get(), &st) != 0) {
						SetErrno(err, errno, "fstat " + src.string());
						return false;
					}

					const fs::path tmp = dst.parent_path() /
						("." + dst.filename().string() + ".sv-partial-" + std::to_string(::getpid()));

					ScopedFd out(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, st.st_mode & 0777));
					if (!out.valid()) {
						SetErrno(err, errno, "create temp " + tmp.string());
						return false;
					}

					auto abandon = [&](int code, const std::string& context) {
						out.reset();
						::unlink(tmp.c_str());
						SetErrno(err, code, context);
						return false;
					};

					std::vector<uint8_t> buffer(COPY_BUFFER_SIZE);
					for (;;) {
						const ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
						if (n < 0) {
							if (errno == EINTR) continue;
							return abandon(errno, "read " + src.string());
						}
						if (n == 0) break;
						if (!WriteAll(out.get(), buffer.data(), static_cast<size_t>(n))) {
							return abandon(errno, "write " + tmp.string());
						}
					}

					if (::fsync(out.get()) != 0) {
						return abandon(errno, "fsync " + tmp.string());
					}
					if (!out.close()) {
						return abandon(errno, "close " + tmp.string());
					}
					if (::rename(tmp.c_str(), dst.c_str()) != 0) {
						return abandon(errno, "rename into " + dst.string());
					}

					if (::unlink(src.c_str()) != 0) {
						// Keep all-or-nothing: take the copy back out so only the source remains.
						const int code = errno;
						::unlink(dst.c_str());
						SetErrno(err, code, "unlink source " + src.string());
						return false;
					}
					return true;
				}

			}  // namespace

			// ============================================================================
			// Error helpers
			// ============================================================================

			void SetError(Error* err, const std::error_code& ec, std::string_view context) {
				if (!err) return;
				err->code = ec.value() != 0 ? ec.value() : EIO;
				err->message = std::string(context) + ": " + ec.message();
			}

			void SetErrno(Error* err, int code, std::string_view context) {
				if (!err) return;
				err->code = code != 0 ? code : EIO;
				err->message = std::string(context) + ": " + std::system_category().message(err->code);
			}

			// ============================================================================
			// Path Helpers
			// ============================================================================

			bool IsPathUnderRoot(const fs::path& path, const fs::path& root, Error* err) {
				std::error_code ec;
				const fs::path p = fs::weakly_canonical(fs::absolute(path, ec), ec);
				if (ec) {
					SetError(err, ec, "canonicalize " + path.string());
					return false;
				}
				const fs::path r = fs::weakly_canonical(fs::absolute(root, ec), ec);
				if (ec) {
					SetError(err, ec, "canonicalize " + root.string());
					return false;
				}

				auto pit = p.begin();
				for (auto rit = r.begin(); rit != r.end(); ++rit) {
					if (rit->empty()) continue;  // trailing separator
					if (pit == p.end() || *pit != *rit) {
						return false;
					}
					++pit;
				}
				return true;
			}

			std::string SanitizeFileName(std::string_view name) {
				const size_t slash = name.find_last_of("/\\");
				if (slash != std::string_view::npos) {
					name = name.substr(slash + 1);
				}

				std::string out;
				out.reserve(name.size());
				for (char c : name) {
					const auto uc = static_cast<unsigned char>(c);
					if (uc < 0x20 || uc == 0x7F || c == ':' || c == '*' || c == '?' ||
					    c == '"' || c == '<' || c == '>' || c == '|') {
						continue;
					}
					out.push_back(c);
				}

				size_t lead = 0;
				while (lead < out.size() && (out[lead] == '.' || out[lead] == ' ')) ++lead;
				out.erase(0, lead);
				while (!out.empty() && (out.back() == '.' || out.back() == ' ')) {
					out.pop_back();
				}

				constexpr size_t kMaxComponent = 200;
				if (out.size() > kMaxComponent) {
					const size_t dot = out.find_last_of('.');
					if (dot != std::string::npos && out.size() - dot <= 16) {
						const std::string ext = out.substr(dot);
						out = out.substr(0, kMaxComponent - ext.size()) + ext;
					}
					else {
						out.resize(kMaxComponent);
					}
				}
				return out;
			}

			// ============================================================================
			// File Existence and Status
			// ============================================================================

			bool Exists(const fs::path& path, Error* err) {
				std::error_code ec;
				const bool exists = fs::exists(fs::symlink_status(path, ec));
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetError(err, ec, "stat " + path.string());
					return false;
				}
				return exists;
			}

			bool IsDirectory(const fs::path& path, Error* err) {
				std::error_code ec;
				const bool isDir = fs::is_directory(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetError(err, ec, "stat " + path.string());
					return false;
				}
				return isDir;
			}

			bool Stat(const fs::path& path, FileStat& out, Error* err) {
				out = FileStat{};
				struct stat st {};
				if (::lstat(path.c_str(), &st) != 0) {
					if (errno == ENOENT || errno == ENOTDIR) {
						return true;
					}
					SetErrno(err, errno, "lstat " + path.string());
					return false;
				}

				out.exists = true;
				out.isDirectory = S_ISDIR(st.st_mode);
				out.isRegularFile = S_ISREG(st.st_mode);
				out.isSymlink = S_ISLNK(st.st_mode);
				out.size = static_cast<uint64_t>(st.st_size);
				out.mode = static_cast<uint32_t>(st.st_mode);
				out.changeTime = ToTimePoint(st.st_ctim);
				out.lastWrite = ToTimePoint(st.st_mtim);
				return true;
			}

			// ============================================================================
			// File Reading/Writing
			// ============================================================================

			bool ReadAllTextUtf8(const fs::path& path, std::string& out, Error* err) {
				out.clear();
				ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
				if (!fd.valid()) {
					SetErrno(err, errno, "open " + path.string());
					return false;
				}

				struct stat st {};
				if (::fstat(fd.get(), &st) != 0) {
					SetErrno(err, errno, "fstat " + path.string());
					return false;
				}
				if (static_cast<uint64_t>(st.st_size) > MAX_READ_FILE_SIZE) {
					SetErrno(err, EFBIG, "read " + path.string());
					return false;
				}

				out.reserve(static_cast<size_t>(st.st_size));
				char buf[16 * 1024];
				for (;;) {
					const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
					if (n < 0) {
						if (errno == EINTR) continue;
						SetErrno(err, errno, "read " + path.string());
						out.clear();
						return false;
					}
					if (n == 0) break;
					out.append(buf, static_cast<size_t>(n));
					if (out.size() > MAX_READ_FILE_SIZE) {
						SetErrno(err, EFBIG, "read " + path.string());
						out.clear();
						return false;
					}
				}

				// Strip UTF-8 BOM
				if (out.size() >= 3 && static_cast<unsigned char>(out[0]) == 0xEF &&
				    static_cast<unsigned char>(out[1]) == 0xBB && static_cast<unsigned char>(out[2]) == 0xBF) {
					out.erase(0, 3);
				}
				return true;
			}

			bool WriteAllTextUtf8Atomic(const fs::path& path, std::string_view utf8, Error* err) {
				if (path.has_parent_path() && !CreateDirectories(path.parent_path(), err)) {
					return false;
				}

				const fs::path tmp = path.parent_path() /
					("." + path.filename().string() + ".tmp-" + std::to_string(::getpid()));

				ScopedFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
				if (!fd.valid()) {
					SetErrno(err, errno, "create " + tmp.string());
					return false;
				}

				if (!WriteAll(fd.get(), reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size()) ||
				    ::fsync(fd.get()) != 0) {
					const int code = errno;
					fd.reset();
					::unlink(tmp.c_str());
					SetErrno(err, code, "write " + tmp.string());
					return false;
				}
				if (!fd.close()) {
					const int code = errno;
					::unlink(tmp.c_str());
					SetErrno(err, code, "close " + tmp.string());
					return false;
				}
				if (::rename(tmp.c_str(), path.c_str()) != 0) {
					const int code = errno;
					::unlink(tmp.c_str());
					SetErrno(err, code, "rename " + path.string());
					return false;
				}
				return true;
			}

			bool OverwriteInPlace(const fs::path& path, const uint8_t* data, size_t len, Error* err) {
				ScopedFd fd(::open(path.c_str(), O_WRONLY | O_CLOEXEC | O_NOFOLLOW));
				if (!fd.valid()) {
					SetErrno(err, errno, "open for overwrite " + path.string());
					return false;
				}
				if (len > 0 && !WriteAll(fd.get(), data, len)) {
					SetErrno(err, errno, "overwrite " + path.string());
					return false;
				}
				if (::fsync(fd.get()) != 0) {
					SetErrno(err, errno, "fsync " + path.string());
					return false;
				}
				if (!fd.close()) {
					SetErrno(err, errno, "close " + path.string());
					return false;
				}
				return true;
			}

			// ============================================================================
			// Atomic Operations
			// ============================================================================

			bool MoveFileAtomic(const fs::path& src, const fs::path& dst, Error* err) {
				if (::rename(src.c_str(), dst.c_str()) == 0) {
					return true;
				}
				if (errno != EXDEV) {
					SetErrno(err, errno, "rename " + src.string() + " -> " + dst.string());
					return false;
				}

				SV_LOG_DEBUG("FileUtils", "Cross-device move, copying %s -> %s",
				             src.c_str(), dst.c_str());
				return CopyToTempAndRename(src, dst, err);
			}

			// ============================================================================
			// Directory Operations
			// ============================================================================

			bool CreateDirectories(const fs::path& dir, Error* err) {
				std::error_code ec;
				fs::create_directories(dir, ec);
				if (ec) {
					SetError(err, ec, "create_directories " + dir.string());
					return false;
				}
				if (!fs::is_directory(dir, ec)) {
					SetErrno(err, ENOTDIR, "create_directories " + dir.string());
					return false;
				}
				return true;
			}

			bool RemoveFile(const fs::path& path, Error* err) {
				if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
					SetErrno(err, errno, "unlink " + path.string());
					return false;
				}
				return true;
			}

			bool RemoveDirectoryRecursive(const fs::path& dir, Error* err) {
				std::error_code ec;
				fs::remove_all(dir, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetError(err, ec, "remove_all " + dir.string());
					return false;
				}
				return true;
			}

			size_t ClearRestrictivePermissions(const fs::path& root) noexcept {
				size_t changed = 0;
				try {
					std::error_code ec;
					auto grant = [&](const fs::path& p, bool isDir) {
						const auto wanted = isDir
							? (fs::perms::owner_all)
							: (fs::perms::owner_read | fs::perms::owner_write);
						std::error_code pec;
						fs::permissions(p, wanted, fs::perm_options::add, pec);
						if (!pec) ++changed;
					};

					if (!fs::is_directory(fs::symlink_status(root, ec))) {
						if (fs::exists(fs::symlink_status(root, ec))) grant(root, false);
						return changed;
					}

					// Parents first so that children become reachable.
					grant(root, true);
					fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
					const fs::recursive_directory_iterator end;
					while (!ec && it != end) {
						const auto st = it->symlink_status(ec);
						if (!ec && !fs::is_symlink(st)) {
							grant(it->path(), fs::is_directory(st));
						}
						it.increment(ec);
					}
				}
				catch (const std::exception& e) {
					SV_LOG_WARN("FileUtils", "ClearRestrictivePermissions(%s): %s", root.c_str(), e.what());
				}
				return changed;
			}

			bool ListSubdirectories(const fs::path& dir, std::vector<fs::path>& out, Error* err) {
				out.clear();
				std::error_code ec;
				fs::directory_iterator it(dir, ec);
				if (ec) {
					SetError(err, ec, "opendir " + dir.string());
					return false;
				}
				const fs::directory_iterator end;
				for (; it != end; it.increment(ec)) {
					if (ec) {
						SetError(err, ec, "readdir " + dir.string());
						return false;
					}
					std::error_code sec;
					const auto st = it->symlink_status(sec);
					if (!sec && fs::is_directory(st)) {
						out.push_back(it->path());
					}
				}
				if (ec) {
					SetError(err, ec, "readdir " + dir.string());
					return false;
				}
				return true;
			}

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace ShadowVeil
