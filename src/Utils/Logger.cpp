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
#include "Logger.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iostream>
#include <system_error>

#include <unistd.h>

namespace ShadowVeil {
	namespace Utils {

		namespace fs = std::filesystem;

		// ============================================================================
		// Level helpers
		// ============================================================================

		LogLevel ParseLogLevel(std::string_view name) noexcept {
			std::string lower;
			lower.reserve(name.size());
			for (char c : name) {
				lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c));
			}
			if (lower == "trace") return LogLevel::Trace;
			if (lower == "debug") return LogLevel::Debug;
			if (lower == "info") return LogLevel::Info;
			if (lower == "warn" || lower == "warning") return LogLevel::Warn;
			if (lower == "error") return LogLevel::Error;
			if (lower == "fatal" || lower == "critical") return LogLevel::Fatal;
			return LogLevel::Info;
		}

		const char* LogLevelName(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "UNKNOWN";
			}
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			if (m_initialized.load(std::memory_order_acquire)) {
				ShutDown();
			}

			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				m_cfg = cfg;
				if (m_cfg.maxQueueSize == 0) {
					m_cfg.maxQueueSize = 1;
				}
			}
			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			m_stop.store(false, std::memory_order_release);

			if (cfg.toFile) {
				std::lock_guard<std::mutex> lock(m_writeMutex);
				OpenLogFileIfNeeded();
			}

			if (cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_accepting.store(true, std::memory_order_release);
			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}
			m_accepting.store(false, std::memory_order_release);

			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_stop.store(true, std::memory_order_release);
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}
			m_currentSize = 0;
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) {
				return {};
			}

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);
			if (needed <= 0) {
				return {};
			}

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function, 0);
		}

		void Logger::LogErrnoEx(LogLevel level,
		                        const char* category,
		                        const char* file,
		                        int line,
		                        const char* function,
		                        int errorCode,
		                        const char* contextFormat, ...) {
			va_list args;
			va_start(args, contextFormat);
			std::string message = FormatMessageV(contextFormat, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function, errorCode);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function,
		                        int osError) {
			if (!m_accepting.load(std::memory_order_acquire) || !IsEnabled(level)) {
				return;
			}

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			item.ts = std::chrono::system_clock::now();
			item.osError = osError;

			bool async = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async) {
				Enqueue(std::move(item));
			}
			else {
				Write(item);
			}
		}

		void Logger::Flush() {
			if (!m_initialized.load(std::memory_order_acquire)) {
				return;
			}

			// Bounded wait for the worker to drain; a stuck sink must not hang callers.
			const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
			while (m_inFlight.load(std::memory_order_acquire) > 0 &&
			       std::chrono::steady_clock::now() < deadline) {
				m_queueCv.notify_one();
				std::this_thread::sleep_for(std::chrono::milliseconds(1));
			}

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file.is_open()) {
				m_file.flush();
			}
			std::fflush(stderr);
		}

		// ============================================================================
		// Queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);

			size_t maxSize = 0;
			LoggerConfig::BackPressurePolicy policy{};
			{
				std::lock_guard<std::mutex> cfgLock(m_cfgMutex);
				maxSize = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			if (m_queue.size() >= maxSize) {
				switch (policy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lock, [&] {
						return m_queue.size() < maxSize || m_stop.load(std::memory_order_acquire);
					});
					if (m_stop.load(std::memory_order_acquire)) {
						return;
					}
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					m_inFlight.fetch_sub(1, std::memory_order_acq_rel);
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.push_back(std::move(item));
			m_inFlight.fetch_add(1, std::memory_order_acq_rel);
			lock.unlock();
			m_queueCv.notify_one();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::unique_lock<std::mutex> lock(m_queueMutex);
			m_queueCv.wait(lock, [&] {
				return !m_queue.empty() || m_stop.load(std::memory_order_acquire);
			});

			if (m_queue.empty()) {
				return false;
			}

			out = std::move(m_queue.front());
			m_queue.pop_front();
			lock.unlock();
			m_spaceCv.notify_one();
			return true;
		}

		void Logger::WorkerLoop() {
			LogItem item;
			while (Dequeue(item)) {
				Write(item);
				m_inFlight.fetch_sub(1, std::memory_order_acq_rel);
			}
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			bool toConsole = false;
			bool toFile = false;
			bool json = false;
			LogLevel flushLevel = LogLevel::Error;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				toConsole = m_cfg.toConsole;
				toFile = m_cfg.toFile;
				json = m_cfg.jsonLines;
				flushLevel = m_cfg.flushLevel;
			}

			const std::string line = (json ? FormatAsJson(item) : FormatPlain(item)) + "\n";

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (toConsole) {
				WriteConsole(line);
			}
			if (toFile) {
				WriteFile(line);
				if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(flushLevel) && m_file.is_open()) {
					m_file.flush();
				}
			}
		}

		void Logger::WriteConsole(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
		}

		void Logger::WriteFile(const std::string& line) {
			RotateIfNeeded(line.size());
			OpenLogFileIfNeeded();
			if (!m_file.is_open()) {
				return;
			}
			m_file.write(line.data(), static_cast<std::streamsize>(line.size()));
			m_currentSize += line.size();
		}

		std::string Logger::FormatPlain(const LogItem& item) const {
			bool withLocation = true;
			bool withIds = true;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				withLocation = m_cfg.includeSrcLocation;
				withIds = m_cfg.includeProcThreadId;
			}

			std::string out;
			out.reserve(item.message.size() + 96);
			out += FormatIso8601(item.ts);
			out += " [";
			out += LogLevelName(item.level);
			out += "]";
			if (withIds) {
				out += " [" + std::to_string(item.pid) + ":" + std::to_string(item.tid) + "]";
			}
			if (!item.category.empty()) {
				out += " [" + item.category + "]";
			}
			out += " ";
			out += item.message;
			if (item.osError != 0) {
				out += " (errno " + std::to_string(item.osError) + ": " + FormatOsError(item.osError) + ")";
			}
			if (withLocation && !item.file.empty()) {
				out += " @ " + fs::path(item.file).filename().string() + ":" + std::to_string(item.line);
				if (!item.function.empty()) {
					out += " " + item.function;
				}
			}
			return out;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string out = "{";
			out += "\"ts\":\"" + FormatIso8601(item.ts) + "\"";
			out += ",\"level\":\"" + std::string(LogLevelName(item.level)) + "\"";
			out += ",\"category\":\"" + EscapeJson(item.category) + "\"";
			out += ",\"message\":\"" + EscapeJson(item.message) + "\"";
			out += ",\"pid\":" + std::to_string(item.pid);
			out += ",\"tid\":" + std::to_string(item.tid);
			if (!item.file.empty()) {
				out += ",\"file\":\"" + EscapeJson(item.file) + "\"";
				out += ",\"line\":" + std::to_string(item.line);
				out += ",\"function\":\"" + EscapeJson(item.function) + "\"";
			}
			if (item.osError != 0) {
				out += ",\"errno\":" + std::to_string(item.osError);
				out += ",\"errorText\":\"" + EscapeJson(FormatOsError(item.osError)) + "\"";
			}
			out += "}";
			return out;
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 8);
			for (unsigned char c : s) {
				switch (c) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (c < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", c);
						out += buf;
					}
					else {
						out.push_back(static_cast<char>(c));
					}
				}
			}
			return out;
		}

		// ============================================================================
		// File rotation
		// ============================================================================

		std::string Logger::BaseLogPath() const {
			std::lock_guard<std::mutex> lock(m_cfgMutex);
			return (fs::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log")).string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file.is_open()) {
				return;
			}

			std::string dir;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				dir = m_cfg.logDirectory;
			}

			std::error_code ec;
			if (!dir.empty()) {
				fs::create_directories(dir, ec);
			}

			const std::string path = BaseLogPath();
			m_file.open(path, std::ios::out | std::ios::app | std::ios::binary);
			if (!m_file.is_open()) {
				std::fprintf(stderr, "ShadowVeil Logger: cannot open %s\n", path.c_str());
				return;
			}
			m_currentSize = static_cast<uint64_t>(fs::file_size(path, ec));
			if (ec) {
				m_currentSize = 0;
			}
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			uint64_t maxSize = 0;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				maxSize = m_cfg.maxFileSizeBytes;
			}
			if (maxSize == 0 || m_currentSize + nextWriteBytes <= maxSize) {
				return;
			}
			PerformRotation();
		}

		void Logger::PerformRotation() {
			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}

			size_t maxCount = 0;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				maxCount = m_cfg.maxFileCount;
			}

			const std::string base = BaseLogPath();
			std::error_code ec;
			if (maxCount == 0) {
				fs::remove(base, ec);
			}
			else {
				fs::remove(base + "." + std::to_string(maxCount), ec);
				for (size_t i = maxCount; i > 1; --i) {
					const std::string from = base + "." + std::to_string(i - 1);
					if (fs::exists(from, ec)) {
						fs::rename(from, base + "." + std::to_string(i), ec);
					}
				}
				fs::rename(base, base + ".1", ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		// ============================================================================
		// Formatting helpers
		// ============================================================================

		std::string Logger::FormatIso8601(std::chrono::system_clock::time_point ts) const {
			bool utc = true;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				utc = m_cfg.useUtcTime;
			}

			const std::time_t secs = std::chrono::system_clock::to_time_t(ts);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
				ts.time_since_epoch()).count() % 1000;

			std::tm tmv{};
			if (utc) {
				::gmtime_r(&secs, &tmv);
			}
			else {
				::localtime_r(&secs, &tmv);
			}

			char buf[40];
			const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
			std::snprintf(buf + n, sizeof(buf) - n, ".%03lld%s",
			              static_cast<long long>(millis), utc ? "Z" : "");
			return buf;
		}

		std::string Logger::FormatOsError(int err) {
			return std::system_category().message(err);
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter",
				              m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				const auto elapsedUs = std::chrono::duration_cast<std::chrono::microseconds>(
					std::chrono::steady_clock::now() - m_start).count();
				lg.LogMessage(m_level, m_category,
				              "Exit (" + std::to_string(elapsedUs) + " us)",
				              m_file, m_line, m_function);
			}
		}

	}  // namespace Utils
}  // namespace ShadowVeil
