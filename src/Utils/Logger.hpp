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
 * @file Logger.hpp
 * @brief Thread-safe asynchronous logging system for ShadowVeil.
 *
 * Provides:
 * - Asynchronous logging with configurable back-pressure policies
 * - Console (stderr) and rotating file output
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 * - Thread-safe singleton pattern
 *
 * @note Thread-safe for all public methods.
 * @warning Messages logged before Initialize() are discarded.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdarg>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace ShadowVeil {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/**
		 * @brief Parse a level name ("trace", "info", ...). Unknown names yield Info.
		 */
		[[nodiscard]] LogLevel ParseLogLevel(std::string_view name) noexcept;

		/**
		 * @brief Upper-case name of a level ("INFO").
		 */
		[[nodiscard]] const char* LogLevelName(LogLevel level) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to rotating file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool useUtcTime = true;         ///< Use UTC timestamps
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::string logDirectory = "logs";           ///< Log file directory
			std::string baseFileName = "ShadowVeil";     ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 10;                    ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;      ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;       ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   cfg.logDirectory = "/var/log/shadowveil";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   SV_LOG_INFO("Sessions", "Created session %s", id.c_str());
		 *   SV_LOG_ERROR("Sessions", "Error code: %d", 42);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note Call ShutDown() before application exit to flush pending logs.
		 */
		class Logger {
		public:
			/**
			 * @brief Get the singleton Logger instance.
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Re-initializing an initialized logger shuts it down first.
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a POSIX errno value with context.
			 */
			void LogErrnoEx(LogLevel level,
			                const char* category,
			                const char* file,
			                int line,
			                const char* function,
			                int errorCode,
			                const char* contextFormat, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 8, 9)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr,
			                int osError = 0);

			/**
			 * @brief Flush all pending log messages.
			 */
			void Flush();

			/**
			 * @brief Format a message with va_list.
			 */
			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts{};
				int osError = 0;
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void Write(const LogItem& item);

			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::string FormatPlain(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::string BaseLogPath() const;

			[[nodiscard]] std::string FormatIso8601(std::chrono::system_clock::time_point ts) const;
			[[nodiscard]] static std::string FormatOsError(int err);

			// ========================================================================
			// Member Variables
			// ========================================================================

			std::atomic<bool> m_accepting{ false };
			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			std::deque<LogItem> m_queue;
			mutable std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;
			std::thread m_worker;
			std::atomic<bool> m_stop{ false };

			/// Items enqueued but not yet written (Flush waits for zero)
			std::atomic<size_t> m_inFlight{ 0 };

			/// Serializes sink writes (worker thread and synchronous mode)
			std::mutex m_writeMutex;
			std::ofstream m_file;
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace ShadowVeil

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   SV_LOG_INFO("Category", "Message with %d format", value);
//   SV_LOG_ERROR("Category", "Error occurred: %s", msg.c_str());
//   SV_LOG_ERRNO("Category", errno, "open(%s) failed", path.c_str());
//   SV_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define SV_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::ShadowVeil::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __FUNCTION__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define SV_LOG_TRACE(category, fmt, ...) \
    SV_LOG_AT_LEVEL_(::ShadowVeil::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define SV_LOG_DEBUG(category, fmt, ...) \
    SV_LOG_AT_LEVEL_(::ShadowVeil::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define SV_LOG_INFO(category, fmt, ...) \
    SV_LOG_AT_LEVEL_(::ShadowVeil::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define SV_LOG_WARN(category, fmt, ...) \
    SV_LOG_AT_LEVEL_(::ShadowVeil::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define SV_LOG_ERROR(category, fmt, ...) \
    SV_LOG_AT_LEVEL_(::ShadowVeil::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define SV_LOG_FATAL(category, fmt, ...) \
    SV_LOG_AT_LEVEL_(::ShadowVeil::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

/// @brief Log an errno value with context message
#define SV_LOG_ERRNO(category, err, fmt, ...) \
    do { \
        auto& _lg = ::ShadowVeil::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::ShadowVeil::Utils::LogLevel::Error)) { \
            _lg.LogErrnoEx(::ShadowVeil::Utils::LogLevel::Error, (category), \
                __FILE__, __LINE__, __FUNCTION__, (err), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define SV_LOG_CONCAT_INNER_(a, b) a##b
#define SV_LOG_CONCAT_(a, b) SV_LOG_CONCAT_INNER_(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define SV_LOG_SCOPE(category) \
    ::ShadowVeil::Utils::Logger::Scope SV_LOG_CONCAT_(_sv_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __FUNCTION__)
