/*
 * PrivGuard - Process Privilege Management Library
 * Copyright (C) 2026 PrivGuard Contributors
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
 * @brief Thread-safe asynchronous logging system for PrivGuard.
 *
 * Provides logging with:
 * - Asynchronous logging with configurable back-pressure policies
 * - Console and rotating file output
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Native error code decoration for failed OS calls
 * - Scoped logging with timing measurements
 *
 * @note Thread-safe for all public methods.
 * @warning The logging macros are no-ops until Initialize() has been called.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <thread>
#include <vector>

namespace PrivGuard {
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

		/// @brief Lower-case level name ("trace" ... "fatal").
		[[nodiscard]] const wchar_t* LogLevelToString(LogLevel level) noexcept;

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
			bool toConsole = true;          ///< Output to console (stderr)
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::wstring logDirectory = L"logs";          ///< Log file directory
			std::wstring baseFileName = L"PrivGuard";     ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 10;                     ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;       ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;        ///< Level that triggers flush
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
		 *   cfg.logDirectory = L"logs";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   PG_LOG_INFO(L"MyCategory", L"Hello %ls", L"World");
		 *   PG_LOG_NATIVE_ERROR(L"MyCategory", errorCode, L"OpenProcessToken failed");
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
			 * @return Reference to the global Logger instance
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Calling Initialize() on an initialized logger shuts it down first
			 * and re-opens it with the new configuration.
			 *
			 * @param cfg Logger configuration
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 *
			 * Stops the async worker thread and writes remaining messages.
			 */
			void ShutDown();

			/**
			 * @brief Check if logger is initialized.
			 * @return true if initialized, false otherwise
			 */
			[[nodiscard]] bool IsInitialized() const noexcept;

			/**
			 * @brief Set the minimum log level.
			 * @param level New minimum level
			 */
			void setMinimalLevel(LogLevel level) noexcept;

			/**
			 * @brief Check if a log level is enabled.
			 * @param level Level to check
			 * @return true if level would be logged
			 */
			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const wchar_t* category,
			           const wchar_t* file,
			           int line,
			           const wchar_t* function,
			           const wchar_t* format, ...);

			/**
			 * @brief Log a failed native call with its error code and context.
			 */
			void LogNativeErrorEx(LogLevel level,
			                      const wchar_t* category,
			                      const wchar_t* file,
			                      int line,
			                      const wchar_t* function,
			                      uint32_t errorCode,
			                      const wchar_t* contextFormat, ...);

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const wchar_t* category,
			                const std::wstring& message,
			                const wchar_t* file = nullptr,
			                int line = 0,
			                const wchar_t* function = nullptr,
			                uint32_t nativeError = 0);

			/**
			 * @brief Flush all pending log messages.
			 */
			void Flush();

			/**
			 * @brief Convert narrow string to wide string (thread-local buffer).
			 * @param s Narrow string to convert
			 * @return Wide string pointer (thread-local, do not store)
			 */
			[[nodiscard]] static const wchar_t* NarrowToWideTLS(const char* s);

			/**
			 * @brief Format a message with va_list.
			 * @param fmt Format string
			 * @param args Variable arguments
			 * @return Formatted string
			 */
			[[nodiscard]] static std::wstring FormatMessageV(const wchar_t* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const wchar_t* category,
				      const wchar_t* file,
				      int line,
				      const wchar_t* function,
				      const wchar_t* messageOnEnter = L"Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				// Non-copyable, non-movable
				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const wchar_t* m_category;
				// Owned copies: the macro passes short-lived thread-local buffers
				std::wstring m_file;
				std::wstring m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			// Non-copyable singleton
			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			/**
			 * @brief Internal log item structure.
			 */
			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::wstring category;
				std::wstring message;
				std::wstring file;
				std::wstring function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point timestamp{};
				uint32_t nativeError = 0;
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void Write(const LogItem& item);

			void WriteConsoleSink(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::wstring FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::wstring FormatLine(const LogItem& item) const;
			[[nodiscard]] std::wstring FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::wstring EscapeJson(const std::wstring& s);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			void CloseLogFile();
			[[nodiscard]] std::wstring BaseLogPath() const;

			[[nodiscard]] static std::wstring FormatIso8601UTC(std::chrono::system_clock::time_point tp);
			[[nodiscard]] static uint32_t CurrentProcessId() noexcept;
			[[nodiscard]] static uint64_t CurrentThreadId() noexcept;

			// ========================================================================
			// Member Variables
			// ========================================================================

			/// Flag indicating logger is accepting messages
			std::atomic<bool> m_accepting{ false };

			/// Initialization state
			std::atomic<bool> m_initialized{ false };

			/// Current minimum log level
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			/// Logger configuration
			LoggerConfig m_cfg{};

			/// Mutex protecting configuration and sink access
			mutable std::mutex m_cfgMutex;

			/// Log message queue for async mode
			std::deque<LogItem> m_queue;

			/// Mutex protecting queue access
			mutable std::mutex m_queueMutex;

			/// Condition variable for queue signaling
			std::condition_variable m_queueCv;

			/// Async worker thread
			std::thread m_worker;

			/// Stop flag for worker thread
			std::atomic<bool> m_stop{ false };

			/// Log file stream
			std::FILE* m_file{ nullptr };

			/// Current log file size
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace PrivGuard

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// These macros provide convenient logging with automatic source location.
//
// Usage:
//   PG_LOG_INFO(L"Category", L"Message with %d format", value);
//   PG_LOG_ERROR(L"Category", L"Error occurred: %ls", errorMsg);
//   PG_LOG_NATIVE_ERROR(L"Category", code, L"AdjustTokenPrivileges failed");
//   PG_LOG_SCOPE(L"Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define PG_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::PrivGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), \
                ::PrivGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::PrivGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define PG_LOG_TRACE(category, fmt, ...) \
    PG_LOG_AT_LEVEL_(::PrivGuard::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define PG_LOG_DEBUG(category, fmt, ...) \
    PG_LOG_AT_LEVEL_(::PrivGuard::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define PG_LOG_INFO(category, fmt, ...) \
    PG_LOG_AT_LEVEL_(::PrivGuard::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define PG_LOG_WARN(category, fmt, ...) \
    PG_LOG_AT_LEVEL_(::PrivGuard::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define PG_LOG_ERROR(category, fmt, ...) \
    PG_LOG_AT_LEVEL_(::PrivGuard::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define PG_LOG_FATAL(category, fmt, ...) \
    PG_LOG_AT_LEVEL_(::PrivGuard::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

/// @brief Log a native error code with context message
#define PG_LOG_NATIVE_ERROR(category, code, fmt, ...) \
    do { \
        auto& _lg = ::PrivGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::PrivGuard::Utils::LogLevel::Error)) { \
            _lg.LogNativeErrorEx(::PrivGuard::Utils::LogLevel::Error, (category), \
                ::PrivGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::PrivGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), \
                static_cast<uint32_t>(code), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define PG_LOG_CONCAT_INNER_(a, b) a##b
#define PG_LOG_CONCAT_(a, b) PG_LOG_CONCAT_INNER_(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define PG_LOG_SCOPE(category) \
    ::PrivGuard::Utils::Logger::Scope PG_LOG_CONCAT_(_pg_scope_obj_, __LINE__)( \
        (category), \
        ::PrivGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
        ::PrivGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__))
