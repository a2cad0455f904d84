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
#include "pch.h"
#include "Logger.hpp"
#include "StringUtils.hpp"

#include <cwchar>
#include <ctime>
#include <filesystem>
#include <functional>

#ifndef _WIN32
#  include <unistd.h>
#endif

namespace PrivGuard {
	namespace Utils {

		// ============================================================================
		// Internal Constants
		// ============================================================================

		namespace {
			/// Initial buffer for message formatting; grows on demand
			constexpr size_t kInitialFormatBuffer = 512;

			/// Hard cap for a single formatted message (1MB of characters)
			constexpr size_t kMaxFormatBuffer = 1024 * 1024;

			/// Number of thread-local conversion slots for NarrowToWideTLS
			constexpr size_t kTlsSlots = 4;
		}

		const wchar_t* LogLevelToString(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return L"trace";
			case LogLevel::Debug: return L"debug";
			case LogLevel::Info:  return L"info";
			case LogLevel::Warn:  return L"warn";
			case LogLevel::Error: return L"error";
			case LogLevel::Fatal: return L"fatal";
			}
			return L"unknown";
		}

		// ============================================================================
		// Singleton & Lifecycle
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
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
				if (m_cfg.toFile) {
					OpenLogFileIfNeeded();
				}
			}

			m_stop.store(false, std::memory_order_release);
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
			{
				// Enqueue re-checks m_accepting under this lock, so nothing lands after the drain
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_accepting.store(false, std::memory_order_release);
				m_stop.store(true, std::memory_order_release);
			}
			m_queueCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Drain anything enqueued after the worker exited
			LogItem item;
			while (Dequeue(item)) {
				Write(item);
			}

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			CloseLogFile();
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
		// Logging Entry Points
		// ============================================================================

		void Logger::LogEx(LogLevel level,
		                   const wchar_t* category,
		                   const wchar_t* file,
		                   int line,
		                   const wchar_t* function,
		                   const wchar_t* format, ...) {
			if (!IsEnabled(level) || format == nullptr) {
				return;
			}

			va_list args;
			va_start(args, format);
			std::wstring message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function, 0);
		}

		void Logger::LogNativeErrorEx(LogLevel level,
		                              const wchar_t* category,
		                              const wchar_t* file,
		                              int line,
		                              const wchar_t* function,
		                              uint32_t errorCode,
		                              const wchar_t* contextFormat, ...) {
			if (!IsEnabled(level)) {
				return;
			}

			std::wstring message;
			if (contextFormat != nullptr) {
				va_list args;
				va_start(args, contextFormat);
				message = FormatMessageV(contextFormat, args);
				va_end(args);
			}

			LogMessage(level, category, message, file, line, function, errorCode);
		}

		void Logger::LogMessage(LogLevel level,
		                        const wchar_t* category,
		                        const std::wstring& message,
		                        const wchar_t* file,
		                        int line,
		                        const wchar_t* function,
		                        uint32_t nativeError) {
			if (!m_accepting.load(std::memory_order_acquire) || !IsEnabled(level)) {
				return;
			}

			LogItem item;
			item.level = level;
			item.category = category ? category : L"";
			item.message = message;
			item.file = file ? file : L"";
			item.function = function ? function : L"";
			item.line = line;
			item.pid = CurrentProcessId();
			item.tid = CurrentThreadId();
			item.timestamp = std::chrono::system_clock::now();
			item.nativeError = nativeError;

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
			bool async = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async) {
				// Wait for the worker to drain the queue
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_queueCv.wait(lock, [this] { return m_queue.empty() || m_stop.load(std::memory_order_acquire); });
			}

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			std::fflush(stderr);
			if (m_file != nullptr) {
				std::fflush(m_file);
			}
		}

		// ============================================================================
		// Formatting Helpers
		// ============================================================================

		const wchar_t* Logger::NarrowToWideTLS(const char* s) {
			// Several conversions may be alive in one macro expansion (file and function)
			thread_local std::wstring buffers[kTlsSlots];
			thread_local size_t next = 0;

			std::wstring& buf = buffers[next];
			next = (next + 1) % kTlsSlots;

			buf.clear();
			if (s != nullptr) {
				buf = StringUtils::StringToWString(s);
			}
			return buf.c_str();
		}

		std::wstring Logger::FormatMessageV(const wchar_t* fmt, va_list args) {
			if (fmt == nullptr) {
				return {};
			}

			std::wstring buffer(kInitialFormatBuffer, L'\0');
			while (true) {
				va_list copy;
				va_copy(copy, args);
				const int written = std::vswprintf(buffer.data(), buffer.size(), fmt, copy);
				va_end(copy);

				if (written >= 0 && static_cast<size_t>(written) < buffer.size()) {
					buffer.resize(static_cast<size_t>(written));
					return buffer;
				}
				if (buffer.size() >= kMaxFormatBuffer) {
					// Keep what fits instead of dropping the message entirely
					buffer.resize(std::wcslen(buffer.c_str()));
					buffer.append(L"...[truncated]");
					return buffer;
				}
				buffer.resize(buffer.size() * 2, L'\0');
			}
		}

		std::wstring Logger::FormatIso8601UTC(std::chrono::system_clock::time_point tp) {
			const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
			const std::time_t t = std::chrono::system_clock::to_time_t(secs);

			std::tm utc{};
#ifdef _WIN32
			gmtime_s(&utc, &t);
#else
			gmtime_r(&t, &utc);
#endif
			wchar_t buf[40] = {};
			std::swprintf(buf, sizeof(buf) / sizeof(buf[0]), L"%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
			              utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
			              utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
			return buf;
		}

		std::wstring Logger::FormatPrefix(const LogItem& item) const {
			std::wstring prefix;
			prefix.reserve(128);
			prefix += FormatIso8601UTC(item.timestamp);
			prefix += L" [";
			prefix += LogLevelToString(item.level);
			prefix += L"]";

			if (m_cfg.includeProcThreadId) {
				prefix += L" [" + std::to_wstring(item.pid) + L":" + std::to_wstring(item.tid) + L"]";
			}
			if (!item.category.empty()) {
				prefix += L" [" + item.category + L"]";
			}
			return prefix;
		}

		std::wstring Logger::FormatLine(const LogItem& item) const {
			std::wstring line = FormatPrefix(item);
			line += L" ";
			line += item.message;

			if (item.nativeError != 0) {
				line += L" (native error " + std::to_wstring(item.nativeError) + L")";
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				line += L" @ " + item.file + L":" + std::to_wstring(item.line);
				if (!item.function.empty()) {
					line += L" (" + item.function + L")";
				}
			}
			return line;
		}

		std::wstring Logger::EscapeJson(const std::wstring& s) {
			std::wstring out;
			out.reserve(s.size() + 8);
			for (const wchar_t c : s) {
				switch (c) {
				case L'"':  out += L"\\\""; break;
				case L'\\': out += L"\\\\"; break;
				case L'\b': out += L"\\b"; break;
				case L'\f': out += L"\\f"; break;
				case L'\n': out += L"\\n"; break;
				case L'\r': out += L"\\r"; break;
				case L'\t': out += L"\\t"; break;
				default:
					if (static_cast<uint32_t>(c) < 0x20) {
						wchar_t esc[8] = {};
						std::swprintf(esc, 8, L"\\u%04x", static_cast<unsigned>(c));
						out += esc;
					}
					else {
						out.push_back(c);
					}
				}
			}
			return out;
		}

		std::wstring Logger::FormatAsJson(const LogItem& item) const {
			std::wstring json;
			json.reserve(256);
			json += L"{\"ts\":\"" + FormatIso8601UTC(item.timestamp) + L"\"";
			json += L",\"level\":\"";
			json += LogLevelToString(item.level);
			json += L"\"";
			json += L",\"category\":\"" + EscapeJson(item.category) + L"\"";
			json += L",\"message\":\"" + EscapeJson(item.message) + L"\"";

			if (m_cfg.includeProcThreadId) {
				json += L",\"pid\":" + std::to_wstring(item.pid);
				json += L",\"tid\":" + std::to_wstring(item.tid);
			}
			if (item.nativeError != 0) {
				json += L",\"nativeError\":" + std::to_wstring(item.nativeError);
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				json += L",\"file\":\"" + EscapeJson(item.file) + L"\"";
				json += L",\"line\":" + std::to_wstring(item.line);
				json += L",\"function\":\"" + EscapeJson(item.function) + L"\"";
			}
			json += L"}";
			return json;
		}

		// ============================================================================
		// Async Queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);
			if (!m_accepting.load(std::memory_order_acquire)) {
				return;
			}

			size_t maxQueue = 0;
			LoggerConfig::BackPressurePolicy policy{};
			{
				std::lock_guard<std::mutex> cfgLock(m_cfgMutex);
				maxQueue = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			if (m_queue.size() >= maxQueue) {
				switch (policy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_queueCv.wait(lock, [this, maxQueue] {
						return m_queue.size() < maxQueue || m_stop.load(std::memory_order_acquire);
					});
					if (!m_accepting.load(std::memory_order_acquire)) {
						return;
					}
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.push_back(std::move(item));
			lock.unlock();
			m_queueCv.notify_all();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lock(m_queueMutex);
			if (m_queue.empty()) {
				return false;
			}
			out = std::move(m_queue.front());
			m_queue.pop_front();
			return true;
		}

		void Logger::WorkerLoop() {
			while (true) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] {
						return !m_queue.empty() || m_stop.load(std::memory_order_acquire);
					});
					if (m_queue.empty()) {
						// Stop requested and nothing left to write
						break;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				// Wake producers blocked on back-pressure and Flush() waiters
				m_queueCv.notify_all();
				Write(item);
			}
			m_queueCv.notify_all();
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			std::lock_guard<std::mutex> lock(m_cfgMutex);

			const std::wstring formatted = m_cfg.jsonLines ? FormatAsJson(item) : FormatLine(item);
			std::string line = StringUtils::WStringToString(formatted);
			line.push_back('\n');

			if (m_cfg.toConsole) {
				WriteConsoleSink(line);
			}
			if (m_cfg.toFile) {
				WriteFile(line);
			}

			if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(m_cfg.flushLevel)) {
				if (m_cfg.toConsole) {
					std::fflush(stderr);
				}
				if (m_file != nullptr) {
					std::fflush(m_file);
				}
			}
		}

		void Logger::WriteConsoleSink(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
		}

		void Logger::WriteFile(const std::string& line) {
			RotateIfNeeded(line.size());
			OpenLogFileIfNeeded();
			if (m_file == nullptr) {
				return;
			}
			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			m_currentSize += written;
		}

		std::wstring Logger::BaseLogPath() const {
			const std::filesystem::path dir(m_cfg.logDirectory);
			return (dir / (m_cfg.baseFileName + L".log")).wstring();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file != nullptr) {
				return;
			}

			std::error_code ec;
			const std::filesystem::path dir(m_cfg.logDirectory);
			if (!dir.empty()) {
				std::filesystem::create_directories(dir, ec);
				if (ec) {
					// Console remains available; file output is best-effort
					std::fprintf(stderr, "PrivGuard logger: cannot create log directory (%s)\n", ec.message().c_str());
					return;
				}
			}

			const std::filesystem::path path(BaseLogPath());
#ifdef _WIN32
			m_file = _wfopen(path.c_str(), L"ab");
#else
			m_file = std::fopen(path.c_str(), "ab");
#endif
			if (m_file == nullptr) {
				std::fprintf(stderr, "PrivGuard logger: cannot open log file %s\n", path.string().c_str());
				return;
			}

			m_currentSize = std::filesystem::file_size(path, ec);
			if (ec) {
				m_currentSize = 0;
			}
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0 || m_file == nullptr) {
				return;
			}
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) {
				return;
			}
			PerformRotation();
		}

		void Logger::PerformRotation() {
			CloseLogFile();

			namespace fs = std::filesystem;
			const fs::path dir(m_cfg.logDirectory);
			auto rotatedPath = [&](size_t index) {
				return dir / (m_cfg.baseFileName + L"." + std::to_wstring(index) + L".log");
			};

			std::error_code ec;
			if (m_cfg.maxFileCount > 1) {
				// Oldest file falls off the end, the rest shift up by one
				fs::remove(rotatedPath(m_cfg.maxFileCount - 1), ec);
				for (size_t i = m_cfg.maxFileCount - 1; i > 1; --i) {
					if (fs::exists(rotatedPath(i - 1), ec)) {
						fs::rename(rotatedPath(i - 1), rotatedPath(i), ec);
					}
				}
				fs::rename(fs::path(BaseLogPath()), rotatedPath(1), ec);
			}
			else {
				fs::remove(fs::path(BaseLogPath()), ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		void Logger::CloseLogFile() {
			if (m_file != nullptr) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		uint32_t Logger::CurrentProcessId() noexcept {
#ifdef _WIN32
			return static_cast<uint32_t>(::GetCurrentProcessId());
#else
			return static_cast<uint32_t>(::getpid());
#endif
		}

		uint64_t Logger::CurrentThreadId() noexcept {
#ifdef _WIN32
			return static_cast<uint64_t>(::GetCurrentThreadId());
#else
			return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const wchar_t* category,
		                     const wchar_t* file,
		                     int line,
		                     const wchar_t* function,
		                     const wchar_t* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file ? file : L"")
			, m_function(function ? function : L"")
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : L"Enter",
				              m_file.c_str(), m_line, m_function.c_str());
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) {
				return;
			}
			const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start);
			try {
				lg.LogMessage(m_level, m_category,
				              L"Exit (" + std::to_wstring(elapsed.count()) + L" us)",
				              m_file.c_str(), m_line, m_function.c_str());
			}
			catch (const std::bad_alloc&) {
				// Nothing sensible to report from a destructor without memory
			}
		}

	}  // namespace Utils
}  // namespace PrivGuard
