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
 * @file JSONUtils.hpp
 * @brief JSON parsing and typed access utilities for PrivGuard.
 *
 * Provides:
 * - Safe parsing with depth limits to prevent stack overflow attacks
 * - File loading with size limits and UTF-8 BOM stripping
 * - Dot/bracket path navigation with typed getters
 * - Required-key validation
 *
 * Implementation uses nlohmann/json library with hardened wrappers.
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <optional>
#include <algorithm>

#include <nlohmann/json.hpp>

namespace PrivGuard {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json
			using Json = nlohmann::json;

			// ============================================================================
			// Security Constants
			// ============================================================================

			/// Maximum nesting depth to prevent stack overflow attacks
			inline constexpr size_t MAX_JSON_DEPTH = 1000;

			/// Default file size limit for LoadFromFile (4MB, configuration files are small)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 4ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information structure for JSON operations.
			 *
			 * Captures detailed error information including file path,
			 * byte offset, and approximate line/column for parse errors.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< Approximate line number (1-based, 0 = unknown)
				size_t column = 0;                ///< Approximate column number (1-based, 0 = unknown)

				/// @brief Check if an error occurred
				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				/// @brief Clear error state
				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			/**
			 * @brief Options for JSON parsing operations.
			 */
			struct ParseOptions {
				bool allowComments = true;         ///< Allow // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth (DoS protection)
			};

			// ============================================================================
			// Parsing
			// ============================================================================

			/**
			 * @brief Parse JSON text into a Json object.
			 *
			 * @param jsonText Input JSON text
			 * @param out Output Json object (cleared on failure)
			 * @param err Optional error output
			 * @param opt Parse options
			 * @return true on success, false on parse error
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Load JSON from file.
			 *
			 * Reads and parses a JSON file with size and depth limits.
			 * Automatically strips UTF-8 BOM if present.
			 *
			 * @param path File path to load
			 * @param out Output Json object
			 * @param err Optional error output
			 * @param opt Parse options
			 * @param maxBytes Maximum file size in bytes
			 * @return true on success, false on error
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			// ============================================================================
			// Path Helpers
			// ============================================================================

			/**
			 * @brief Convert path-like string to JSON Pointer.
			 *
			 * Accepts either JSON Pointer ("/a/b/0") or dot/bracket notation ("a.b[0].c").
			 * Strings starting with '/' are treated as JSON Pointers.
			 *
			 * @param pathLike Input path string
			 * @return JSON Pointer string (starts with '/')
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			/**
			 * @brief Check if a path exists in a Json object.
			 */
			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			// ============================================================================
			// Typed Getters
			// ============================================================================

			/**
			 * @brief Get typed value from Json using path.
			 *
			 * @tparam T Target type
			 * @param j Json object to search
			 * @param pathLike Path (JSON Pointer or dot/bracket notation)
			 * @param out Output value (unchanged on failure)
			 * @return true if path exists and conversion succeeded, false otherwise
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);

					if (jp == "/") {
						out = j.template get<T>();
						return true;
					}

					const nlohmann::json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace PrivGuard
