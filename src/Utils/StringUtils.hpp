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
 * @file StringUtils.hpp
 * @brief UTF-8 / wide string conversion and comparison helpers.
 *
 * Wide strings are UTF-16 where wchar_t is 16 bits (Windows) and UTF-32
 * elsewhere. Invalid sequences are replaced with U+FFFD rather than failing,
 * so the helpers are safe to use on log and error paths.
 */

#include <string>
#include <string_view>

namespace PrivGuard {
	namespace Utils {
		namespace StringUtils {

			/// @brief Convert a wide string to UTF-8.
			[[nodiscard]] std::string WStringToString(std::wstring_view ws);

			/// @brief Convert UTF-8 text to a wide string.
			[[nodiscard]] std::wstring StringToWString(std::string_view s);

			/// @brief ASCII case-insensitive comparison.
			[[nodiscard]] bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept;

			/// @brief ASCII case-insensitive comparison (wide).
			[[nodiscard]] bool EqualsIgnoreCase(std::wstring_view a, std::wstring_view b) noexcept;

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace PrivGuard
