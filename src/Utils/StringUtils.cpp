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
#include "StringUtils.hpp"

namespace PrivGuard {
	namespace Utils {
		namespace StringUtils {

			namespace {
				constexpr char32_t kReplacementChar = 0xFFFD;
				constexpr char32_t kMaxCodePoint = 0x10FFFF;

				void AppendUtf8(std::string& out, char32_t cp) {
					if (cp > kMaxCodePoint || (cp >= 0xD800 && cp <= 0xDFFF)) {
						cp = kReplacementChar;
					}
					if (cp < 0x80) {
						out.push_back(static_cast<char>(cp));
					}
					else if (cp < 0x800) {
						out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
						out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
					}
					else if (cp < 0x10000) {
						out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
						out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
						out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
					}
					else {
						out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
						out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
						out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
						out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
					}
				}

				void AppendWide(std::wstring& out, char32_t cp) {
					if constexpr (sizeof(wchar_t) == 2) {
						if (cp >= 0x10000) {
							cp -= 0x10000;
							out.push_back(static_cast<wchar_t>(0xD800 + (cp >> 10)));
							out.push_back(static_cast<wchar_t>(0xDC00 + (cp & 0x3FF)));
							return;
						}
					}
					out.push_back(static_cast<wchar_t>(cp));
				}

				[[nodiscard]] constexpr char AsciiLower(char c) noexcept {
					return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
				}

				[[nodiscard]] constexpr wchar_t AsciiLower(wchar_t c) noexcept {
					return (c >= L'A' && c <= L'Z') ? static_cast<wchar_t>(c - L'A' + L'a') : c;
				}
			}

			std::string WStringToString(std::wstring_view ws) {
				std::string out;
				out.reserve(ws.size());

				for (size_t i = 0; i < ws.size(); ++i) {
					char32_t cp = static_cast<char32_t>(ws[i]);
					if constexpr (sizeof(wchar_t) == 2) {
						if (cp >= 0xD800 && cp <= 0xDBFF) {
							// High surrogate must be followed by a low surrogate
							if (i + 1 < ws.size()) {
								const char32_t low = static_cast<char32_t>(ws[i + 1]);
								if (low >= 0xDC00 && low <= 0xDFFF) {
									cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
									++i;
								}
								else {
									cp = kReplacementChar;
								}
							}
							else {
								cp = kReplacementChar;
							}
						}
					}
					AppendUtf8(out, cp);
				}
				return out;
			}

			std::wstring StringToWString(std::string_view s) {
				std::wstring out;
				out.reserve(s.size());

				size_t i = 0;
				while (i < s.size()) {
					const auto lead = static_cast<unsigned char>(s[i]);
					char32_t cp = 0;
					size_t extra = 0;

					if (lead < 0x80) {
						cp = lead;
					}
					else if ((lead & 0xE0) == 0xC0) {
						cp = lead & 0x1F;
						extra = 1;
					}
					else if ((lead & 0xF0) == 0xE0) {
						cp = lead & 0x0F;
						extra = 2;
					}
					else if ((lead & 0xF8) == 0xF0) {
						cp = lead & 0x07;
						extra = 3;
					}
					else {
						AppendWide(out, kReplacementChar);
						++i;
						continue;
					}

					// Truncated sequence at the end of input
					if (i + extra >= s.size()) {
						AppendWide(out, kReplacementChar);
						break;
					}

					bool valid = true;
					for (size_t k = 1; k <= extra; ++k) {
						const auto cont = static_cast<unsigned char>(s[i + k]);
						if ((cont & 0xC0) != 0x80) {
							valid = false;
							extra = k - 1;
							break;
						}
						cp = (cp << 6) | (cont & 0x3F);
					}

					AppendWide(out, valid && cp <= kMaxCodePoint ? cp : kReplacementChar);
					i += extra + 1;
				}
				return out;
			}

			bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) {
					return false;
				}
				for (size_t i = 0; i < a.size(); ++i) {
					if (AsciiLower(a[i]) != AsciiLower(b[i])) {
						return false;
					}
				}
				return true;
			}

			bool EqualsIgnoreCase(std::wstring_view a, std::wstring_view b) noexcept {
				if (a.size() != b.size()) {
					return false;
				}
				for (size_t i = 0; i < a.size(); ++i) {
					if (AsciiLower(a[i]) != AsciiLower(b[i])) {
						return false;
					}
				}
				return true;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace PrivGuard
