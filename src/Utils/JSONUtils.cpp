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
#include "JSONUtils.hpp"
#include "Logger.hpp"

#include <fstream>
#include <sstream>

namespace PrivGuard {
	namespace Utils {
		namespace JSON {

			// ============================================================================
			// Internal Helper Functions
			// ============================================================================

			namespace {

				void SetError(Error* err, std::string msg, const std::filesystem::path& path = {}) noexcept {
					if (!err) return;
					try {
						err->message = std::move(msg);
						err->path = path;
					}
					catch (const std::bad_alloc&) {
						// Leave whatever was assigned; the bool result still reports failure
					}
				}

				/**
				 * @brief Fill line/column from a byte offset into the parsed text.
				 */
				void FillPosition(Error* err, std::string_view text, size_t byteOffset) noexcept {
					if (!err) return;
					err->byteOffset = byteOffset;

					size_t line = 1;
					size_t column = 1;
					const size_t limit = (std::min)(byteOffset, text.size());
					for (size_t i = 0; i < limit; ++i) {
						if (text[i] == '\n') {
							++line;
							column = 1;
						}
						else {
							++column;
						}
					}
					err->line = line;
					err->column = column;
				}

				/// @brief Escape a single reference token per RFC 6901.
				std::string EscapePointerToken(std::string_view token) {
					std::string out;
					out.reserve(token.size());
					for (const char c : token) {
						if (c == '~') {
							out += "~0";
						}
						else if (c == '/') {
							out += "~1";
						}
						else {
							out.push_back(c);
						}
					}
					return out;
				}

			}

			// ============================================================================
			// Parsing
			// ============================================================================

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				if (err) err->clear();
				out = Json();

				try {
					bool tooDeep = false;
					const size_t maxDepth = opt.maxDepth;

					Json::parser_callback_t cb = [&tooDeep, maxDepth](int depth, Json::parse_event_t, Json&) {
						if (static_cast<size_t>(depth) > maxDepth) {
							tooDeep = true;
							return false;
						}
						return true;
					};

					Json parsed = Json::parse(jsonText.begin(), jsonText.end(), cb,
					                          /*allow_exceptions*/ true, /*ignore_comments*/ opt.allowComments);
					if (tooDeep) {
						SetError(err, "JSON nesting depth exceeds limit");
						return false;
					}

					out = std::move(parsed);
					return true;
				}
				catch (const Json::parse_error& e) {
					SetError(err, e.what());
					FillPosition(err, jsonText, e.byte);
					return false;
				}
				catch (const Json::exception& e) {
					SetError(err, e.what());
					return false;
				}
				catch (const std::bad_alloc&) {
					SetError(err, "Out of memory while parsing JSON");
					return false;
				}
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				if (err) err->clear();

				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						SetError(err, "Cannot stat file: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						SetError(err, "File exceeds maximum JSON size", path);
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						SetError(err, "Cannot open file", path);
						return false;
					}

					std::string text;
					text.resize(static_cast<size_t>(size));
					if (size > 0 && !in.read(text.data(), static_cast<std::streamsize>(size))) {
						SetError(err, "Cannot read file", path);
						return false;
					}

					// Strip UTF-8 BOM
					std::string_view view(text);
					if (view.size() >= 3 &&
						static_cast<unsigned char>(view[0]) == 0xEF &&
						static_cast<unsigned char>(view[1]) == 0xBB &&
						static_cast<unsigned char>(view[2]) == 0xBF) {
						view.remove_prefix(3);
					}

					if (!Parse(view, out, err, opt)) {
						if (err) err->path = path;
						PG_LOG_WARN(L"JSONUtils", L"Failed to parse %ls", path.wstring().c_str());
						return false;
					}
					return true;
				}
				catch (const std::bad_alloc&) {
					SetError(err, "Out of memory while loading JSON", path);
					return false;
				}
				catch (const std::ios_base::failure& e) {
					SetError(err, e.what(), path);
					return false;
				}
			}

			// ============================================================================
			// Path Helpers
			// ============================================================================

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty() || pathLike == "/") {
						return "/";
					}
					if (pathLike.front() == '/') {
						return std::string(pathLike);
					}

					std::string pointer;
					pointer.reserve(pathLike.size() + 8);
					std::string token;

					auto flush = [&]() {
						if (!token.empty()) {
							pointer.push_back('/');
							pointer += EscapePointerToken(token);
							token.clear();
						}
					};

					for (const char c : pathLike) {
						if (c == '.' || c == '[' || c == ']') {
							flush();
						}
						else {
							token.push_back(c);
						}
					}
					flush();

					return pointer.empty() ? std::string("/") : pointer;
				}
				catch (const std::bad_alloc&) {
					return "/";
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") {
						return true;
					}
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const Json::exception&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace PrivGuard
