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
/**
 * ============================================================================
 * PrivGuard - CONFIGURATION
 * ============================================================================
 *
 * @file PrivGuardConfig.hpp
 * @brief JSON configuration for the logger and the privilege context.
 *
 * @code{.json}
 * {
 *   "logging": {
 *     "level": "info", "async": true, "console": true, "file": false,
 *     "directory": "logs", "baseFileName": "PrivGuard",
 *     "maxFileSizeBytes": 10485760, "maxFileCount": 10, "jsonLines": false
 *   },
 *   "privileges": {
 *     "tokenAccess": ["Query", "AdjustPrivileges"],
 *     "prewarm": ["SeBackupPrivilege", "SeRestorePrivilege"]
 *   }
 * }
 * @endcode
 *
 * Every key is optional and falls back to its default. A key with the wrong
 * type, an unknown level, access right or privilege name is an error.
 *
 * ============================================================================
 */

#pragma once

#include <filesystem>
#include <string_view>

#include "../Privileges/PrivilegeContext.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

namespace PrivGuard::Config {

    using Error = Utils::JSON::Error;

    struct PrivGuardConfig {
        Utils::LoggerConfig logging;
        Privileges::ContextOptions privileges;
    };

    /**
     * @brief Build a configuration from a parsed document.
     * @param out Receives the result; left untouched on failure
     */
    [[nodiscard]] bool FromJson(const Utils::JSON::Json& document, PrivGuardConfig& out, Error* err = nullptr) noexcept;

    [[nodiscard]] bool LoadFromString(std::string_view jsonText, PrivGuardConfig& out, Error* err = nullptr) noexcept;

    [[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, PrivGuardConfig& out, Error* err = nullptr) noexcept;

    /// @brief Parse "trace" ... "fatal" (case-insensitive).
    [[nodiscard]] bool ParseLogLevel(std::string_view text, Utils::LogLevel& out) noexcept;

    /// @brief Parse a token access right name ("Query", "AdjustPrivileges", ...).
    [[nodiscard]] bool ParseTokenAccessRight(std::string_view text, Native::AccessMask& out) noexcept;

}  // namespace PrivGuard::Config
