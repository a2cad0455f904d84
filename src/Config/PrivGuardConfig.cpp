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
#include "PrivGuardConfig.hpp"
#include "../Utils/StringUtils.hpp"

#include <limits>

namespace PrivGuard::Config {

    using Utils::JSON::Json;
    using Utils::StringUtils::EqualsIgnoreCase;

    namespace {

        void SetError(Error* err, std::string message) {
            if (err) {
                err->message = std::move(message);
            }
        }

        bool WrongType(Error* err, std::string_view path) {
            SetError(err, std::string(path) + " has the wrong type");
            return false;
        }

        // Optional value at a dotted path; false only when present with the wrong type
        template <typename T>
        bool ReadOptional(const Json& document, std::string_view path, T& out, Error* err) {
            if (!Utils::JSON::Contains(document, path)) {
                return true;
            }
            return Utils::JSON::Get(document, path, out) || WrongType(err, path);
        }

        // Sizes and counts must be positive integers; nlohmann would wrap a negative value
        template <typename T>
        bool ReadPositive(const Json& document, std::string_view path, T& out, Error* err) {
            if (!Utils::JSON::Contains(document, path)) {
                return true;
            }
            Json value;
            if (!Utils::JSON::Get(document, path, value) || !value.is_number_integer()) {
                return WrongType(err, path);
            }
            if (!value.is_number_unsigned() || value.get<uint64_t>() == 0 ||
                value.get<uint64_t>() > (std::numeric_limits<T>::max)()) {
                SetError(err, std::string(path) + " must be a positive integer");
                return false;
            }
            out = static_cast<T>(value.get<uint64_t>());
            return true;
        }

        bool ReadLevel(const Json& document, std::string_view path, Utils::LogLevel& out, Error* err) {
            std::string level;
            if (!ReadOptional(document, path, level, err)) return false;
            if (!level.empty() && !ParseLogLevel(level, out)) {
                SetError(err, std::string(path) + ": unknown level '" + level + "'");
                return false;
            }
            return true;
        }

        bool ReadLogging(const Json& document, Utils::LoggerConfig& cfg, Error* err) {
            if (!document.at("logging").is_object()) {
                SetError(err, "logging must be an object");
                return false;
            }

            if (!ReadLevel(document, "logging.level", cfg.minimalLevel, err)) return false;
            if (!ReadLevel(document, "logging.flushLevel", cfg.flushLevel, err)) return false;

            std::string backPressure;
            if (!ReadOptional(document, "logging.backPressure", backPressure, err)) return false;
            if (!backPressure.empty()) {
                using Policy = Utils::LoggerConfig::BackPressurePolicy;
                if (EqualsIgnoreCase(backPressure, "block")) cfg.bpPolicy = Policy::Block;
                else if (EqualsIgnoreCase(backPressure, "dropOldest")) cfg.bpPolicy = Policy::DropOldest;
                else if (EqualsIgnoreCase(backPressure, "dropNewest")) cfg.bpPolicy = Policy::DropNewest;
                else {
                    SetError(err, "logging.backPressure: unknown policy '" + backPressure + "'");
                    return false;
                }
            }

            std::string directory;
            std::string baseFileName;
            if (!ReadOptional(document, "logging.async", cfg.async, err)) return false;
            if (!ReadOptional(document, "logging.console", cfg.toConsole, err)) return false;
            if (!ReadOptional(document, "logging.file", cfg.toFile, err)) return false;
            if (!ReadOptional(document, "logging.jsonLines", cfg.jsonLines, err)) return false;
            if (!ReadOptional(document, "logging.includeSourceLocation", cfg.includeSrcLocation, err)) return false;
            if (!ReadOptional(document, "logging.includeProcessThreadId", cfg.includeProcThreadId, err)) return false;
            if (!ReadPositive(document, "logging.maxQueueSize", cfg.maxQueueSize, err)) return false;
            if (!ReadPositive(document, "logging.maxFileSizeBytes", cfg.maxFileSizeBytes, err)) return false;
            if (!ReadPositive(document, "logging.maxFileCount", cfg.maxFileCount, err)) return false;
            if (!ReadOptional(document, "logging.directory", directory, err)) return false;
            if (!ReadOptional(document, "logging.baseFileName", baseFileName, err)) return false;

            if (!directory.empty()) cfg.logDirectory = Utils::StringUtils::StringToWString(directory);
            if (!baseFileName.empty()) cfg.baseFileName = Utils::StringUtils::StringToWString(baseFileName);
            return true;
        }

        bool ReadPrivileges(const Json& document, Privileges::ContextOptions& options, Error* err) {
            if (!document.at("privileges").is_object()) {
                SetError(err, "privileges must be an object");
                return false;
            }

            std::vector<std::string> rights;
            std::vector<std::string> prewarm;
            if (!ReadOptional(document, "privileges.tokenAccess", rights, err)) return false;
            if (!ReadOptional(document, "privileges.prewarm", prewarm, err)) return false;

            if (Utils::JSON::Contains(document, "privileges.tokenAccess")) {
                Native::AccessMask mask = 0;
                for (const auto& right : rights) {
                    Native::AccessMask bit = 0;
                    if (!ParseTokenAccessRight(right, bit)) {
                        SetError(err, "privileges.tokenAccess: unknown access right '" + right + "'");
                        return false;
                    }
                    mask |= bit;
                }
                if ((mask & Native::TokenAccessRights::QueryAndAdjust) != Native::TokenAccessRights::QueryAndAdjust) {
                    SetError(err, "privileges.tokenAccess must include Query and AdjustPrivileges");
                    return false;
                }
                options.tokenAccess = mask;
            }

            options.prewarm.clear();
            for (const auto& name : prewarm) {
                const auto privilege = Privileges::TryParsePrivilege(Utils::StringUtils::StringToWString(name));
                if (!privilege) {
                    SetError(err, "privileges.prewarm: unknown privilege '" + name + "'");
                    return false;
                }
                options.prewarm.push_back(*privilege);
            }
            return true;
        }

    }

    bool ParseLogLevel(std::string_view text, Utils::LogLevel& out) noexcept {
        using Utils::LogLevel;
        struct Entry { std::string_view name; LogLevel level; };
        static constexpr Entry kLevels[] = {
            { "trace", LogLevel::Trace }, { "debug", LogLevel::Debug }, { "info", LogLevel::Info },
            { "warn", LogLevel::Warn }, { "warning", LogLevel::Warn }, { "error", LogLevel::Error },
            { "fatal", LogLevel::Fatal },
        };
        for (const auto& entry : kLevels) {
            if (EqualsIgnoreCase(entry.name, text)) {
                out = entry.level;
                return true;
            }
        }
        return false;
    }

    bool ParseTokenAccessRight(std::string_view text, Native::AccessMask& out) noexcept {
        namespace R = Native::TokenAccessRights;
        struct Entry { std::string_view name; Native::AccessMask mask; };
        static constexpr Entry kRights[] = {
            { "AssignPrimary", R::AssignPrimary }, { "Duplicate", R::Duplicate },
            { "Impersonate", R::Impersonate }, { "Query", R::Query },
            { "QuerySource", R::QuerySource }, { "AdjustPrivileges", R::AdjustPrivileges },
            { "AdjustGroups", R::AdjustGroups }, { "AdjustDefault", R::AdjustDefault },
            { "AdjustSessionId", R::AdjustSessionId }, { "Read", R::Read },
            { "AllAccess", R::AllAccess },
        };
        for (const auto& entry : kRights) {
            if (EqualsIgnoreCase(entry.name, text)) {
                out = entry.mask;
                return true;
            }
        }
        return false;
    }

    bool FromJson(const Json& document, PrivGuardConfig& out, Error* err) noexcept {
        try {
            if (!document.is_object()) {
                SetError(err, "configuration root must be an object");
                return false;
            }

            PrivGuardConfig cfg;
            if (Utils::JSON::Contains(document, "logging")) {
                if (!ReadLogging(document, cfg.logging, err)) return false;
            }
            if (Utils::JSON::Contains(document, "privileges")) {
                if (!ReadPrivileges(document, cfg.privileges, err)) return false;
            }

            out = std::move(cfg);
            return true;
        }
        catch (const std::exception& ex) {
            SetError(err, std::string("configuration: ") + ex.what());
            return false;
        }
    }

    bool LoadFromString(std::string_view jsonText, PrivGuardConfig& out, Error* err) noexcept {
        Json document;
        if (!Utils::JSON::Parse(jsonText, document, err)) {
            return false;
        }
        return FromJson(document, out, err);
    }

    bool LoadFromFile(const std::filesystem::path& path, PrivGuardConfig& out, Error* err) noexcept {
        Json document;
        if (!Utils::JSON::LoadFromFile(path, document, err)) {
            return false;
        }
        if (!FromJson(document, out, err)) {
            if (err) {
                err->path = path;
            }
            PG_LOG_WARN(L"Config", L"Rejected configuration %ls", path.wstring().c_str());
            return false;
        }
        PG_LOG_INFO(L"Config", L"Loaded configuration from %ls", path.wstring().c_str());
        return true;
    }

}  // namespace PrivGuard::Config
