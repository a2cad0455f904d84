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
 * @file NativeTypes.hpp
 * @brief Portable mirror of the Win32 token types, constants and error codes.
 *
 * The layouts match LUID, LUID_AND_ATTRIBUTES and a single-entry
 * TOKEN_PRIVILEGES exactly, so the Win32 backend passes them straight to
 * advapi32 (checked with static_assert there).
 */

#include <cstdint>
#include <cstddef>
#include <functional>

namespace PrivGuard::Native {

    // ============================================================================
    // Type Aliases
    // ============================================================================

    using NativeHandle = void*;
    using ProcessId = uint32_t;
    using NativeErrorCode = uint32_t;
    using AccessMask = uint32_t;

    // ============================================================================
    // Error Codes (Win32 values)
    // ============================================================================

    namespace ErrorCodes {
        inline constexpr NativeErrorCode Success = 0;
        inline constexpr NativeErrorCode AccessDenied = 5;
        inline constexpr NativeErrorCode InvalidHandle = 6;
        inline constexpr NativeErrorCode InvalidData = 13;
        inline constexpr NativeErrorCode InvalidParameter = 87;
        inline constexpr NativeErrorCode InsufficientBuffer = 122;
        inline constexpr NativeErrorCode NotAllAssigned = 1300;
        inline constexpr NativeErrorCode NoSuchPrivilege = 1313;
    }

    // ============================================================================
    // Access Rights
    // ============================================================================

    namespace TokenAccessRights {
        inline constexpr AccessMask AssignPrimary = 0x0001;
        inline constexpr AccessMask Duplicate = 0x0002;
        inline constexpr AccessMask Impersonate = 0x0004;
        inline constexpr AccessMask Query = 0x0008;
        inline constexpr AccessMask QuerySource = 0x0010;
        inline constexpr AccessMask AdjustPrivileges = 0x0020;
        inline constexpr AccessMask AdjustGroups = 0x0040;
        inline constexpr AccessMask AdjustDefault = 0x0080;
        inline constexpr AccessMask AdjustSessionId = 0x0100;
        inline constexpr AccessMask Read = 0x00020000 | Query;
        inline constexpr AccessMask AllAccess = 0x000F0000 | 0x01FF;

        /// Rights every privilege enabler needs on its token
        inline constexpr AccessMask QueryAndAdjust = Query | AdjustPrivileges;
    }

    namespace ProcessAccessRights {
        inline constexpr AccessMask QueryInformation = 0x0400;
        inline constexpr AccessMask QueryLimitedInformation = 0x1000;
    }

    // ============================================================================
    // Token Structures
    // ============================================================================

    /**
     * @brief Locally unique identifier assigned by the OS to a privilege.
     */
    struct Luid {
        uint32_t lowPart = 0;
        int32_t highPart = 0;

        [[nodiscard]] constexpr uint64_t ToUInt64() const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(highPart)) << 32) | lowPart;
        }

        friend constexpr bool operator==(const Luid& a, const Luid& b) noexcept {
            return a.lowPart == b.lowPart && a.highPart == b.highPart;
        }
        friend constexpr bool operator!=(const Luid& a, const Luid& b) noexcept {
            return !(a == b);
        }
    };

    struct LuidAndAttributes {
        Luid luid{};
        uint32_t attributes = 0;
    };

    /**
     * @brief TOKEN_PRIVILEGES carrying exactly one entry.
     */
    struct TokenPrivilege {
        uint32_t privilegeCount = 0;
        LuidAndAttributes privilege{};
    };

    static_assert(sizeof(Luid) == 8, "Luid must match the native LUID layout");
    static_assert(sizeof(LuidAndAttributes) == 12, "LuidAndAttributes must match LUID_AND_ATTRIBUTES");
    static_assert(sizeof(TokenPrivilege) == 16, "TokenPrivilege must match a one-entry TOKEN_PRIVILEGES");

    /// Offset of the first record in a TOKEN_PRIVILEGES block
    inline constexpr size_t kTokenPrivilegesHeaderSize = sizeof(uint32_t);

}  // namespace PrivGuard::Native

namespace std {
    template <>
    struct hash<PrivGuard::Native::Luid> {
        size_t operator()(const PrivGuard::Native::Luid& luid) const noexcept {
            return std::hash<uint64_t>{}(luid.ToUInt64());
        }
    };
}
