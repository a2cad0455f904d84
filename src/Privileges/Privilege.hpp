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
 * PrivGuard - PRIVILEGE VOCABULARY
 * ============================================================================
 *
 * @file Privilege.hpp
 * @brief Closed set of OS privileges, their attribute flags and derived state.
 *
 * A privilege is a right attached to an access token (back up files, debug
 * other processes, ...). It is distinct from an access-control permission on
 * an object. Each value maps to the OS constant name used to look up its LUID.
 *
 * ============================================================================
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace PrivGuard::Privileges {

    // ============================================================================
    // Privilege
    // ============================================================================

    enum class Privilege : uint8_t {
        AssignPrimaryToken,
        Audit,
        Backup,
        ChangeNotify,
        CreateGlobal,
        CreatePageFile,
        CreatePermanent,
        CreateSymbolicLink,
        CreateToken,
        Debug,
        EnableDelegation,
        Impersonate,
        IncreaseBasePriority,
        IncreaseQuota,
        IncreaseWorkingSet,
        LoadDriver,
        LockMemory,
        MachineAccount,
        ManageVolume,
        ProfileSingleProcess,
        Relabel,
        RemoteShutdown,
        Restore,
        Security,
        Shutdown,
        SyncAgent,
        SystemEnvironment,
        SystemProfile,
        SystemTime,
        TakeOwnership,
        TrustedComputerBase,
        TimeZone,
        TrustedCredentialManagerAccess,
        Undock,
        UnsolicitedInput
    };

    inline constexpr size_t kPrivilegeCount = static_cast<size_t>(Privilege::UnsolicitedInput) + 1;

    /// @brief Every privilege, in declaration order.
    [[nodiscard]] const std::array<Privilege, kPrivilegeCount>& AllPrivileges() noexcept;

    /// @brief OS constant name, e.g. L"SeBackupPrivilege".
    [[nodiscard]] std::wstring_view PrivilegeName(Privilege privilege) noexcept;

    /// @brief Reverse of PrivilegeName. Case-insensitive, as the OS lookup is.
    [[nodiscard]] std::optional<Privilege> TryParsePrivilege(std::wstring_view name) noexcept;

    // ============================================================================
    // Attributes & State
    // ============================================================================

    /// Bit flags as stored in a token's LUID_AND_ATTRIBUTES records
    enum class PrivilegeAttributes : uint32_t {
        Disabled = 0,
        EnabledByDefault = 0x00000001,
        Enabled = 0x00000002,
        Removed = 0x00000004,
        UsedForAccess = 0x80000000
    };

    [[nodiscard]] constexpr PrivilegeAttributes operator|(PrivilegeAttributes a, PrivilegeAttributes b) noexcept {
        return static_cast<PrivilegeAttributes>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    [[nodiscard]] constexpr PrivilegeAttributes operator&(PrivilegeAttributes a, PrivilegeAttributes b) noexcept {
        return static_cast<PrivilegeAttributes>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }

    [[nodiscard]] constexpr bool HasFlag(PrivilegeAttributes value, PrivilegeAttributes flag) noexcept {
        return (static_cast<uint32_t>(value) & static_cast<uint32_t>(flag)) != 0;
    }

    enum class PrivilegeState : uint8_t {
        Disabled,
        Enabled,
        Removed
    };

    /**
     * @brief Collapse attribute flags to a state.
     *
     * Enabled wins over everything (EnabledByDefault | Enabled is Enabled),
     * then Removed; anything else is Disabled.
     */
    [[nodiscard]] constexpr PrivilegeState GetPrivilegeState(PrivilegeAttributes attributes) noexcept {
        if (HasFlag(attributes, PrivilegeAttributes::Enabled)) {
            return PrivilegeState::Enabled;
        }
        if (HasFlag(attributes, PrivilegeAttributes::Removed)) {
            return PrivilegeState::Removed;
        }
        return PrivilegeState::Disabled;
    }

    /// Outcome of a single adjustment: whether the token actually changed.
    enum class AdjustPrivilegeResult : uint8_t {
        None = 0,
        PrivilegeModified = 1
    };

    // ============================================================================
    // Log Helpers
    // ============================================================================

    [[nodiscard]] const wchar_t* PrivilegeStateToString(PrivilegeState state) noexcept;
    [[nodiscard]] const wchar_t* AdjustPrivilegeResultToString(AdjustPrivilegeResult result) noexcept;

}  // namespace PrivGuard::Privileges
