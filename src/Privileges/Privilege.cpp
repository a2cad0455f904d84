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
#include "Privilege.hpp"
#include "../Utils/StringUtils.hpp"

namespace PrivGuard::Privileges {

    namespace {

        struct PrivilegeEntry {
            Privilege privilege;
            std::wstring_view name;
        };

        // Indexed by the enum value
        constexpr std::array<PrivilegeEntry, kPrivilegeCount> kPrivilegeTable = { {
            { Privilege::AssignPrimaryToken,             L"SeAssignPrimaryTokenPrivilege" },
            { Privilege::Audit,                          L"SeAuditPrivilege" },
            { Privilege::Backup,                         L"SeBackupPrivilege" },
            { Privilege::ChangeNotify,                   L"SeChangeNotifyPrivilege" },
            { Privilege::CreateGlobal,                   L"SeCreateGlobalPrivilege" },
            { Privilege::CreatePageFile,                 L"SeCreatePagefilePrivilege" },
            { Privilege::CreatePermanent,                L"SeCreatePermanentPrivilege" },
            { Privilege::CreateSymbolicLink,             L"SeCreateSymbolicLinkPrivilege" },
            { Privilege::CreateToken,                    L"SeCreateTokenPrivilege" },
            { Privilege::Debug,                          L"SeDebugPrivilege" },
            { Privilege::EnableDelegation,               L"SeEnableDelegationPrivilege" },
            { Privilege::Impersonate,                    L"SeImpersonatePrivilege" },
            { Privilege::IncreaseBasePriority,           L"SeIncreaseBasePriorityPrivilege" },
            { Privilege::IncreaseQuota,                  L"SeIncreaseQuotaPrivilege" },
            { Privilege::IncreaseWorkingSet,             L"SeIncreaseWorkingSetPrivilege" },
            { Privilege::LoadDriver,                     L"SeLoadDriverPrivilege" },
            { Privilege::LockMemory,                     L"SeLockMemoryPrivilege" },
            { Privilege::MachineAccount,                 L"SeMachineAccountPrivilege" },
            { Privilege::ManageVolume,                   L"SeManageVolumePrivilege" },
            { Privilege::ProfileSingleProcess,           L"SeProfileSingleProcessPrivilege" },
            { Privilege::Relabel,                        L"SeRelabelPrivilege" },
            { Privilege::RemoteShutdown,                 L"SeRemoteShutdownPrivilege" },
            { Privilege::Restore,                        L"SeRestorePrivilege" },
            { Privilege::Security,                       L"SeSecurityPrivilege" },
            { Privilege::Shutdown,                       L"SeShutdownPrivilege" },
            { Privilege::SyncAgent,                      L"SeSyncAgentPrivilege" },
            { Privilege::SystemEnvironment,              L"SeSystemEnvironmentPrivilege" },
            { Privilege::SystemProfile,                  L"SeSystemProfilePrivilege" },
            { Privilege::SystemTime,                     L"SeSystemtimePrivilege" },
            { Privilege::TakeOwnership,                  L"SeTakeOwnershipPrivilege" },
            { Privilege::TrustedComputerBase,            L"SeTcbPrivilege" },
            { Privilege::TimeZone,                       L"SeTimeZonePrivilege" },
            { Privilege::TrustedCredentialManagerAccess, L"SeTrustedCredManAccessPrivilege" },
            { Privilege::Undock,                         L"SeUndockPrivilege" },
            { Privilege::UnsolicitedInput,               L"SeUnsolicitedInputPrivilege" },
        } };

        constexpr bool TableMatchesEnum() noexcept {
            for (size_t i = 0; i < kPrivilegeTable.size(); ++i) {
                if (static_cast<size_t>(kPrivilegeTable[i].privilege) != i) {
                    return false;
                }
            }
            return true;
        }
        static_assert(TableMatchesEnum(), "privilege table out of order");

        constexpr std::array<Privilege, kPrivilegeCount> BuildAll() noexcept {
            std::array<Privilege, kPrivilegeCount> all{};
            for (size_t i = 0; i < all.size(); ++i) {
                all[i] = kPrivilegeTable[i].privilege;
            }
            return all;
        }

    }

    const std::array<Privilege, kPrivilegeCount>& AllPrivileges() noexcept {
        static constexpr std::array<Privilege, kPrivilegeCount> kAll = BuildAll();
        return kAll;
    }

    std::wstring_view PrivilegeName(Privilege privilege) noexcept {
        const auto index = static_cast<size_t>(privilege);
        if (index >= kPrivilegeTable.size()) {
            return {};
        }
        return kPrivilegeTable[index].name;
    }

    std::optional<Privilege> TryParsePrivilege(std::wstring_view name) noexcept {
        if (name.empty()) {
            return std::nullopt;
        }
        for (const auto& entry : kPrivilegeTable) {
            if (Utils::StringUtils::EqualsIgnoreCase(entry.name, name)) {
                return entry.privilege;
            }
        }
        return std::nullopt;
    }

    const wchar_t* PrivilegeStateToString(PrivilegeState state) noexcept {
        switch (state) {
        case PrivilegeState::Disabled: return L"Disabled";
        case PrivilegeState::Enabled:  return L"Enabled";
        case PrivilegeState::Removed:  return L"Removed";
        default:                       return L"Unknown";
        }
    }

    const wchar_t* AdjustPrivilegeResultToString(AdjustPrivilegeResult result) noexcept {
        switch (result) {
        case AdjustPrivilegeResult::None:              return L"None";
        case AdjustPrivilegeResult::PrivilegeModified: return L"PrivilegeModified";
        default:                                       return L"Unknown";
        }
    }

}  // namespace PrivGuard::Privileges
