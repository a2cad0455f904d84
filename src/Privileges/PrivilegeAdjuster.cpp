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
#include "PrivilegeAdjuster.hpp"
#include "../Native/NativeError.hpp"
#include "../Utils/Logger.hpp"

namespace PrivGuard::Privileges {
    namespace PrivilegeAdjuster {

        namespace ErrorCodes = Native::ErrorCodes;
        using Native::NativeErrorCode;

        AdjustPrivilegeResult Adjust(LuidResolver& resolver, const Native::AccessTokenHandle& token,
                                     Privilege privilege, PrivilegeAttributes target) {
            const Native::Luid luid = resolver.Resolve(privilege);

            Native::TokenPrivilege newState{};
            newState.privilegeCount = 1;
            newState.privilege.luid = luid;
            newState.privilege.attributes = static_cast<uint32_t>(target);

            Native::TokenPrivilege previousState{};
            uint32_t returnLength = 0;
            const NativeErrorCode rc = token.Api().AdjustTokenPrivileges(token.Get(), newState, &previousState, returnLength);
            const std::wstring_view name = PrivilegeName(privilege);

            if (rc != ErrorCodes::Success && rc != ErrorCodes::NotAllAssigned) {
                PG_LOG_NATIVE_ERROR(L"Adjuster", rc, L"AdjustTokenPrivileges(%.*ls, 0x%08X) failed",
                                    static_cast<int>(name.size()), name.data(), static_cast<uint32_t>(target));
                throw Native::NativeCallError(rc, L"AdjustTokenPrivileges");
            }

            const AdjustPrivilegeResult result = previousState.privilegeCount == 1
                ? AdjustPrivilegeResult::PrivilegeModified
                : AdjustPrivilegeResult::None;

            PG_LOG_DEBUG(L"Adjuster", L"%.*ls -> 0x%08X on pid %u: %ls%ls",
                         static_cast<int>(name.size()), name.data(), static_cast<uint32_t>(target),
                         token.OwnerProcess(), AdjustPrivilegeResultToString(result),
                         rc == ErrorCodes::NotAllAssigned ? L" (not held by token)" : L"");
            return result;
        }

        AdjustPrivilegeResult Enable(LuidResolver& resolver, const Native::AccessTokenHandle& token, Privilege privilege) {
            return Adjust(resolver, token, privilege, PrivilegeAttributes::Enabled);
        }

        AdjustPrivilegeResult Disable(LuidResolver& resolver, const Native::AccessTokenHandle& token, Privilege privilege) {
            return Adjust(resolver, token, privilege, PrivilegeAttributes::Disabled);
        }

        AdjustPrivilegeResult Remove(LuidResolver& resolver, const Native::AccessTokenHandle& token, Privilege privilege) {
            return Adjust(resolver, token, privilege, PrivilegeAttributes::Removed);
        }

    }  // namespace PrivilegeAdjuster
}  // namespace PrivGuard::Privileges
