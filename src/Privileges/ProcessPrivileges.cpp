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
#include "ProcessPrivileges.hpp"
#include "PrivilegeAdjuster.hpp"
#include "TokenPrivilegeQuery.hpp"
#include "../Utils/Logger.hpp"

namespace PrivGuard::Privileges {
    namespace ProcessPrivileges {

        namespace TokenAccessRights = Native::TokenAccessRights;

        std::shared_ptr<Native::AccessTokenHandle> OpenAccessToken(PrivilegeContext& context, Native::ProcessId pid,
                                                                   Native::AccessMask rights) {
            Native::ProcessHandle process(context.Api(), pid, Native::ProcessAccessRights::QueryLimitedInformation);
            return std::make_shared<Native::AccessTokenHandle>(context.Api(), process, rights);
        }

        PrivilegeCollection GetPrivileges(PrivilegeContext& context, const Native::AccessTokenHandle& token) {
            return TokenPrivilegeQuery::QueryAll(context.Resolver(), token);
        }

        PrivilegeCollection GetPrivileges(PrivilegeContext& context, Native::ProcessId pid) {
            const auto token = OpenAccessToken(context, pid, TokenAccessRights::Query);
            return GetPrivileges(context, *token);
        }

        PrivilegeAttributes GetPrivilegeAttributes(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                                   Privilege privilege) {
            return TokenPrivilegeQuery::AttributesOf(context.Resolver(), privilege, GetPrivileges(context, token));
        }

        PrivilegeAttributes GetPrivilegeAttributes(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege) {
            const auto token = OpenAccessToken(context, pid, TokenAccessRights::Query);
            return GetPrivilegeAttributes(context, *token, privilege);
        }

        PrivilegeState GetPrivilegeState(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                         Privilege privilege) {
            return Privileges::GetPrivilegeState(GetPrivilegeAttributes(context, token, privilege));
        }

        PrivilegeState GetPrivilegeState(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege) {
            return Privileges::GetPrivilegeState(GetPrivilegeAttributes(context, pid, privilege));
        }

        AdjustPrivilegeResult EnablePrivilege(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                              Privilege privilege) {
            return PrivilegeAdjuster::Enable(context.Resolver(), token, privilege);
        }

        AdjustPrivilegeResult EnablePrivilege(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege) {
            const auto token = OpenAccessToken(context, pid, TokenAccessRights::QueryAndAdjust);
            return EnablePrivilege(context, *token, privilege);
        }

        AdjustPrivilegeResult DisablePrivilege(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                               Privilege privilege) {
            return PrivilegeAdjuster::Disable(context.Resolver(), token, privilege);
        }

        AdjustPrivilegeResult DisablePrivilege(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege) {
            const auto token = OpenAccessToken(context, pid, TokenAccessRights::QueryAndAdjust);
            return DisablePrivilege(context, *token, privilege);
        }

        AdjustPrivilegeResult RemovePrivilege(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                              Privilege privilege) {
            const std::wstring_view name = PrivilegeName(privilege);
            PG_LOG_WARN(L"Privileges", L"Removing %.*ls from token of pid %u; this cannot be undone",
                        static_cast<int>(name.size()), name.data(), token.OwnerProcess());
            return PrivilegeAdjuster::Remove(context.Resolver(), token, privilege);
        }

        AdjustPrivilegeResult RemovePrivilege(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege) {
            const auto token = OpenAccessToken(context, pid, TokenAccessRights::QueryAndAdjust);
            return RemovePrivilege(context, *token, privilege);
        }

    }  // namespace ProcessPrivileges
}  // namespace PrivGuard::Privileges
