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
 * PrivGuard - PROCESS PRIVILEGES
 * ============================================================================
 *
 * @file ProcessPrivileges.hpp
 * @brief One-shot privilege queries and adjustments for a token or a process.
 *
 * The ProcessId overloads open a short-lived token (Query for reads,
 * Query | AdjustPrivileges for adjustments) that is closed before returning.
 * They do not consult the ownership ledger: disabling a privilege that a live
 * PrivilegeEnabler owns is the caller's decision.
 *
 * ============================================================================
 */

#pragma once

#include <memory>

#include "PrivilegeCollection.hpp"
#include "PrivilegeContext.hpp"

namespace PrivGuard::Privileges {
    namespace ProcessPrivileges {

        /// @throws Native::NativeCallError if the process or its token cannot be opened
        [[nodiscard]] std::shared_ptr<Native::AccessTokenHandle> OpenAccessToken(PrivilegeContext& context,
                                                                                 Native::ProcessId pid,
                                                                                 Native::AccessMask rights);

        // ============================================================================
        // Queries
        // ============================================================================

        [[nodiscard]] PrivilegeCollection GetPrivileges(PrivilegeContext& context, const Native::AccessTokenHandle& token);
        [[nodiscard]] PrivilegeCollection GetPrivileges(PrivilegeContext& context, Native::ProcessId pid);

        [[nodiscard]] PrivilegeAttributes GetPrivilegeAttributes(PrivilegeContext& context,
                                                                 const Native::AccessTokenHandle& token,
                                                                 Privilege privilege);
        [[nodiscard]] PrivilegeAttributes GetPrivilegeAttributes(PrivilegeContext& context, Native::ProcessId pid,
                                                                 Privilege privilege);

        [[nodiscard]] PrivilegeState GetPrivilegeState(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                                       Privilege privilege);
        [[nodiscard]] PrivilegeState GetPrivilegeState(PrivilegeContext& context, Native::ProcessId pid,
                                                       Privilege privilege);

        // ============================================================================
        // Adjustments
        // ============================================================================

        AdjustPrivilegeResult EnablePrivilege(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                              Privilege privilege);
        AdjustPrivilegeResult EnablePrivilege(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege);

        AdjustPrivilegeResult DisablePrivilege(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                               Privilege privilege);
        AdjustPrivilegeResult DisablePrivilege(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege);

        AdjustPrivilegeResult RemovePrivilege(PrivilegeContext& context, const Native::AccessTokenHandle& token,
                                              Privilege privilege);
        AdjustPrivilegeResult RemovePrivilege(PrivilegeContext& context, Native::ProcessId pid, Privilege privilege);

    }  // namespace ProcessPrivileges
}  // namespace PrivGuard::Privileges
