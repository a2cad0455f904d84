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

#include "LuidResolver.hpp"
#include "../Native/Handles.hpp"

namespace PrivGuard::Privileges {
    namespace PrivilegeAdjuster {

        /**
         * @brief Set @p privilege on @p token to @p target in one native call.
         *
         * @return PrivilegeModified when the token's state actually changed,
         *         None when it was already there or the token does not hold the
         *         privilege (the OS "not all assigned" outcome is not an error).
         * @throws Native::NativeCallError if the LUID lookup or the adjust call fails
         */
        [[nodiscard]] AdjustPrivilegeResult Adjust(LuidResolver& resolver, const Native::AccessTokenHandle& token,
                                                   Privilege privilege, PrivilegeAttributes target);

        [[nodiscard]] AdjustPrivilegeResult Enable(LuidResolver& resolver, const Native::AccessTokenHandle& token,
                                                   Privilege privilege);
        [[nodiscard]] AdjustPrivilegeResult Disable(LuidResolver& resolver, const Native::AccessTokenHandle& token,
                                                    Privilege privilege);

        /// @brief Remove permanently. A removed privilege can never be enabled again on this token.
        [[nodiscard]] AdjustPrivilegeResult Remove(LuidResolver& resolver, const Native::AccessTokenHandle& token,
                                                   Privilege privilege);

    }  // namespace PrivilegeAdjuster
}  // namespace PrivGuard::Privileges
