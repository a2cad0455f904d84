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
#include "PrivilegeCollection.hpp"
#include "../Native/Handles.hpp"

namespace PrivGuard::Privileges {
    namespace TokenPrivilegeQuery {

        /**
         * @brief Snapshot of every recognized privilege held by @p token.
         *
         * Reads the token's TOKEN_PRIVILEGES block (count followed by
         * LUID_AND_ATTRIBUTES records) and reverse-resolves each LUID. Privileges
         * the OS knows but PrivGuard does not are dropped. A token holding no
         * privileges yields an empty collection.
         *
         * @throws Native::NativeCallError on query failure, or InvalidData when
         *         the record count overruns the returned block
         */
        [[nodiscard]] PrivilegeCollection QueryAll(LuidResolver& resolver, const Native::AccessTokenHandle& token);

        /**
         * @brief Attributes of @p privilege in a previously fetched snapshot.
         *
         * A privilege absent from the snapshot was never granted to the token;
         * that is reported as Removed, after resolving its LUID so an invalid
         * privilege still surfaces a lookup failure.
         */
        [[nodiscard]] PrivilegeAttributes AttributesOf(LuidResolver& resolver, Privilege privilege,
                                                       const PrivilegeCollection& privileges);

        [[nodiscard]] PrivilegeState StateOf(LuidResolver& resolver, Privilege privilege,
                                             const PrivilegeCollection& privileges);

    }  // namespace TokenPrivilegeQuery
}  // namespace PrivGuard::Privileges
