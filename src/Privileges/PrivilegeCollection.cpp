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
#include "PrivilegeCollection.hpp"

namespace PrivGuard::Privileges {

    std::optional<PrivilegeAndAttributes> PrivilegeCollection::Find(Privilege privilege) const noexcept {
        for (const auto& item : m_items) {
            if (item.GetPrivilege() == privilege) {
                return item;
            }
        }
        return std::nullopt;
    }

}  // namespace PrivGuard::Privileges
