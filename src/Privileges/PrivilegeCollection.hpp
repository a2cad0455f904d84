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

#include <cstddef>
#include <optional>
#include <vector>

#include "Privilege.hpp"

namespace PrivGuard::Privileges {

    /**
     * @brief Immutable (privilege, attributes) pair. Equal when both fields are.
     */
    class PrivilegeAndAttributes {
    public:
        constexpr PrivilegeAndAttributes(Privilege privilege, PrivilegeAttributes attributes) noexcept
            : m_privilege(privilege), m_attributes(attributes) {}

        [[nodiscard]] constexpr Privilege GetPrivilege() const noexcept { return m_privilege; }
        [[nodiscard]] constexpr PrivilegeAttributes Attributes() const noexcept { return m_attributes; }
        [[nodiscard]] constexpr PrivilegeState State() const noexcept { return GetPrivilegeState(m_attributes); }

        friend constexpr bool operator==(const PrivilegeAndAttributes& a, const PrivilegeAndAttributes& b) noexcept {
            return a.m_privilege == b.m_privilege && a.m_attributes == b.m_attributes;
        }
        friend constexpr bool operator!=(const PrivilegeAndAttributes& a, const PrivilegeAndAttributes& b) noexcept {
            return !(a == b);
        }

    private:
        Privilege m_privilege;
        PrivilegeAttributes m_attributes;
    };

    /**
     * @brief Point-in-time snapshot of the recognized privileges held by a token.
     *
     * Never live: later adjustments to the token are not reflected.
     */
    class PrivilegeCollection {
    public:
        using value_type = PrivilegeAndAttributes;
        using const_iterator = std::vector<PrivilegeAndAttributes>::const_iterator;

        PrivilegeCollection() = default;
        explicit PrivilegeCollection(std::vector<PrivilegeAndAttributes> items) noexcept
            : m_items(std::move(items)) {}

        [[nodiscard]] size_t Size() const noexcept { return m_items.size(); }
        [[nodiscard]] bool Empty() const noexcept { return m_items.empty(); }
        [[nodiscard]] const PrivilegeAndAttributes& operator[](size_t index) const { return m_items.at(index); }

        [[nodiscard]] const_iterator begin() const noexcept { return m_items.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return m_items.end(); }

        /// @brief Entry for @p privilege, if the token holds it.
        [[nodiscard]] std::optional<PrivilegeAndAttributes> Find(Privilege privilege) const noexcept;
        [[nodiscard]] bool Contains(Privilege privilege) const noexcept { return Find(privilege).has_value(); }

    private:
        std::vector<PrivilegeAndAttributes> m_items;
    };

}  // namespace PrivGuard::Privileges
