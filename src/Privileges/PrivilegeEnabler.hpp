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
 * PrivGuard - PRIVILEGE ENABLER
 * ============================================================================
 *
 * @file PrivilegeEnabler.hpp
 * @brief Scoped enabling of privileges with exactly-once restoration.
 *
 * An enabler turns privileges on for the duration of its lifetime and turns
 * back off only the ones it changed itself. The context's ownership ledger
 * makes sure at most one live enabler is responsible for a given privilege,
 * so nested or concurrent enablers never fight over it:
 *
 * @code
 *   PrivilegeContext context(api);
 *   {
 *       PrivilegeEnabler enabler(context, pid, { Privilege::Backup, Privilege::Restore });
 *       // ... back up files ...
 *   }   // Backup and Restore are disabled again, if this enabler enabled them
 * @endcode
 *
 * Enablers sharing a token should be released in reverse order of
 * acquisition; nested scopes give that ordering for free.
 *
 * ============================================================================
 */

#pragma once

#include <atomic>
#include <initializer_list>
#include <memory>
#include <optional>
#include <vector>

#include "PrivilegeContext.hpp"

namespace PrivGuard::Privileges {

    class PrivilegeEnabler {
    public:
        /// @brief Bind to a caller-supplied token. The token cache is not involved.
        PrivilegeEnabler(PrivilegeContext& context, std::shared_ptr<Native::AccessTokenHandle> token);
        PrivilegeEnabler(PrivilegeContext& context, std::shared_ptr<Native::AccessTokenHandle> token,
                         std::initializer_list<Privilege> privileges);

        /**
         * @brief Bind to the token of @p pid, shared through the context's token cache.
         * @throws Native::NativeCallError if the process or token cannot be opened
         */
        PrivilegeEnabler(PrivilegeContext& context, Native::ProcessId pid);
        PrivilegeEnabler(PrivilegeContext& context, Native::ProcessId pid, std::initializer_list<Privilege> privileges);

        ~PrivilegeEnabler();

        // The ledger records enablers by address
        PrivilegeEnabler(const PrivilegeEnabler&) = delete;
        PrivilegeEnabler& operator=(const PrivilegeEnabler&) = delete;
        PrivilegeEnabler(PrivilegeEnabler&&) = delete;
        PrivilegeEnabler& operator=(PrivilegeEnabler&&) = delete;

        /**
         * @brief Enable @p privilege if nobody owns it and it is currently Disabled.
         *
         * @return PrivilegeModified when this enabler turned it on and now owns
         *         it; None when another enabler owns it, it is already enabled,
         *         it is removed or absent, or this enabler is disposed.
         * @throws Native::NativeCallError on native failure only
         */
        AdjustPrivilegeResult EnablePrivilege(Privilege privilege);

        /**
         * @brief Disable every privilege this enabler turned on and release its token.
         *
         * Idempotent. Each disable is attempted even if an earlier one failed;
         * the first failure is rethrown once all releases are done.
         */
        void Dispose();

        /// @brief Privileges this enabler is responsible for, in acquisition order.
        [[nodiscard]] std::vector<Privilege> OwnedPrivileges() const;

        [[nodiscard]] bool IsDisposed() const noexcept { return m_disposed.load(std::memory_order_acquire); }

        /// @brief Bound token; empty after Dispose().
        [[nodiscard]] const std::shared_ptr<Native::AccessTokenHandle>& Token() const noexcept { return m_token; }

    private:
        void EnableInitial(std::initializer_list<Privilege> privileges);

        PrivilegeContext* m_context;
        std::shared_ptr<Native::AccessTokenHandle> m_token;
        std::optional<Native::ProcessId> m_cachedProcess;

        // Both guarded by the context's ledger mutex
        std::vector<Privilege> m_owned;
        std::atomic<bool> m_disposed{ false };
    };

}  // namespace PrivGuard::Privileges
