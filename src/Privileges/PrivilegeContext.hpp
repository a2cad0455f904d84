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
 * PrivGuard - PRIVILEGE CONTEXT
 * ============================================================================
 *
 * @file PrivilegeContext.hpp
 * @brief Owner of the state shared by every enabler in a process.
 *
 * Three ledgers, each behind its own lock:
 *   - LUID cache (inside LuidResolver)
 *   - token handle cache: ProcessId -> {shared token, reference count}
 *   - ownership ledger: Privilege -> the enabler that turned it on
 *
 * Construct one context for the lifetime of the embedding application and
 * pass it by reference. It must outlive every enabler created against it.
 *
 * Lock order: ownership ledger, then token handle cache.
 *
 * ============================================================================
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "LuidResolver.hpp"
#include "../Native/Handles.hpp"

namespace PrivGuard::Privileges {

    class PrivilegeEnabler;

    struct ContextOptions {
        /// Rights requested when an enabler opens a token for a process identity
        Native::AccessMask tokenAccess = Native::TokenAccessRights::QueryAndAdjust;

        /// Privileges whose LUIDs are resolved when the context is constructed
        std::vector<Privilege> prewarm;
    };

    class PrivilegeContext {
    public:
        /**
         * @throws Native::NativeCallError if a prewarm lookup fails
         */
        explicit PrivilegeContext(Native::INativeTokenApi& api, ContextOptions options = {});
        ~PrivilegeContext();

        PrivilegeContext(const PrivilegeContext&) = delete;
        PrivilegeContext& operator=(const PrivilegeContext&) = delete;

        [[nodiscard]] Native::INativeTokenApi& Api() const noexcept { return *m_api; }
        [[nodiscard]] LuidResolver& Resolver() noexcept { return m_resolver; }
        [[nodiscard]] const ContextOptions& Options() const noexcept { return m_options; }

        // ------------------------------------------------------------------------
        // Token handle cache
        // ------------------------------------------------------------------------

        /**
         * @brief Shared token for @p pid, opened on first use.
         *
         * Each successful call takes one reference that must be returned with
         * ReleaseProcessToken.
         * @throws Native::NativeCallError if the process or its token cannot be opened
         */
        [[nodiscard]] std::shared_ptr<Native::AccessTokenHandle> AcquireProcessToken(Native::ProcessId pid);

        /// @brief Drop one reference; the entry leaves the cache at zero.
        void ReleaseProcessToken(Native::ProcessId pid) noexcept;

        [[nodiscard]] size_t CachedTokenCount() const;
        [[nodiscard]] size_t TokenReferenceCount(Native::ProcessId pid) const;

        // ------------------------------------------------------------------------
        // Ownership ledger
        // ------------------------------------------------------------------------

        /// @brief Enabler currently responsible for @p privilege, or nullptr.
        [[nodiscard]] const PrivilegeEnabler* OwnerOf(Privilege privilege) const;
        [[nodiscard]] size_t OwnedPrivilegeCount() const;

    private:
        friend class PrivilegeEnabler;

        struct CachedToken {
            std::shared_ptr<Native::AccessTokenHandle> token;
            size_t references = 0;
        };

        Native::INativeTokenApi* m_api;
        ContextOptions m_options;
        LuidResolver m_resolver;

        mutable std::mutex m_tokenMutex;
        std::unordered_map<Native::ProcessId, CachedToken> m_tokens;

        // Held by PrivilegeEnabler for its whole check/adjust/record sequence
        mutable std::mutex m_ledgerMutex;
        std::unordered_map<Privilege, const PrivilegeEnabler*> m_owners;
    };

}  // namespace PrivGuard::Privileges
