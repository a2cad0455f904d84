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
#include "PrivilegeContext.hpp"
#include "../Native/NativeError.hpp"
#include "../Utils/Logger.hpp"

namespace PrivGuard::Privileges {

    PrivilegeContext::PrivilegeContext(Native::INativeTokenApi& api, ContextOptions options)
        : m_api(&api)
        , m_options(std::move(options))
        , m_resolver(api) {
        if (!m_options.prewarm.empty()) {
            m_resolver.Prewarm(m_options.prewarm);
        }
        PG_LOG_DEBUG(L"Context", L"Privilege context created (token access 0x%08X, %zu prewarmed)",
                     m_options.tokenAccess, m_resolver.CachedCount());
    }

    PrivilegeContext::~PrivilegeContext() {
        std::lock_guard<std::mutex> ledgerLock(m_ledgerMutex);
        if (!m_owners.empty()) {
            PG_LOG_WARN(L"Context", L"Context destroyed while %zu privileges are still owned by live enablers",
                        m_owners.size());
        }
        std::lock_guard<std::mutex> tokenLock(m_tokenMutex);
        if (!m_tokens.empty()) {
            PG_LOG_WARN(L"Context", L"Context destroyed with %zu cached process tokens", m_tokens.size());
        }
    }

    std::shared_ptr<Native::AccessTokenHandle> PrivilegeContext::AcquireProcessToken(Native::ProcessId pid) {
        std::lock_guard<std::mutex> lock(m_tokenMutex);

        auto it = m_tokens.find(pid);
        if (it != m_tokens.end()) {
            ++it->second.references;
            PG_LOG_TRACE(L"Context", L"Reusing cached token for pid %u (refs=%zu)", pid, it->second.references);
            return it->second.token;
        }

        // Opened under the lock so concurrent callers never open a second token for the same process
        Native::ProcessHandle process(*m_api, pid, Native::ProcessAccessRights::QueryLimitedInformation);
        auto token = std::make_shared<Native::AccessTokenHandle>(*m_api, process, m_options.tokenAccess);

        m_tokens.emplace(pid, CachedToken{ token, 1 });
        PG_LOG_INFO(L"Context", L"Opened token for pid %u", pid);
        return token;
    }

    void PrivilegeContext::ReleaseProcessToken(Native::ProcessId pid) noexcept {
        std::shared_ptr<Native::AccessTokenHandle> last;
        {
            std::lock_guard<std::mutex> lock(m_tokenMutex);
            auto it = m_tokens.find(pid);
            if (it == m_tokens.end()) {
                PG_LOG_WARN(L"Context", L"Release of uncached token for pid %u ignored", pid);
                return;
            }
            if (--it->second.references == 0) {
                last = std::move(it->second.token);
                m_tokens.erase(it);
                PG_LOG_INFO(L"Context", L"Released cached token for pid %u", pid);
            }
        }
        // Closing happens here, outside the cache lock, if nobody else holds the token
    }

    size_t PrivilegeContext::CachedTokenCount() const {
        std::lock_guard<std::mutex> lock(m_tokenMutex);
        return m_tokens.size();
    }

    size_t PrivilegeContext::TokenReferenceCount(Native::ProcessId pid) const {
        std::lock_guard<std::mutex> lock(m_tokenMutex);
        auto it = m_tokens.find(pid);
        return it == m_tokens.end() ? 0 : it->second.references;
    }

    const PrivilegeEnabler* PrivilegeContext::OwnerOf(Privilege privilege) const {
        std::lock_guard<std::mutex> lock(m_ledgerMutex);
        auto it = m_owners.find(privilege);
        return it == m_owners.end() ? nullptr : it->second;
    }

    size_t PrivilegeContext::OwnedPrivilegeCount() const {
        std::lock_guard<std::mutex> lock(m_ledgerMutex);
        return m_owners.size();
    }

}  // namespace PrivGuard::Privileges
