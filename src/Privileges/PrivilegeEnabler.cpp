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
#include "PrivilegeEnabler.hpp"
#include "PrivilegeAdjuster.hpp"
#include "TokenPrivilegeQuery.hpp"
#include "../Native/NativeError.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <exception>

namespace PrivGuard::Privileges {

    using Native::NativeCallError;

    namespace {

        std::shared_ptr<Native::AccessTokenHandle> RequireToken(std::shared_ptr<Native::AccessTokenHandle> token) {
            if (!token || !token->IsValid()) {
                throw std::invalid_argument("PrivilegeEnabler requires an open access token");
            }
            return token;
        }

    }

    // ============================================================================
    // Construction
    // ============================================================================

    PrivilegeEnabler::PrivilegeEnabler(PrivilegeContext& context, std::shared_ptr<Native::AccessTokenHandle> token)
        : m_context(&context)
        , m_token(RequireToken(std::move(token))) {
    }

    PrivilegeEnabler::PrivilegeEnabler(PrivilegeContext& context, std::shared_ptr<Native::AccessTokenHandle> token,
                                       std::initializer_list<Privilege> privileges)
        : PrivilegeEnabler(context, std::move(token)) {
        EnableInitial(privileges);
    }

    PrivilegeEnabler::PrivilegeEnabler(PrivilegeContext& context, Native::ProcessId pid)
        : m_context(&context)
        , m_token(context.AcquireProcessToken(pid))
        , m_cachedProcess(pid) {
    }

    PrivilegeEnabler::PrivilegeEnabler(PrivilegeContext& context, Native::ProcessId pid,
                                       std::initializer_list<Privilege> privileges)
        : PrivilegeEnabler(context, pid) {
        EnableInitial(privileges);
    }

    PrivilegeEnabler::~PrivilegeEnabler() {
        try {
            Dispose();
        }
        catch (const NativeCallError& ex) {
            PG_LOG_ERROR(L"Enabler", L"Releasing privileges on destruction failed: %ls",
                         Utils::StringUtils::StringToWString(ex.what()).c_str());
        }
        catch (const std::exception&) {
            // Typically bad_alloc; converting what() would allocate again
            PG_LOG_FATAL(L"Enabler", L"Releasing privileges on destruction failed unexpectedly");
        }
    }

    void PrivilegeEnabler::EnableInitial(std::initializer_list<Privilege> privileges) {
        // Delegating constructors have completed, so the destructor runs if this throws
        for (const Privilege privilege : privileges) {
            (void)EnablePrivilege(privilege);
        }
    }

    // ============================================================================
    // Enable / Dispose
    // ============================================================================

    AdjustPrivilegeResult PrivilegeEnabler::EnablePrivilege(Privilege privilege) {
        PrivilegeContext& ctx = *m_context;
        const std::wstring_view name = PrivilegeName(privilege);

        std::lock_guard<std::mutex> lock(ctx.m_ledgerMutex);

        if (m_disposed.load(std::memory_order_relaxed)) {
            PG_LOG_DEBUG(L"Enabler", L"%.*ls not enabled: enabler already disposed",
                         static_cast<int>(name.size()), name.data());
            return AdjustPrivilegeResult::None;
        }

        if (ctx.m_owners.find(privilege) != ctx.m_owners.end()) {
            PG_LOG_DEBUG(L"Enabler", L"%.*ls not enabled: owned by another enabler",
                         static_cast<int>(name.size()), name.data());
            return AdjustPrivilegeResult::None;
        }

        LuidResolver& resolver = ctx.Resolver();
        const PrivilegeCollection current = TokenPrivilegeQuery::QueryAll(resolver, *m_token);
        const PrivilegeState state = TokenPrivilegeQuery::StateOf(resolver, privilege, current);
        if (state != PrivilegeState::Disabled) {
            PG_LOG_DEBUG(L"Enabler", L"%.*ls not enabled: currently %ls",
                         static_cast<int>(name.size()), name.data(), PrivilegeStateToString(state));
            return AdjustPrivilegeResult::None;
        }

        if (PrivilegeAdjuster::Enable(resolver, *m_token, privilege) != AdjustPrivilegeResult::PrivilegeModified) {
            return AdjustPrivilegeResult::None;
        }

        m_owned.push_back(privilege);
        ctx.m_owners.emplace(privilege, this);
        PG_LOG_INFO(L"Enabler", L"Enabled %.*ls on pid %u", static_cast<int>(name.size()), name.data(),
                    m_token->OwnerProcess());
        return AdjustPrivilegeResult::PrivilegeModified;
    }

    void PrivilegeEnabler::Dispose() {
        if (IsDisposed()) {
            return;
        }
        PG_LOG_SCOPE(L"Enabler");

        PrivilegeContext& ctx = *m_context;
        std::exception_ptr firstError;
        std::shared_ptr<Native::AccessTokenHandle> token;

        {
            std::lock_guard<std::mutex> lock(ctx.m_ledgerMutex);
            if (m_disposed.load(std::memory_order_relaxed)) {
                return;
            }

            for (auto it = m_owned.rbegin(); it != m_owned.rend(); ++it) {
                const Privilege privilege = *it;
                const std::wstring_view name = PrivilegeName(privilege);
                try {
                    (void)PrivilegeAdjuster::Disable(ctx.Resolver(), *m_token, privilege);
                    PG_LOG_INFO(L"Enabler", L"Disabled %.*ls on pid %u", static_cast<int>(name.size()), name.data(),
                                m_token->OwnerProcess());
                }
                catch (const NativeCallError& ex) {
                    PG_LOG_ERROR(L"Enabler", L"Failed to disable %.*ls: %ls", static_cast<int>(name.size()), name.data(),
                                 Utils::StringUtils::StringToWString(ex.what()).c_str());
                    if (!firstError) {
                        firstError = std::current_exception();
                    }
                }
                auto owner = ctx.m_owners.find(privilege);
                if (owner != ctx.m_owners.end() && owner->second == this) {
                    ctx.m_owners.erase(owner);
                }
            }
            m_owned.clear();

            if (m_cachedProcess) {
                ctx.ReleaseProcessToken(*m_cachedProcess);
                m_cachedProcess.reset();
            }

            token = std::move(m_token);
            m_disposed.store(true, std::memory_order_release);
        }

        // Last reference, if it is ours, closes the token outside the ledger lock
        token.reset();

        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }

    std::vector<Privilege> PrivilegeEnabler::OwnedPrivileges() const {
        std::lock_guard<std::mutex> lock(m_context->m_ledgerMutex);
        return m_owned;
    }

}  // namespace PrivGuard::Privileges
