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
#include "LuidResolver.hpp"
#include "../Native/NativeError.hpp"
#include "../Native/VariableLengthQuery.hpp"
#include "../Utils/Logger.hpp"

namespace PrivGuard::Privileges {

    namespace ErrorCodes = Native::ErrorCodes;
    using Native::Luid;
    using Native::NativeCallError;
    using Native::NativeErrorCode;

    LuidResolver::LuidResolver(Native::INativeTokenApi& api) noexcept
        : m_api(&api) {
    }

    Luid LuidResolver::Resolve(Privilege privilege) {
        {
            std::shared_lock lock(m_mutex);
            auto it = m_cache.find(privilege);
            if (it != m_cache.end()) {
                return it->second;
            }
        }

        const std::wstring_view name = PrivilegeName(privilege);
        Luid luid{};
        const NativeErrorCode rc = m_api->LookupLuidByName(name, luid);
        if (rc != ErrorCodes::Success) {
            PG_LOG_NATIVE_ERROR(L"LuidResolver", rc, L"LookupPrivilegeValue failed for %.*ls",
                                static_cast<int>(name.size()), name.data());
            throw NativeCallError(rc, L"LookupPrivilegeValue");
        }

        std::unique_lock lock(m_mutex);
        auto [it, inserted] = m_cache.emplace(privilege, luid);
        if (inserted) {
            PG_LOG_TRACE(L"LuidResolver", L"Cached %.*ls -> %08X:%08X", static_cast<int>(name.size()), name.data(),
                         static_cast<uint32_t>(luid.highPart), luid.lowPart);
        }
        return it->second;
    }

    Luid LuidResolver::ResolveName(std::wstring_view name) {
        if (auto privilege = TryParsePrivilege(name)) {
            return Resolve(*privilege);
        }

        Luid luid{};
        const NativeErrorCode rc = m_api->LookupLuidByName(name, luid);
        if (rc != ErrorCodes::Success) {
            PG_LOG_DEBUG(L"LuidResolver", L"Unrecognized privilege name %.*ls (native error %u)",
                         static_cast<int>(name.size()), name.data(), rc);
            throw NativeCallError(rc, L"LookupPrivilegeValue");
        }
        return luid;
    }

    std::wstring LuidResolver::NameOf(const Luid& luid) {
        uint32_t written = 0;
        auto buffer = Native::QueryVariableLengthBuffer(
            L"LookupPrivilegeName",
            [&](uint32_t& requiredBytes) {
                uint32_t chars = 0;
                const NativeErrorCode rc = m_api->LookupNameByLuid(luid, nullptr, chars);
                requiredBytes = chars * static_cast<uint32_t>(sizeof(wchar_t));
                return rc;
            },
            [&](void* data, uint32_t byteCount) {
                written = byteCount / static_cast<uint32_t>(sizeof(wchar_t));
                return m_api->LookupNameByLuid(luid, static_cast<wchar_t*>(data), written);
            });

        if (!buffer) {
            return {};
        }

        const auto* chars = static_cast<const wchar_t*>(buffer->Get());
        const size_t capacity = buffer->Size() / sizeof(wchar_t);
        return std::wstring(chars, written < capacity ? written : capacity);
    }

    void LuidResolver::Prewarm(std::span<const Privilege> privileges) {
        for (const Privilege privilege : privileges) {
            (void)Resolve(privilege);
        }
        PG_LOG_DEBUG(L"LuidResolver", L"Prewarmed %zu privileges (%zu cached)", privileges.size(), CachedCount());
    }

    size_t LuidResolver::CachedCount() const {
        std::shared_lock lock(m_mutex);
        return m_cache.size();
    }

}  // namespace PrivGuard::Privileges
