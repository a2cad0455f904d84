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
#include "Handles.hpp"
#include "NativeError.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace PrivGuard::Native {

    // ============================================================================
    // ProcessHandle
    // ============================================================================

    ProcessHandle::ProcessHandle(INativeTokenApi& api, ProcessId pid, AccessMask desiredAccess)
        : m_api(&api), m_pid(pid) {
        NativeHandle h = nullptr;
        const NativeErrorCode rc = m_api->OpenProcess(pid, desiredAccess, h);
        if (rc != ErrorCodes::Success) {
            PG_LOG_NATIVE_ERROR(L"Handles", rc, L"OpenProcess failed (pid=%u, access=0x%08X)", pid, desiredAccess);
            throw NativeCallError(rc, L"OpenProcess");
        }
        m_handle = h;
    }

    ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
        : m_api(other.m_api), m_pid(other.m_pid), m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    void ProcessHandle::Close() noexcept {
        if (m_handle == nullptr) {
            return;
        }
        const NativeErrorCode rc = m_api->CloseHandle(m_handle);
        if (rc != ErrorCodes::Success) {
            PG_LOG_NATIVE_ERROR(L"Handles", rc, L"CloseHandle failed for process handle (pid=%u)", m_pid);
        }
        m_handle = nullptr;
    }

    // ============================================================================
    // AccessTokenHandle
    // ============================================================================

    AccessTokenHandle::AccessTokenHandle(INativeTokenApi& api, const ProcessHandle& process, AccessMask rights)
        : m_api(&api), m_pid(process.Id()), m_rights(rights) {
        NativeHandle h = nullptr;
        const NativeErrorCode rc = m_api->OpenProcessToken(process.Get(), rights, h);
        if (rc != ErrorCodes::Success) {
            PG_LOG_NATIVE_ERROR(L"Handles", rc, L"OpenProcessToken failed (pid=%u, rights=0x%08X)", m_pid, rights);
            throw NativeCallError(rc, L"OpenProcessToken");
        }
        m_handle = h;
        PG_LOG_DEBUG(L"Handles", L"Opened access token for pid %u (rights=0x%08X)", m_pid, rights);
    }

    AccessTokenHandle::~AccessTokenHandle() {
        try {
            Close();
        }
        catch (const NativeCallError& ex) {
            PG_LOG_FATAL(L"Handles", L"Access token for pid %u could not be closed: %ls", m_pid,
                         Utils::StringUtils::StringToWString(ex.what()).c_str());
        }
    }

    void AccessTokenHandle::Close() {
        if (m_handle == nullptr) {
            return;
        }
        NativeHandle h = m_handle;
        m_handle = nullptr;
        const NativeErrorCode rc = m_api->CloseHandle(h);
        if (rc != ErrorCodes::Success) {
            throw NativeCallError(rc, L"CloseHandle");
        }
        PG_LOG_DEBUG(L"Handles", L"Closed access token for pid %u", m_pid);
    }

}  // namespace PrivGuard::Native
