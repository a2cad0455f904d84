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
#include "Win32TokenApi.hpp"

#ifdef _WIN32

#include <string>

#pragma comment(lib, "advapi32.lib")

namespace PrivGuard::Native {

    static_assert(sizeof(Luid) == sizeof(LUID), "Luid layout mismatch");
    static_assert(sizeof(LuidAndAttributes) == sizeof(LUID_AND_ATTRIBUTES), "LuidAndAttributes layout mismatch");
    static_assert(sizeof(TokenPrivilege) == sizeof(TOKEN_PRIVILEGES), "TokenPrivilege layout mismatch");
    static_assert(ErrorCodes::InsufficientBuffer == ERROR_INSUFFICIENT_BUFFER, "error code mismatch");
    static_assert(ErrorCodes::NotAllAssigned == ERROR_NOT_ALL_ASSIGNED, "error code mismatch");
    static_assert(ErrorCodes::NoSuchPrivilege == ERROR_NO_SUCH_PRIVILEGE, "error code mismatch");
    static_assert(TokenAccessRights::AdjustPrivileges == TOKEN_ADJUST_PRIVILEGES, "access mask mismatch");
    static_assert(TokenAccessRights::Query == TOKEN_QUERY, "access mask mismatch");

    namespace {

        [[nodiscard]] NativeErrorCode LastError() noexcept {
            const DWORD le = ::GetLastError();
            // A failing call that left no error code is still a failure
            return le == ERROR_SUCCESS ? static_cast<NativeErrorCode>(ERROR_GEN_FAILURE) : static_cast<NativeErrorCode>(le);
        }

    }

    ProcessId Win32TokenApi::CurrentProcessId() const noexcept {
        return static_cast<ProcessId>(::GetCurrentProcessId());
    }

    NativeErrorCode Win32TokenApi::OpenProcess(ProcessId pid, AccessMask desiredAccess, NativeHandle& process) noexcept {
        process = nullptr;
        if (pid == ::GetCurrentProcessId()) {
            // Pseudo-handle: always valid, CloseHandle on it is a harmless no-op
            process = ::GetCurrentProcess();
            return ErrorCodes::Success;
        }

        HANDLE h = ::OpenProcess(desiredAccess, FALSE, pid);
        if (h == nullptr) {
            return LastError();
        }
        process = h;
        return ErrorCodes::Success;
    }

    NativeErrorCode Win32TokenApi::OpenProcessToken(NativeHandle process, AccessMask desiredAccess, NativeHandle& token) noexcept {
        token = nullptr;
        HANDLE h = nullptr;
        if (!::OpenProcessToken(static_cast<HANDLE>(process), desiredAccess, &h)) {
            return LastError();
        }
        token = h;
        return ErrorCodes::Success;
    }

    NativeErrorCode Win32TokenApi::CloseHandle(NativeHandle handle) noexcept {
        if (!::CloseHandle(static_cast<HANDLE>(handle))) {
            return LastError();
        }
        return ErrorCodes::Success;
    }

    NativeErrorCode Win32TokenApi::LookupLuidByName(std::wstring_view name, Luid& luid) noexcept {
        std::wstring terminated;
        try {
            terminated.assign(name);
        }
        catch (const std::bad_alloc&) {
            return ERROR_NOT_ENOUGH_MEMORY;
        }

        LUID native{};
        if (!::LookupPrivilegeValueW(nullptr, terminated.c_str(), &native)) {
            return LastError();
        }
        luid.lowPart = native.LowPart;
        luid.highPart = native.HighPart;
        return ErrorCodes::Success;
    }

    NativeErrorCode Win32TokenApi::LookupNameByLuid(const Luid& luid, wchar_t* buffer, uint32_t& length) noexcept {
        LUID native{};
        native.LowPart = luid.lowPart;
        native.HighPart = luid.highPart;

        DWORD cch = length;
        if (!::LookupPrivilegeNameW(nullptr, &native, buffer, &cch)) {
            const NativeErrorCode le = LastError();
            if (le == ErrorCodes::InsufficientBuffer) {
                length = cch;
            }
            return le;
        }
        length = cch;
        return ErrorCodes::Success;
    }

    NativeErrorCode Win32TokenApi::GetTokenPrivileges(NativeHandle token, void* buffer, uint32_t length,
                                                      uint32_t& returnLength) noexcept {
        DWORD needed = 0;
        if (!::GetTokenInformation(static_cast<HANDLE>(token), TokenPrivileges, buffer, length, &needed)) {
            returnLength = needed;
            return LastError();
        }
        returnLength = needed;
        return ErrorCodes::Success;
    }

    NativeErrorCode Win32TokenApi::AdjustTokenPrivileges(NativeHandle token, const TokenPrivilege& newState,
                                                         TokenPrivilege* previousState, uint32_t& returnLength) noexcept {
        TOKEN_PRIVILEGES requested{};
        std::memcpy(&requested, &newState, sizeof(requested));

        DWORD needed = 0;
        ::SetLastError(ERROR_SUCCESS);
        if (!::AdjustTokenPrivileges(static_cast<HANDLE>(token), FALSE, &requested,
                                     previousState ? static_cast<DWORD>(sizeof(TOKEN_PRIVILEGES)) : 0,
                                     reinterpret_cast<PTOKEN_PRIVILEGES>(previousState),
                                     previousState ? &needed : nullptr)) {
            returnLength = needed;
            return LastError();
        }
        returnLength = needed;

        // Success path: GetLastError() distinguishes full from partial assignment
        const DWORD le = ::GetLastError();
        return le == ERROR_NOT_ALL_ASSIGNED ? ErrorCodes::NotAllAssigned : ErrorCodes::Success;
    }

}  // namespace PrivGuard::Native

#endif // _WIN32
