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
 * PrivGuard - NATIVE TOKEN API
 * ============================================================================
 *
 * @file INativeTokenApi.hpp
 * @brief Abstract capability over the OS process/token primitives.
 *
 * Every privilege operation in PrivGuard reaches the OS through this
 * interface. Each call mirrors one advapi32/kernel32 function and reports
 * its outcome as a NativeErrorCode (ErrorCodes::Success on success) instead
 * of a BOOL plus GetLastError(), so callers never depend on thread-local
 * error state.
 *
 * Size discovery follows the Win32 convention: a call with a buffer that is
 * too small (including a zero-length probe) returns InsufficientBuffer and
 * writes the required size to its length out-parameter.
 *
 * Implementations must be safe to call concurrently from several threads.
 * ============================================================================
 */

#pragma once

#include <string_view>

#include "NativeTypes.hpp"

namespace PrivGuard::Native {

    class INativeTokenApi {
    public:
        virtual ~INativeTokenApi() = default;

        /// @brief Identity of the calling process.
        [[nodiscard]] virtual ProcessId CurrentProcessId() const noexcept = 0;

        /// @brief OpenProcess.
        [[nodiscard]] virtual NativeErrorCode OpenProcess(ProcessId pid, AccessMask desiredAccess,
                                                          NativeHandle& process) noexcept = 0;

        /// @brief OpenProcessToken.
        [[nodiscard]] virtual NativeErrorCode OpenProcessToken(NativeHandle process, AccessMask desiredAccess,
                                                               NativeHandle& token) noexcept = 0;

        /// @brief CloseHandle.
        [[nodiscard]] virtual NativeErrorCode CloseHandle(NativeHandle handle) noexcept = 0;

        /// @brief LookupPrivilegeValueW on the local system.
        [[nodiscard]] virtual NativeErrorCode LookupLuidByName(std::wstring_view name, Luid& luid) noexcept = 0;

        /**
         * @brief LookupPrivilegeNameW on the local system.
         * @param luid Identifier to name
         * @param buffer Destination, may be null when @p length is 0
         * @param length In: capacity in characters. Out: characters written
         *               (excluding terminator) on success, or required
         *               capacity (including terminator) on InsufficientBuffer.
         */
        [[nodiscard]] virtual NativeErrorCode LookupNameByLuid(const Luid& luid, wchar_t* buffer,
                                                                  uint32_t& length) noexcept = 0;

        /**
         * @brief GetTokenInformation(TokenPrivileges).
         * @param returnLength Bytes written, or bytes required on InsufficientBuffer.
         */
        [[nodiscard]] virtual NativeErrorCode GetTokenPrivileges(NativeHandle token, void* buffer, uint32_t length,
                                                                 uint32_t& returnLength) noexcept = 0;

        /**
         * @brief AdjustTokenPrivileges for a single privilege.
         *
         * Returns NotAllAssigned when the call itself succeeded but the token
         * does not hold the privilege. @p previousState receives only the
         * entries whose state actually changed.
         */
        [[nodiscard]] virtual NativeErrorCode AdjustTokenPrivileges(NativeHandle token, const TokenPrivilege& newState,
                                                                    TokenPrivilege* previousState,
                                                                    uint32_t& returnLength) noexcept = 0;
    };

}  // namespace PrivGuard::Native
