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

#ifdef _WIN32

#include "INativeTokenApi.hpp"

namespace PrivGuard::Native {

    /**
     * @brief INativeTokenApi backed by advapi32/kernel32.
     *
     * Stateless; a single instance can serve the whole process.
     */
    class Win32TokenApi final : public INativeTokenApi {
    public:
        [[nodiscard]] ProcessId CurrentProcessId() const noexcept override;

        [[nodiscard]] NativeErrorCode OpenProcess(ProcessId pid, AccessMask desiredAccess,
                                                  NativeHandle& process) noexcept override;
        [[nodiscard]] NativeErrorCode OpenProcessToken(NativeHandle process, AccessMask desiredAccess,
                                                       NativeHandle& token) noexcept override;
        [[nodiscard]] NativeErrorCode CloseHandle(NativeHandle handle) noexcept override;

        [[nodiscard]] NativeErrorCode LookupLuidByName(std::wstring_view name, Luid& luid) noexcept override;
        [[nodiscard]] NativeErrorCode LookupNameByLuid(const Luid& luid, wchar_t* buffer,
                                                          uint32_t& length) noexcept override;

        [[nodiscard]] NativeErrorCode GetTokenPrivileges(NativeHandle token, void* buffer, uint32_t length,
                                                         uint32_t& returnLength) noexcept override;
        [[nodiscard]] NativeErrorCode AdjustTokenPrivileges(NativeHandle token, const TokenPrivilege& newState,
                                                            TokenPrivilege* previousState,
                                                            uint32_t& returnLength) noexcept override;
    };

}  // namespace PrivGuard::Native

#endif // _WIN32
