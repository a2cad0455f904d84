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

#include "INativeTokenApi.hpp"

namespace PrivGuard::Native {

    // ============================================================================
    // Process Handle
    // ============================================================================

    /**
     * @brief RAII handle to a process identity.
     *
     * Opening throws NativeCallError; the handle is closed on destruction.
     */
    class ProcessHandle {
    public:
        ProcessHandle(INativeTokenApi& api, ProcessId pid, AccessMask desiredAccess);
        ~ProcessHandle() { Close(); }

        ProcessHandle(const ProcessHandle&) = delete;
        ProcessHandle& operator=(const ProcessHandle&) = delete;
        ProcessHandle(ProcessHandle&& other) noexcept;
        ProcessHandle& operator=(ProcessHandle&&) = delete;

        void Close() noexcept;

        [[nodiscard]] NativeHandle Get() const noexcept { return m_handle; }
        [[nodiscard]] ProcessId Id() const noexcept { return m_pid; }
        [[nodiscard]] bool IsValid() const noexcept { return m_handle != nullptr; }

    private:
        INativeTokenApi* m_api;
        ProcessId m_pid;
        NativeHandle m_handle = nullptr;
    };

    // ============================================================================
    // Access Token Handle
    // ============================================================================

    /**
     * @brief Exclusively owned handle to a process access token.
     *
     * Shared between enablers through std::shared_ptr; the OS handle is closed
     * exactly once, when the last holder lets go. A handle that refuses to close
     * means the process is in an unrecoverable resource state: Close() throws,
     * and the destructor logs the failure at Fatal level.
     */
    class AccessTokenHandle {
    public:
        AccessTokenHandle(INativeTokenApi& api, const ProcessHandle& process, AccessMask rights);
        ~AccessTokenHandle();

        AccessTokenHandle(const AccessTokenHandle&) = delete;
        AccessTokenHandle& operator=(const AccessTokenHandle&) = delete;

        /// @brief Close now. Idempotent. Throws NativeCallError on failure.
        void Close();

        [[nodiscard]] NativeHandle Get() const noexcept { return m_handle; }
        [[nodiscard]] ProcessId OwnerProcess() const noexcept { return m_pid; }
        [[nodiscard]] AccessMask Rights() const noexcept { return m_rights; }
        [[nodiscard]] bool IsValid() const noexcept { return m_handle != nullptr; }
        [[nodiscard]] INativeTokenApi& Api() const noexcept { return *m_api; }

    private:
        INativeTokenApi* m_api;
        ProcessId m_pid;
        AccessMask m_rights;
        NativeHandle m_handle = nullptr;
    };

}  // namespace PrivGuard::Native
