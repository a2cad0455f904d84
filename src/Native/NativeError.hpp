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

#include <stdexcept>
#include <string>
#include <string_view>

#include "NativeTypes.hpp"

namespace PrivGuard::Native {

    /**
     * @brief Thrown when a native token or handle primitive reports failure.
     *
     * Carries the OS error code and the name of the failing operation.
     * Privilege adjustment has no safe automatic retry, so callers receive
     * the failure as-is.
     */
    class NativeCallError : public std::runtime_error {
    public:
        NativeCallError(NativeErrorCode code, std::wstring_view operation);

        [[nodiscard]] NativeErrorCode Code() const noexcept { return m_code; }
        [[nodiscard]] const std::wstring& Operation() const noexcept { return m_operation; }

    private:
        NativeErrorCode m_code;
        std::wstring m_operation;
    };

    /// @brief Short description for an error code ("access denied", ...).
    [[nodiscard]] std::wstring DescribeNativeError(NativeErrorCode code);

    /// @brief Throws NativeCallError unless @p code is Success.
    void ThrowIfFailed(NativeErrorCode code, std::wstring_view operation);

}  // namespace PrivGuard::Native
