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

#include <optional>
#include <string_view>
#include <utility>

#include "AllocatedMemory.hpp"
#include "NativeError.hpp"
#include "../Utils/Logger.hpp"

namespace PrivGuard::Native {

    /**
     * @brief Probe-then-allocate-and-retry protocol for size-discovering OS queries.
     *
     * @param operation Name used in errors and log lines
     * @param probe     `NativeErrorCode(uint32_t& requiredBytes)`. Calls the OS
     *                  with an empty buffer.
     * @param fill      `NativeErrorCode(void* buffer, uint32_t byteCount)`. Calls
     *                  the OS again with a buffer of the size the probe reported.
     *
     * @return The filled buffer, or std::nullopt when the probe succeeded
     *         outright (the OS had nothing to return).
     * @throws NativeCallError when the probe fails with anything other than
     *         InsufficientBuffer, or when the fill fails.
     */
    template <typename Probe, typename Fill>
    [[nodiscard]] std::optional<AllocatedMemory> QueryVariableLengthBuffer(std::wstring_view operation,
                                                                           Probe&& probe, Fill&& fill) {
        uint32_t required = 0;
        const NativeErrorCode probeStatus = std::forward<Probe>(probe)(required);
        if (probeStatus == ErrorCodes::Success) {
            return std::nullopt;
        }
        if (probeStatus != ErrorCodes::InsufficientBuffer) {
            PG_LOG_NATIVE_ERROR(L"Native", probeStatus, L"%.*ls size probe failed",
                                static_cast<int>(operation.size()), operation.data());
            throw NativeCallError(probeStatus, operation);
        }
        if (required == 0) {
            // InsufficientBuffer with no size is a broken contract
            throw NativeCallError(ErrorCodes::InvalidData, operation);
        }

        AllocatedMemory buffer(required);
        const NativeErrorCode fillStatus = std::forward<Fill>(fill)(buffer.Get(), required);
        if (fillStatus != ErrorCodes::Success) {
            PG_LOG_NATIVE_ERROR(L"Native", fillStatus, L"%.*ls failed with a %u byte buffer",
                                static_cast<int>(operation.size()), operation.data(), required);
            throw NativeCallError(fillStatus, operation);
        }
        return std::optional<AllocatedMemory>(std::move(buffer));
    }

}  // namespace PrivGuard::Native
