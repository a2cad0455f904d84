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

#include <cstddef>
#include <cstdint>

namespace PrivGuard::Native {

    /**
     * @brief Zero-initialized marshaling buffer, freed on every exit path.
     *
     * Holds the raw bytes a native query writes into. Move-only.
     * Allocation failure throws std::bad_alloc.
     */
    class AllocatedMemory {
    public:
        AllocatedMemory() noexcept = default;
        explicit AllocatedMemory(size_t byteCount);
        ~AllocatedMemory() { Reset(); }

        // No copy, allow move
        AllocatedMemory(const AllocatedMemory&) = delete;
        AllocatedMemory& operator=(const AllocatedMemory&) = delete;
        AllocatedMemory(AllocatedMemory&& other) noexcept;
        AllocatedMemory& operator=(AllocatedMemory&& other) noexcept;

        void Reset() noexcept;

        [[nodiscard]] void* Get() const noexcept { return m_data; }
        [[nodiscard]] const uint8_t* Bytes() const noexcept { return static_cast<const uint8_t*>(m_data); }
        [[nodiscard]] size_t Size() const noexcept { return m_size; }
        [[nodiscard]] bool IsValid() const noexcept { return m_data != nullptr; }

        explicit operator bool() const noexcept { return IsValid(); }

    private:
        void* m_data = nullptr;
        size_t m_size = 0;
    };

}  // namespace PrivGuard::Native
