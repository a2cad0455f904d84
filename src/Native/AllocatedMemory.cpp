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
#include "AllocatedMemory.hpp"

#include <cstdlib>
#include <new>

namespace PrivGuard::Native {

    AllocatedMemory::AllocatedMemory(size_t byteCount) {
        if (byteCount == 0) {
            return;
        }
        m_data = std::calloc(1, byteCount);
        if (m_data == nullptr) {
            throw std::bad_alloc();
        }
        m_size = byteCount;
    }

    AllocatedMemory::AllocatedMemory(AllocatedMemory&& other) noexcept
        : m_data(other.m_data), m_size(other.m_size) {
        other.m_data = nullptr;
        other.m_size = 0;
    }

    AllocatedMemory& AllocatedMemory::operator=(AllocatedMemory&& other) noexcept {
        if (this != &other) {
            Reset();
            m_data = other.m_data;
            m_size = other.m_size;
            other.m_data = nullptr;
            other.m_size = 0;
        }
        return *this;
    }

    void AllocatedMemory::Reset() noexcept {
        if (m_data) {
            std::free(m_data);
            m_data = nullptr;
        }
        m_size = 0;
    }

}  // namespace PrivGuard::Native
