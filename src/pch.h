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
/*
 * ============================================================================
 * PrivGuard - PRECOMPILED HEADER
 * ============================================================================
 * Includes: Stable STL and, on Windows, the stripped Windows SDK.
 * ============================================================================
 */

#ifndef PCH_H
#define PCH_H

#pragma once

// Windows API - Stripped for performance
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

// C++20 Standard Library - Core & Containers
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <algorithm>
#include <iterator>
#include <type_traits>
#include <stdexcept>

// C++20 - Concurrency & Time
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <chrono>

// Performance & Memory
#include <limits>

#endif // PCH_H
