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
 * PrivGuard - LUID RESOLVER
 * ============================================================================
 *
 * @file LuidResolver.hpp
 * @brief Privilege <-> LUID mapping with a memoizing cache.
 *
 * LUIDs are stable for the life of a boot, so a resolved value is cached for
 * the lifetime of the resolver and never invalidated. Reads take a shared
 * lock; a miss performs the lookup outside any lock and inserts under an
 * exclusive one. Two racing misses for the same privilege both hit the OS;
 * the first insert wins.
 *
 * ============================================================================
 */

#pragma once

#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "Privilege.hpp"
#include "../Native/INativeTokenApi.hpp"

namespace PrivGuard::Privileges {

    class LuidResolver {
    public:
        explicit LuidResolver(Native::INativeTokenApi& api) noexcept;

        LuidResolver(const LuidResolver&) = delete;
        LuidResolver& operator=(const LuidResolver&) = delete;

        /**
         * @brief LUID for @p privilege, looked up once then served from cache.
         * @throws Native::NativeCallError if the OS lookup fails
         */
        [[nodiscard]] Native::Luid Resolve(Privilege privilege);

        /**
         * @brief LUID for an arbitrary OS privilege name.
         *
         * Known names go through the cache. Unknown names are passed to the OS
         * uncached, which typically fails with NoSuchPrivilege.
         * @throws Native::NativeCallError if the OS lookup fails
         */
        [[nodiscard]] Native::Luid ResolveName(std::wstring_view name);

        /**
         * @brief OS name for @p luid (e.g. L"SeBackupPrivilege").
         *
         * Empty when the OS reports the name without needing a buffer.
         * @throws Native::NativeCallError on any failure besides the expected
         *         size-probe InsufficientBuffer
         */
        [[nodiscard]] std::wstring NameOf(const Native::Luid& luid);

        /// @brief Resolve every privilege in @p privileges now.
        void Prewarm(std::span<const Privilege> privileges);

        [[nodiscard]] size_t CachedCount() const;

        [[nodiscard]] Native::INativeTokenApi& Api() const noexcept { return *m_api; }

    private:
        Native::INativeTokenApi* m_api;

        mutable std::shared_mutex m_mutex;
        std::unordered_map<Privilege, Native::Luid> m_cache;
    };

}  // namespace PrivGuard::Privileges
