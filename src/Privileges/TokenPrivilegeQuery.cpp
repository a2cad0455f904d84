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
#include "TokenPrivilegeQuery.hpp"
#include "../Native/NativeError.hpp"
#include "../Native/VariableLengthQuery.hpp"
#include "../Utils/Logger.hpp"

namespace PrivGuard::Privileges {
    namespace TokenPrivilegeQuery {

        namespace ErrorCodes = Native::ErrorCodes;
        using Native::LuidAndAttributes;
        using Native::NativeCallError;

        namespace {

            std::vector<LuidAndAttributes> ReadTokenPrivileges(const Native::AccessTokenHandle& token) {
                Native::INativeTokenApi& api = token.Api();
                uint32_t returned = 0;

                auto buffer = Native::QueryVariableLengthBuffer(
                    L"GetTokenInformation(TokenPrivileges)",
                    [&](uint32_t& requiredBytes) {
                        return api.GetTokenPrivileges(token.Get(), nullptr, 0, requiredBytes);
                    },
                    [&](void* data, uint32_t byteCount) {
                        return api.GetTokenPrivileges(token.Get(), data, byteCount, returned);
                    });

                std::vector<LuidAndAttributes> records;
                if (!buffer) {
                    return records;
                }

                const size_t available = (returned != 0 && returned < buffer->Size()) ? returned : buffer->Size();
                if (available < Native::kTokenPrivilegesHeaderSize) {
                    throw NativeCallError(ErrorCodes::InvalidData, L"GetTokenInformation(TokenPrivileges)");
                }

                uint32_t count = 0;
                std::memcpy(&count, buffer->Bytes(), sizeof(count));

                const size_t payload = available - Native::kTokenPrivilegesHeaderSize;
                if (count > payload / sizeof(LuidAndAttributes)) {
                    PG_LOG_ERROR(L"TokenQuery", L"Privilege count %u overruns %zu byte block", count, available);
                    throw NativeCallError(ErrorCodes::InvalidData, L"GetTokenInformation(TokenPrivileges)");
                }

                records.resize(count);
                if (count != 0) {
                    std::memcpy(records.data(), buffer->Bytes() + Native::kTokenPrivilegesHeaderSize,
                                count * sizeof(LuidAndAttributes));
                }
                return records;
            }

        }

        PrivilegeCollection QueryAll(LuidResolver& resolver, const Native::AccessTokenHandle& token) {
            const auto records = ReadTokenPrivileges(token);

            std::vector<PrivilegeAndAttributes> items;
            items.reserve(records.size());
            for (const auto& record : records) {
                const std::wstring name = resolver.NameOf(record.luid);
                const auto privilege = TryParsePrivilege(name);
                if (!privilege) {
                    PG_LOG_TRACE(L"TokenQuery", L"Skipping unrecognized privilege %ls", name.c_str());
                    continue;
                }
                items.emplace_back(*privilege, static_cast<PrivilegeAttributes>(record.attributes));
            }

            PG_LOG_DEBUG(L"TokenQuery", L"Token of pid %u holds %zu privileges (%zu recognized)",
                         token.OwnerProcess(), records.size(), items.size());
            return PrivilegeCollection(std::move(items));
        }

        PrivilegeAttributes AttributesOf(LuidResolver& resolver, Privilege privilege,
                                         const PrivilegeCollection& privileges) {
            if (auto entry = privileges.Find(privilege)) {
                return entry->Attributes();
            }
            (void)resolver.Resolve(privilege);
            return PrivilegeAttributes::Removed;
        }

        PrivilegeState StateOf(LuidResolver& resolver, Privilege privilege, const PrivilegeCollection& privileges) {
            return GetPrivilegeState(AttributesOf(resolver, privilege, privileges));
        }

    }  // namespace TokenPrivilegeQuery
}  // namespace PrivGuard::Privileges
