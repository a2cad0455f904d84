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
#include "Support/SimulatedTokenApi.hpp"

#include <algorithm>
#include <cstring>

#include "Utils/StringUtils.hpp"

namespace PrivGuard::Testing {

    using namespace PrivGuard::Native;
    using Privileges::Privilege;
    using Privileges::PrivilegeAttributes;

    SimulatedTokenApi::SimulatedTokenApi() {
        // LUID values are arbitrary but stable, as they are within one boot
        uint32_t next = 2;
        for (const Privilege privilege : Privileges::AllPrivileges()) {
            m_luids.emplace_back(std::wstring(Privileges::PrivilegeName(privilege)), Luid{ next++, 0 });
        }
        m_luids.emplace_back(kUnrecognizedPrivilege, Luid{ 0x1000, 0 });

        AddProcess(kCurrentProcess, {});
    }

    // ============================================================================
    // Setup & inspection
    // ============================================================================

    void SimulatedTokenApi::AddProcess(ProcessId pid,
                                       std::vector<std::pair<Privilege, PrivilegeAttributes>> privileges) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ProcessEntry& entry = m_processes[pid];
        entry.privileges.clear();
        for (const auto& [privilege, attributes] : privileges) {
            const Luid luid = *FindLuid(Privileges::PrivilegeName(privilege));
            entry.privileges[luid.ToUInt64()] = LuidAndAttributes{ luid, static_cast<uint32_t>(attributes) };
        }
    }

    void SimulatedTokenApi::GrantRaw(ProcessId pid, const std::wstring& name, uint32_t attributes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const Luid luid = *FindLuid(name);
        m_processes[pid].privileges[luid.ToUInt64()] = LuidAndAttributes{ luid, attributes };
    }

    void SimulatedTokenApi::SetPrivilegeCountOverrun(ProcessId pid, uint32_t extra) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_processes[pid].countOverrun = extra;
    }

    std::optional<uint32_t> SimulatedTokenApi::RawAttributes(ProcessId pid, Privilege privilege) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto process = m_processes.find(pid);
        if (process == m_processes.end()) {
            return std::nullopt;
        }
        const Luid luid = *FindLuid(Privileges::PrivilegeName(privilege));
        auto it = process->second.privileges.find(luid.ToUInt64());
        if (it == process->second.privileges.end()) {
            return std::nullopt;
        }
        return it->second.attributes;
    }

    Privileges::PrivilegeState SimulatedTokenApi::StateOf(ProcessId pid, Privilege privilege) const {
        const auto raw = RawAttributes(pid, privilege);
        if (!raw) {
            return Privileges::PrivilegeState::Removed;
        }
        return Privileges::GetPrivilegeState(static_cast<PrivilegeAttributes>(*raw));
    }

    Luid SimulatedTokenApi::LuidOf(Privilege privilege) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return *FindLuid(Privileges::PrivilegeName(privilege));
    }

    size_t SimulatedTokenApi::OpenHandleCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_handles.size();
    }

    size_t SimulatedTokenApi::OpenTokenCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_handles.begin(), m_handles.end(),
            [](const auto& h) { return h.second.kind == HandleKind::Token; }));
    }

    size_t SimulatedTokenApi::TokenOpenCalls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tokenOpens;
    }

    size_t SimulatedTokenApi::AdjustCalls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_adjustCalls;
    }

    size_t SimulatedTokenApi::LookupValueCalls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lookupValueCalls;
    }

    // ============================================================================
    // Helpers
    // ============================================================================

    const SimulatedTokenApi::HandleEntry* SimulatedTokenApi::FindHandle(NativeHandle handle, HandleKind kind) const {
        auto it = m_handles.find(reinterpret_cast<uintptr_t>(handle));
        if (it == m_handles.end() || it->second.kind != kind) {
            return nullptr;
        }
        return &it->second;
    }

    NativeHandle SimulatedTokenApi::NewHandle(HandleKind kind, ProcessId pid, AccessMask access) {
        const uintptr_t value = m_nextHandle;
        m_nextHandle += 4;
        m_handles.emplace(value, HandleEntry{ kind, pid, access });
        return reinterpret_cast<NativeHandle>(value);
    }

    std::optional<Luid> SimulatedTokenApi::FindLuid(std::wstring_view name) const {
        for (const auto& [known, luid] : m_luids) {
            if (Utils::StringUtils::EqualsIgnoreCase(known, name)) {
                return luid;
            }
        }
        return std::nullopt;
    }

    // ============================================================================
    // INativeTokenApi
    // ============================================================================

    NativeErrorCode SimulatedTokenApi::OpenProcess(ProcessId pid, AccessMask desiredAccess, NativeHandle& process) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        process = nullptr;
        if (m_processes.find(pid) == m_processes.end()) {
            return ErrorCodes::InvalidParameter;
        }
        process = NewHandle(HandleKind::Process, pid, desiredAccess);
        return ErrorCodes::Success;
    }

    NativeErrorCode SimulatedTokenApi::OpenProcessToken(NativeHandle process, AccessMask desiredAccess,
                                                        NativeHandle& token) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        token = nullptr;
        const HandleEntry* entry = FindHandle(process, HandleKind::Process);
        if (entry == nullptr) {
            return ErrorCodes::InvalidHandle;
        }
        token = NewHandle(HandleKind::Token, entry->pid, desiredAccess);
        ++m_tokenOpens;
        return ErrorCodes::Success;
    }

    NativeErrorCode SimulatedTokenApi::CloseHandle(NativeHandle handle) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_handles.erase(reinterpret_cast<uintptr_t>(handle)) == 0) {
            return ErrorCodes::InvalidHandle;
        }
        return ErrorCodes::Success;
    }

    NativeErrorCode SimulatedTokenApi::LookupLuidByName(std::wstring_view name, Luid& luid) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_lookupValueCalls;
        const auto found = FindLuid(name);
        if (!found) {
            return ErrorCodes::NoSuchPrivilege;
        }
        luid = *found;
        return ErrorCodes::Success;
    }

    NativeErrorCode SimulatedTokenApi::LookupNameByLuid(const Luid& luid, wchar_t* buffer, uint32_t& length) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_luids.begin(), m_luids.end(),
            [&](const auto& entry) { return entry.second == luid; });
        if (it == m_luids.end()) {
            return ErrorCodes::NoSuchPrivilege;
        }

        const std::wstring& name = it->first;
        const uint32_t required = static_cast<uint32_t>(name.size()) + 1;
        if (buffer == nullptr || length < required) {
            length = required;
            return ErrorCodes::InsufficientBuffer;
        }
        std::copy(name.begin(), name.end(), buffer);
        buffer[name.size()] = L'\0';
        length = static_cast<uint32_t>(name.size());
        return ErrorCodes::Success;
    }

    NativeErrorCode SimulatedTokenApi::GetTokenPrivileges(NativeHandle token, void* buffer, uint32_t length,
                                                          uint32_t& returnLength) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        returnLength = 0;
        const HandleEntry* entry = FindHandle(token, HandleKind::Token);
        if (entry == nullptr) {
            return ErrorCodes::InvalidHandle;
        }
        if ((entry->access & TokenAccessRights::Query) == 0) {
            return ErrorCodes::AccessDenied;
        }

        const ProcessEntry& process = m_processes.at(entry->pid);
        if (process.privileges.empty() && process.countOverrun == 0) {
            return ErrorCodes::Success;
        }

        const uint32_t count = static_cast<uint32_t>(process.privileges.size());
        const uint32_t required = static_cast<uint32_t>(kTokenPrivilegesHeaderSize + count * sizeof(LuidAndAttributes));
        if (buffer == nullptr || length < required) {
            returnLength = required;
            return ErrorCodes::InsufficientBuffer;
        }

        auto* bytes = static_cast<uint8_t*>(buffer);
        const uint32_t reportedCount = count + process.countOverrun;
        std::memcpy(bytes, &reportedCount, sizeof(reportedCount));
        size_t offset = kTokenPrivilegesHeaderSize;
        for (const auto& [key, record] : process.privileges) {
            std::memcpy(bytes + offset, &record, sizeof(record));
            offset += sizeof(record);
        }
        returnLength = required;
        return ErrorCodes::Success;
    }

    NativeErrorCode SimulatedTokenApi::AdjustTokenPrivileges(NativeHandle token, const TokenPrivilege& newState,
                                                             TokenPrivilege* previousState, uint32_t& returnLength) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_adjustCalls;
        returnLength = 0;

        const HandleEntry* entry = FindHandle(token, HandleKind::Token);
        if (entry == nullptr) {
            return ErrorCodes::InvalidHandle;
        }
        if ((entry->access & TokenAccessRights::AdjustPrivileges) == 0) {
            return ErrorCodes::AccessDenied;
        }
        if (newState.privilegeCount != 1) {
            return ErrorCodes::InvalidParameter;
        }

        TokenPrivilege previous{};
        ProcessEntry& process = m_processes.at(entry->pid);
        auto it = process.privileges.find(newState.privilege.luid.ToUInt64());

        NativeErrorCode status = ErrorCodes::Success;
        if (it == process.privileges.end()) {
            status = ErrorCodes::NotAllAssigned;
        }
        else {
            constexpr uint32_t kEnabled = static_cast<uint32_t>(PrivilegeAttributes::Enabled);
            constexpr uint32_t kRemoved = static_cast<uint32_t>(PrivilegeAttributes::Removed);
            const uint32_t requested = newState.privilege.attributes;
            const uint32_t before = it->second.attributes;

            if (requested & kRemoved) {
                previous.privilegeCount = 1;
                previous.privilege = it->second;
                process.privileges.erase(it);
            }
            else {
                const uint32_t after = (requested & kEnabled) ? (before | kEnabled) : (before & ~kEnabled);
                if (after != before) {
                    previous.privilegeCount = 1;
                    previous.privilege = it->second;
                    it->second.attributes = after;
                }
            }
        }

        if (previousState != nullptr) {
            *previousState = previous;
            returnLength = static_cast<uint32_t>(kTokenPrivilegesHeaderSize
                + previous.privilegeCount * sizeof(LuidAndAttributes));
        }
        return status;
    }

}  // namespace PrivGuard::Testing
