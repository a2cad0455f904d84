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
#include "NativeError.hpp"
#include "../Utils/StringUtils.hpp"

namespace PrivGuard::Native {

    namespace {

        std::string BuildMessage(NativeErrorCode code, std::wstring_view operation) {
            std::wstring text(operation);
            text += L" failed with native error ";
            text += std::to_wstring(code);
            text += L" (";
            text += DescribeNativeError(code);
            text += L")";
            return Utils::StringUtils::WStringToString(text);
        }

    }

    NativeCallError::NativeCallError(NativeErrorCode code, std::wstring_view operation)
        : std::runtime_error(BuildMessage(code, operation))
        , m_code(code)
        , m_operation(operation) {
    }

    std::wstring DescribeNativeError(NativeErrorCode code) {
#ifdef _WIN32
        wchar_t* buffer = nullptr;
        const DWORD length = ::FormatMessageW(
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
            nullptr, code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
            reinterpret_cast<LPWSTR>(&buffer), 0, nullptr);
        if (length != 0 && buffer != nullptr) {
            std::wstring message(buffer, length);
            ::LocalFree(buffer);
            while (!message.empty() && (message.back() == L'\n' || message.back() == L'\r' || message.back() == L'.')) {
                message.pop_back();
            }
            return message;
        }
#endif
        switch (code) {
        case ErrorCodes::Success:            return L"success";
        case ErrorCodes::AccessDenied:       return L"access denied";
        case ErrorCodes::InvalidHandle:      return L"invalid handle";
        case ErrorCodes::InvalidData:        return L"invalid data";
        case ErrorCodes::InvalidParameter:   return L"invalid parameter";
        case ErrorCodes::InsufficientBuffer: return L"insufficient buffer";
        case ErrorCodes::NotAllAssigned:     return L"not all privileges assigned";
        case ErrorCodes::NoSuchPrivilege:    return L"no such privilege";
        default:                             return L"unknown error";
        }
    }

    void ThrowIfFailed(NativeErrorCode code, std::wstring_view operation) {
        if (code != ErrorCodes::Success) {
            throw NativeCallError(code, operation);
        }
    }

}  // namespace PrivGuard::Native
