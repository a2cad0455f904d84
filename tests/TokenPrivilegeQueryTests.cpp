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
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "Native/NativeError.hpp"
#include "Privileges/TokenPrivilegeQuery.hpp"
#include "Support/MockNativeTokenApi.hpp"
#include "Support/SimulatedTokenApi.hpp"
#include "Support/TokenFixtures.hpp"

using namespace PrivGuard::Privileges;
using namespace PrivGuard::Testing;
namespace ErrorCodes = PrivGuard::Native::ErrorCodes;
using PrivGuard::Native::NativeCallError;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class TokenPrivilegeQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        api.AddProcess(kTestProcess, {
            { Privilege::Backup, PrivilegeAttributes::Disabled },
            { Privilege::ChangeNotify, PrivilegeAttributes::EnabledByDefault | PrivilegeAttributes::Enabled },
            { Privilege::Shutdown, PrivilegeAttributes::Disabled },
        });
        token = OpenTestToken(api, kTestProcess);
    }

    SimulatedTokenApi api;
    LuidResolver resolver{ api };
    std::shared_ptr<PrivGuard::Native::AccessTokenHandle> token;
};

TEST_F(TokenPrivilegeQueryTest, QueryAllReturnsEveryRecognizedPrivilege) {
    const PrivilegeCollection privileges = TokenPrivilegeQuery::QueryAll(resolver, *token);

    EXPECT_EQ(privileges.Size(), 3u);
    EXPECT_EQ(privileges.Find(Privilege::Backup)->State(), PrivilegeState::Disabled);
    EXPECT_EQ(privileges.Find(Privilege::ChangeNotify)->Attributes(),
              PrivilegeAttributes::EnabledByDefault | PrivilegeAttributes::Enabled);
    EXPECT_EQ(privileges.Find(Privilege::Shutdown)->State(), PrivilegeState::Disabled);
}

TEST_F(TokenPrivilegeQueryTest, UnrecognizedOsPrivilegesAreDropped) {
    api.GrantRaw(kTestProcess, SimulatedTokenApi::kUnrecognizedPrivilege, 0);

    const PrivilegeCollection privileges = TokenPrivilegeQuery::QueryAll(resolver, *token);
    EXPECT_EQ(privileges.Size(), 3u);
}

TEST_F(TokenPrivilegeQueryTest, EmptyTokenYieldsEmptyCollection) {
    api.AddProcess(kTestProcess + 1, {});
    auto empty = OpenTestToken(api, kTestProcess + 1);

    EXPECT_TRUE(TokenPrivilegeQuery::QueryAll(resolver, *empty).Empty());
}

TEST_F(TokenPrivilegeQueryTest, CountOverrunIsInvalidData) {
    api.SetPrivilegeCountOverrun(kTestProcess, 1);
    try {
        (void)TokenPrivilegeQuery::QueryAll(resolver, *token);
        FAIL() << "expected NativeCallError";
    }
    catch (const NativeCallError& ex) {
        EXPECT_EQ(ex.Code(), ErrorCodes::InvalidData);
    }
}

TEST_F(TokenPrivilegeQueryTest, QueryWithoutQueryRightIsDenied) {
    auto adjustOnly = OpenTestToken(api, kTestProcess, PrivGuard::Native::TokenAccessRights::AdjustPrivileges);
    try {
        (void)TokenPrivilegeQuery::QueryAll(resolver, *adjustOnly);
        FAIL() << "expected NativeCallError";
    }
    catch (const NativeCallError& ex) {
        EXPECT_EQ(ex.Code(), ErrorCodes::AccessDenied);
    }
}

TEST_F(TokenPrivilegeQueryTest, AttributesOfPresentPrivilege) {
    const auto privileges = TokenPrivilegeQuery::QueryAll(resolver, *token);
    EXPECT_EQ(TokenPrivilegeQuery::AttributesOf(resolver, Privilege::Backup, privileges), PrivilegeAttributes::Disabled);
    EXPECT_EQ(TokenPrivilegeQuery::StateOf(resolver, Privilege::ChangeNotify, privileges), PrivilegeState::Enabled);
}

TEST_F(TokenPrivilegeQueryTest, AbsentPrivilegeReportsRemovedAndWarmsCache) {
    const auto privileges = TokenPrivilegeQuery::QueryAll(resolver, *token);
    const size_t before = resolver.CachedCount();

    EXPECT_EQ(TokenPrivilegeQuery::AttributesOf(resolver, Privilege::Debug, privileges), PrivilegeAttributes::Removed);
    EXPECT_EQ(TokenPrivilegeQuery::StateOf(resolver, Privilege::Debug, privileges), PrivilegeState::Removed);
    EXPECT_EQ(resolver.CachedCount(), before + 1);
}

TEST(TokenPrivilegeQueryFailureTest, AbsentPrivilegeSurfacesLookupFailure) {
    SimulatedTokenApi fake;
    NiceMock<MockNativeTokenApi> api;
    api.DelegateTo(fake);
    LuidResolver resolver(api);

    EXPECT_CALL(api, LookupLuidByName(_, _)).WillOnce(Return(ErrorCodes::NoSuchPrivilege));
    EXPECT_THROW((void)TokenPrivilegeQuery::AttributesOf(resolver, Privilege::Debug, PrivilegeCollection{}),
                 NativeCallError);
}

TEST(TokenPrivilegeQueryFailureTest, FillFailurePropagates) {
    SimulatedTokenApi fake;
    NiceMock<MockNativeTokenApi> api;
    api.DelegateTo(fake);
    LuidResolver resolver(api);
    auto token = OpenTestToken(api, SimulatedTokenApi::kCurrentProcess);
    fake.AddProcess(SimulatedTokenApi::kCurrentProcess, { { Privilege::Backup, PrivilegeAttributes::Disabled } });

    EXPECT_CALL(api, GetTokenPrivileges(_, _, _, _))
        .WillOnce([&fake](PrivGuard::Native::NativeHandle h, void* b, uint32_t l, uint32_t& r) {
            return fake.GetTokenPrivileges(h, b, l, r);
        })
        .WillOnce(Return(ErrorCodes::InvalidHandle));

    try {
        (void)TokenPrivilegeQuery::QueryAll(resolver, *token);
        FAIL() << "expected NativeCallError";
    }
    catch (const NativeCallError& ex) {
        EXPECT_EQ(ex.Code(), ErrorCodes::InvalidHandle);
    }
}
