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
#include <gtest/gtest.h>

#include <set>

#include "Privileges/Privilege.hpp"
#include "Privileges/PrivilegeCollection.hpp"

using namespace PrivGuard::Privileges;

// ============================================================================
// Names
// ============================================================================

TEST(PrivilegeNameTest, EveryPrivilegeHasADistinctOsName) {
    std::set<std::wstring_view> names;
    for (const Privilege p : AllPrivileges()) {
        const auto name = PrivilegeName(p);
        EXPECT_FALSE(name.empty());
        EXPECT_EQ(name.substr(0, 2), L"Se");
        EXPECT_TRUE(names.insert(name).second) << "duplicate name";
    }
    EXPECT_EQ(names.size(), kPrivilegeCount);
    EXPECT_EQ(kPrivilegeCount, 35u);
}

TEST(PrivilegeNameTest, IrregularOsConstants) {
    EXPECT_EQ(PrivilegeName(Privilege::SystemTime), L"SeSystemtimePrivilege");
    EXPECT_EQ(PrivilegeName(Privilege::TrustedComputerBase), L"SeTcbPrivilege");
    EXPECT_EQ(PrivilegeName(Privilege::CreatePageFile), L"SeCreatePagefilePrivilege");
    EXPECT_EQ(PrivilegeName(Privilege::TrustedCredentialManagerAccess), L"SeTrustedCredManAccessPrivilege");
}

TEST(PrivilegeNameTest, ParseRoundTripsEveryName) {
    for (const Privilege p : AllPrivileges()) {
        const auto parsed = TryParsePrivilege(PrivilegeName(p));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, p);
    }
}

TEST(PrivilegeNameTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(TryParsePrivilege(L"sebackupprivilege"), Privilege::Backup);
    EXPECT_EQ(TryParsePrivilege(L"SESYSTEMTIMEPRIVILEGE"), Privilege::SystemTime);
}

TEST(PrivilegeNameTest, ParseRejectsUnknownNames) {
    EXPECT_FALSE(TryParsePrivilege(L"").has_value());
    EXPECT_FALSE(TryParsePrivilege(L"SeDelegateSessionUserImpersonatePrivilege").has_value());
    EXPECT_FALSE(TryParsePrivilege(L"Backup").has_value());
}

// ============================================================================
// State
// ============================================================================

TEST(PrivilegeStateTest, AttributesCollapseToState) {
    EXPECT_EQ(GetPrivilegeState(PrivilegeAttributes::Disabled), PrivilegeState::Disabled);
    EXPECT_EQ(GetPrivilegeState(PrivilegeAttributes::Enabled), PrivilegeState::Enabled);
    EXPECT_EQ(GetPrivilegeState(PrivilegeAttributes::Removed), PrivilegeState::Removed);
    EXPECT_EQ(GetPrivilegeState(PrivilegeAttributes::EnabledByDefault), PrivilegeState::Disabled);
    EXPECT_EQ(GetPrivilegeState(PrivilegeAttributes::EnabledByDefault | PrivilegeAttributes::Enabled),
              PrivilegeState::Enabled);
    EXPECT_EQ(GetPrivilegeState(PrivilegeAttributes::UsedForAccess), PrivilegeState::Disabled);
    EXPECT_EQ(GetPrivilegeState(PrivilegeAttributes::Enabled | PrivilegeAttributes::UsedForAccess),
              PrivilegeState::Enabled);
}

TEST(PrivilegeStateTest, AdjustResultValues) {
    EXPECT_EQ(static_cast<int>(AdjustPrivilegeResult::None), 0);
    EXPECT_EQ(static_cast<int>(AdjustPrivilegeResult::PrivilegeModified), 1);
    EXPECT_STREQ(AdjustPrivilegeResultToString(AdjustPrivilegeResult::PrivilegeModified), L"PrivilegeModified");
    EXPECT_STREQ(PrivilegeStateToString(PrivilegeState::Removed), L"Removed");
}

// ============================================================================
// Collection
// ============================================================================

TEST(PrivilegeCollectionTest, PairEqualityUsesBothFields) {
    const PrivilegeAndAttributes a(Privilege::Backup, PrivilegeAttributes::Enabled);
    const PrivilegeAndAttributes b(Privilege::Backup, PrivilegeAttributes::Enabled);
    const PrivilegeAndAttributes c(Privilege::Backup, PrivilegeAttributes::Disabled);
    const PrivilegeAndAttributes d(Privilege::Restore, PrivilegeAttributes::Enabled);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(a.State(), PrivilegeState::Enabled);
    EXPECT_EQ(c.State(), PrivilegeState::Disabled);
}

TEST(PrivilegeCollectionTest, FindAndContains) {
    const PrivilegeCollection collection({
        { Privilege::ChangeNotify, PrivilegeAttributes::EnabledByDefault | PrivilegeAttributes::Enabled },
        { Privilege::Backup, PrivilegeAttributes::Disabled },
    });

    EXPECT_EQ(collection.Size(), 2u);
    EXPECT_TRUE(collection.Contains(Privilege::Backup));
    EXPECT_FALSE(collection.Contains(Privilege::Debug));

    const auto found = collection.Find(Privilege::ChangeNotify);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->State(), PrivilegeState::Enabled);

    size_t visited = 0;
    for (const auto& item : collection) {
        (void)item;
        ++visited;
    }
    EXPECT_EQ(visited, 2u);
    EXPECT_THROW((void)collection[2], std::out_of_range);
}

TEST(PrivilegeCollectionTest, EmptyCollection) {
    const PrivilegeCollection empty;
    EXPECT_TRUE(empty.Empty());
    EXPECT_FALSE(empty.Find(Privilege::Backup).has_value());
}
