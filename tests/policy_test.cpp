#include <gtest/gtest.h>

#include "matreg/security/policy.hpp"

using matreg::security::Permission;
using matreg::security::has_permission;
using matreg::security::permission_mask;
using matreg::security::permission_mask_from_flags;

TEST(SecurityPolicy, SingleFlags) {
    const auto mask = permission_mask(Permission::Read) | permission_mask(Permission::Write);
    EXPECT_TRUE(has_permission(mask, Permission::Read));
    EXPECT_TRUE(has_permission(mask, Permission::Write));
    EXPECT_FALSE(has_permission(mask, Permission::Delete));
    EXPECT_FALSE(has_permission(mask, Permission::Approve));
    EXPECT_FALSE(has_permission(mask, Permission::Admin));
    EXPECT_FALSE(has_permission(0, Permission::Read));
}

TEST(SecurityPolicy, AdminGrantsEverything) {
    const auto admin = permission_mask(Permission::Admin);
    for (const Permission p : {Permission::Read, Permission::Write, Permission::Delete, Permission::Approve}) {
        EXPECT_TRUE(has_permission(admin, p)) << matreg::security::permission_name(p);
    }
}

TEST(SecurityPolicy, MaskFromRoleFlags) {
    // Operator: read and write only.
    const auto op = permission_mask_from_flags(true, true, false, false, false);
    EXPECT_EQ(op, 3u);
    EXPECT_EQ(matreg::security::permission_list(op), "read,write");

    const auto all = permission_mask_from_flags(true, true, true, true, true);
    EXPECT_EQ(matreg::security::permission_list(all), "read,write,delete,approve,admin");
    EXPECT_EQ(matreg::security::permission_list(0), "-");
}
