#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "matreg/core/models.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/security/password.hpp"
#include "matreg/security/policy.hpp"
#include "matreg/session/accounts.hpp"
#include "matreg/session/guarded_store.hpp"
#include "matreg/session/session.hpp"
#include "matreg/store/audit.hpp"
#include "temp_store.hpp"

using namespace matreg::session;
using namespace matreg::core;
using matreg::security::Permission;
using matreg::security::permission_mask;

namespace {

constexpr PrincipalId kAdmin{1};
constexpr RoleId kOperatorRole{2};
constexpr RoleId kObserverRole{4};

class SessionTest : public matreg::testing::TempStoreTest {
protected:
    PrincipalId add_user(const std::string& username, const std::string& password, RoleId role) {
        NewPrincipal p;
        p.username = username;
        p.password = password;
        p.full_name = "User " + username;
        p.position = "Clerk";
        p.role = role;
        PrincipalId id = PrincipalId::invalid();
        EXPECT_TRUE(is_ok(create_principal(conn_, hasher_, kAdmin, p, &id)));
        return id;
    }

    std::optional<PrincipalInfo> login(const std::string& username, const std::string& password) {
        std::optional<PrincipalInfo> who;
        EXPECT_TRUE(is_ok(authenticate(conn_, hasher_, username, password, &who)));
        return who;
    }

    matreg::security::SodiumPasswordHasher hasher_;
};

} // namespace

//=============================================================================
// Authentication
//=============================================================================

TEST_F(SessionTest, BootstrapAdminAuthenticates) {
    const std::optional<PrincipalInfo> who = login("admin", "admin");
    ASSERT_TRUE(who.has_value());
    EXPECT_EQ(who->id, kAdmin);
    EXPECT_EQ(who->username, "admin");
    EXPECT_EQ(who->role_name, "Administrator");
    EXPECT_TRUE(who->active);
    EXPECT_TRUE(matreg::security::has_permission(who->permissions, Permission::Admin));
}

TEST_F(SessionTest, FailuresAreUniformlyAbsent) {
    EXPECT_FALSE(login("admin", "wrong").has_value());
    EXPECT_FALSE(login("nobody", "admin").has_value());
    EXPECT_FALSE(login("", "").has_value());
}

TEST_F(SessionTest, DeactivatedUserCannotAuthenticate) {
    const PrincipalId id = add_user("clerk", "Clerk123", kOperatorRole);
    ASSERT_TRUE(login("clerk", "Clerk123").has_value());

    bool changed = false;
    ASSERT_TRUE(is_ok(deactivate_principal(conn_, kAdmin, id, &changed)));
    EXPECT_TRUE(changed);
    EXPECT_FALSE(login("clerk", "Clerk123").has_value());

    ASSERT_TRUE(is_ok(activate_principal(conn_, kAdmin, id, &changed)));
    EXPECT_TRUE(changed);
    EXPECT_TRUE(login("clerk", "Clerk123").has_value());

    ASSERT_TRUE(is_ok(deactivate_principal(conn_, kAdmin, PrincipalId{999}, &changed)));
    EXPECT_FALSE(changed);
}

//=============================================================================
// Accounts
//=============================================================================

TEST_F(SessionTest, CreatePrincipalRejectsTakenUsername) {
    const PrincipalId id = add_user("storekeeper", "Store123", kOperatorRole);
    ASSERT_TRUE(id.is_valid());

    bool changed = false;
    ASSERT_TRUE(is_ok(deactivate_principal(conn_, kAdmin, id, &changed)));

    // Taken even while inactive.
    NewPrincipal again;
    again.username = "storekeeper";
    again.password = "Other123";
    again.full_name = "Someone else";
    again.role = kOperatorRole;
    PrincipalId other = PrincipalId::invalid();
    const Status s = create_principal(conn_, hasher_, kAdmin, again, &other);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Session);
    EXPECT_FALSE(other.is_valid());
}

TEST_F(SessionTest, CreatePrincipalValidatesInput) {
    NewPrincipal p;
    p.username = "x";
    p.password = "Abcdef12";
    p.full_name = "X";
    PrincipalId id = PrincipalId::invalid();
    EXPECT_EQ(create_principal(conn_, hasher_, kAdmin, p, &id).code, StatusCode::Invalid);

    p.role = RoleId{99};
    const Status s = create_principal(conn_, hasher_, kAdmin, p, &id);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Db);
}

TEST_F(SessionTest, CreatedPrincipalIsAuditedWithoutHash) {
    const PrincipalId id = add_user("auditor", "Audit123", kObserverRole);

    matreg::store::AuditFilter f;
    f.table_name = "users";
    f.record_id = id.v;
    std::vector<matreg::store::AuditEntry> entries;
    ASSERT_TRUE(is_ok(matreg::store::audit_list(conn_, f, &entries)));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].actor, kAdmin);
    ASSERT_TRUE(entries[0].new_values.has_value());
    EXPECT_NE(entries[0].new_values->find("\"password_hash\":\"***\""), std::string::npos);
    EXPECT_EQ(entries[0].new_values->find("argon2"), std::string::npos);
}

TEST_F(SessionTest, ChangePassword) {
    const PrincipalId id = add_user("op", "First123", kOperatorRole);

    bool changed = true;
    std::string reason;
    ASSERT_TRUE(is_ok(change_password(conn_, hasher_, id, id, "wrong", "Second123", &changed, &reason)));
    EXPECT_FALSE(changed);
    EXPECT_EQ(reason, "old password does not match");

    ASSERT_TRUE(is_ok(change_password(conn_, hasher_, id, id, "First123", "weak", &changed, &reason)));
    EXPECT_FALSE(changed);
    EXPECT_NE(reason, "OK");

    ASSERT_TRUE(is_ok(change_password(conn_, hasher_, id, id, "First123", "Second123", &changed, &reason)));
    EXPECT_TRUE(changed);
    EXPECT_EQ(reason, "OK");
    EXPECT_FALSE(login("op", "First123").has_value());
    EXPECT_TRUE(login("op", "Second123").has_value());

    ASSERT_TRUE(is_ok(change_password(conn_, hasher_, id, PrincipalId{999}, "a", "Second123", &changed)));
    EXPECT_FALSE(changed);
}

TEST_F(SessionTest, ResetPasswordReturnsWorkingTemporary) {
    const PrincipalId id = add_user("forgetful", "Forgot123", kOperatorRole);

    std::optional<std::string> temp;
    ASSERT_TRUE(is_ok(reset_password(conn_, hasher_, kAdmin, id, &temp)));
    ASSERT_TRUE(temp.has_value());
    EXPECT_EQ(temp->size(), matreg::security::kTemporaryPasswordLength);
    EXPECT_FALSE(login("forgetful", "Forgot123").has_value());
    EXPECT_TRUE(login("forgetful", *temp).has_value());

    ASSERT_TRUE(is_ok(reset_password(conn_, hasher_, kAdmin, PrincipalId{999}, &temp)));
    EXPECT_FALSE(temp.has_value());
}

TEST_F(SessionTest, ListActivePrincipalsOrderedByUsername) {
    add_user("zed", "Zed12345", kObserverRole);
    const PrincipalId gone = add_user("bob", "Bob12345", kObserverRole);
    bool changed = false;
    ASSERT_TRUE(is_ok(deactivate_principal(conn_, kAdmin, gone, &changed)));

    std::vector<PrincipalInfo> users;
    ASSERT_TRUE(is_ok(list_active_principals(conn_, &users)));
    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users[0].username, "admin");
    EXPECT_EQ(users[1].username, "zed");
    EXPECT_EQ(users[1].role_name, "Observer");
}

//=============================================================================
// Roles
//=============================================================================

TEST_F(SessionTest, RolesAndPermissions) {
    std::vector<RoleInfo> roles;
    ASSERT_TRUE(is_ok(list_roles(conn_, &roles)));
    ASSERT_EQ(roles.size(), 4u);
    EXPECT_EQ(roles[0].name, "Administrator");
    EXPECT_EQ(roles[1].name, "Manager");
    EXPECT_EQ(roles[2].name, "Observer");
    EXPECT_EQ(roles[3].name, "Operator");
    EXPECT_EQ(roles[1].permissions,
              permission_mask(Permission::Read) | permission_mask(Permission::Write) | permission_mask(Permission::Approve));

    std::optional<u32> perms;
    ASSERT_TRUE(is_ok(role_permissions(conn_, kObserverRole, &perms)));
    ASSERT_TRUE(perms.has_value());
    EXPECT_EQ(*perms, permission_mask(Permission::Read));

    ASSERT_TRUE(is_ok(role_permissions(conn_, RoleId{42}, &perms)));
    EXPECT_FALSE(perms.has_value());
}

//=============================================================================
// Session
//=============================================================================

TEST_F(SessionTest, SessionLifecycle) {
    Session s;
    EXPECT_FALSE(s.is_authenticated());
    EXPECT_FALSE(s.has_permission(Permission::Read));
    EXPECT_EQ(require_permission(s, Permission::Read).code, StatusCode::PermissionDenied);

    const std::optional<PrincipalInfo> who = login("admin", "admin");
    ASSERT_TRUE(who.has_value());
    s.login(*who);
    EXPECT_TRUE(s.is_authenticated());
    EXPECT_EQ(s.principal(), kAdmin);
    EXPECT_EQ(s.username(), "admin");
    EXPECT_TRUE(s.has_permission(Permission::Delete));
    EXPECT_NE(s.login_time(), Session::Clock::time_point{});

    s.logout();
    EXPECT_FALSE(s.is_authenticated());
    EXPECT_EQ(s.permissions(), 0u);
}

TEST_F(SessionTest, PermissionsAreSnapshotAtLogin) {
    add_user("reader", "Reader12", kObserverRole);
    Session s;
    const std::optional<PrincipalInfo> who = login("reader", "Reader12");
    ASSERT_TRUE(who.has_value());
    s.login(*who);
    EXPECT_FALSE(s.has_permission(Permission::Write));

    ASSERT_TRUE(is_ok(matreg::db::db_execute(conn_, "UPDATE roles SET can_write = 1 WHERE id = ?",
                                             {Value{kObserverRole.v}})));
    EXPECT_FALSE(s.has_permission(Permission::Write));

    const std::optional<PrincipalInfo> again = login("reader", "Reader12");
    ASSERT_TRUE(again.has_value());
    s.login(*again);
    EXPECT_TRUE(s.has_permission(Permission::Write));
}

//=============================================================================
// GuardedStore
//=============================================================================

TEST_F(SessionTest, GuardedStoreChecksPermissions) {
    add_user("viewer", "Viewer12", kObserverRole);
    const PrincipalId op_id = add_user("writer", "Writer12", kOperatorRole);

    Session viewer;
    viewer.login(*login("viewer", "Viewer12"));
    GuardedStore as_viewer(conn_, matreg::db::table_spec(matreg::db::TableId::Officials), viewer);

    Record r;
    r["full_name"] = Value{std::string("Lebedev")};
    r["position"] = Value{std::string("Clerk")};
    RecordId id = RecordId::invalid();
    Status s = as_viewer.create(r, &id);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(s.domain, StatusDomain::Session);
    u64 n = 1;
    ASSERT_TRUE(is_ok(as_viewer.count({}, &n)));
    EXPECT_EQ(n, 0u);

    Session writer;
    writer.login(*login("writer", "Writer12"));
    GuardedStore as_writer(conn_, matreg::db::table_spec(matreg::db::TableId::Officials), writer);
    ASSERT_TRUE(is_ok(as_writer.create(r, &id)));

    std::optional<Record> row;
    ASSERT_TRUE(is_ok(as_writer.read(id, &row)));
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(field_i64(*row, "created_by"), op_id.v);

    bool removed = true;
    EXPECT_EQ(as_writer.remove(id, &removed).code, StatusCode::PermissionDenied);

    // Audit carries the session principal.
    matreg::store::AuditFilter f;
    f.table_name = "officials";
    f.actor = op_id;
    u64 audits = 0;
    ASSERT_TRUE(is_ok(matreg::store::audit_count(conn_, f, &audits)));
    EXPECT_EQ(audits, 1u);

    writer.logout();
    EXPECT_EQ(as_writer.read(id, &row).code, StatusCode::PermissionDenied);
}
