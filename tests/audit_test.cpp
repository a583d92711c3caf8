#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "matreg/core/value.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/store/audit.hpp"
#include "temp_store.hpp"

using namespace matreg::store;
using namespace matreg::core;
using matreg::db::TableId;
using matreg::db::table_spec;

namespace {

constexpr PrincipalId kAdmin{1};

class AuditTest : public matreg::testing::TempStoreTest {};

} // namespace

TEST(AuditSerialize, SortedCompactJson) {
    Record r;
    r["name"] = Value{std::string("Bolt")};
    r["price"] = Value{1.5};
    r["qty"] = Value{i64{3}};
    r["note"] = null_value();
    EXPECT_EQ(audit_serialize(r, nullptr), R"({"name":"Bolt","note":null,"price":1.5,"qty":3})");
    EXPECT_EQ(audit_serialize(Record{}, nullptr), "{}");
}

TEST(AuditSerialize, RedactsSecretColumns) {
    Record r;
    r["username"] = Value{std::string("op")};
    r["password_hash"] = Value{std::string("$argon2id$v=19$secret")};
    const std::string json = audit_serialize(r, &table_spec(TableId::Users));
    EXPECT_EQ(json, R"({"password_hash":"***","username":"op"})");
    EXPECT_EQ(json.find("argon2id"), std::string::npos);
}

TEST(AuditSerialize, ActionNames) {
    EXPECT_STREQ(audit_action_name(AuditAction::Create), "CREATE");
    EXPECT_STREQ(audit_action_name(AuditAction::Delete), "DELETE");
    EXPECT_EQ(audit_action_from_name("UPDATE"), AuditAction::Update);
    EXPECT_FALSE(audit_action_from_name("update").has_value());
}

TEST_F(AuditTest, AppendAndListNewestFirst) {
    Record v;
    v["name"] = Value{std::string("first")};
    ASSERT_TRUE(is_ok(audit_append(conn_, kAdmin, AuditAction::Create, "departments", i64{1}, nullptr, &v)));
    v["name"] = Value{std::string("second")};
    ASSERT_TRUE(is_ok(audit_append(conn_, kAdmin, AuditAction::Create, "departments", i64{2}, nullptr, &v)));
    ASSERT_TRUE(is_ok(audit_append(conn_, kAdmin, AuditAction::Delete, "officials", i64{7}, &v, nullptr)));

    std::vector<AuditEntry> all;
    ASSERT_TRUE(is_ok(audit_list(conn_, AuditFilter{}, &all)));
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].table_name, "officials");
    EXPECT_EQ(all[0].action, AuditAction::Delete);
    EXPECT_EQ(all[0].actor, kAdmin);
    EXPECT_FALSE(all[0].new_values.has_value());
    EXPECT_EQ(all[2].record_id, i64{1});
    EXPECT_FALSE(all[2].created_at.empty());

    AuditFilter by_table;
    by_table.table_name = "departments";
    by_table.limit = 1;
    std::vector<AuditEntry> page;
    ASSERT_TRUE(is_ok(audit_list(conn_, by_table, &page)));
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].record_id, i64{2});
    ASSERT_TRUE(page[0].new_values.has_value());
    EXPECT_EQ(*page[0].new_values, R"({"name":"second"})");

    u64 n = 0;
    ASSERT_TRUE(is_ok(audit_count(conn_, by_table, &n)));
    EXPECT_EQ(n, 2u);
}

TEST_F(AuditTest, FilterByRecordAndActor) {
    ASSERT_TRUE(is_ok(audit_append(conn_, kAdmin, AuditAction::Update, "officials", i64{5}, nullptr, nullptr)));
    ASSERT_TRUE(is_ok(audit_append(conn_, kAdmin, AuditAction::Update, "officials", i64{6}, nullptr, nullptr)));

    AuditFilter f;
    f.record_id = 5;
    u64 n = 0;
    ASSERT_TRUE(is_ok(audit_count(conn_, f, &n)));
    EXPECT_EQ(n, 1u);

    f = AuditFilter{};
    f.actor = PrincipalId{2};
    ASSERT_TRUE(is_ok(audit_count(conn_, f, &n)));
    EXPECT_EQ(n, 0u);
}

TEST_F(AuditTest, RejectsMissingActor) {
    Status s = audit_append(conn_, PrincipalId::invalid(), AuditAction::Create, "officials", i64{1}, nullptr, nullptr);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Audit);

    // The actor must be a real principal.
    s = audit_append(conn_, PrincipalId{999}, AuditAction::Create, "officials", i64{1}, nullptr, nullptr);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Audit);
}
