#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "matreg/core/value.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/store/audit.hpp"
#include "matreg/store/record_store.hpp"
#include "temp_store.hpp"

using namespace matreg::store;
using namespace matreg::core;
using matreg::db::TableId;
using matreg::db::table_spec;

namespace {

constexpr PrincipalId kAdmin{1};

Record official(const std::string& name, const std::string& position = "Storekeeper") {
    Record r;
    r["full_name"] = Value{name};
    r["position"] = Value{position};
    return r;
}

class RecordStoreTest : public matreg::testing::TempStoreTest {
protected:
    u64 audit_rows(const std::string& table) {
        AuditFilter f;
        f.table_name = table;
        u64 n = 0;
        EXPECT_TRUE(is_ok(audit_count(conn_, f, &n)));
        return n;
    }
};

} // namespace

//=============================================================================
// Create / Read
//=============================================================================

TEST_F(RecordStoreTest, CreateThenReadFillsAuditColumns) {
    RecordStore store(conn_, table_spec(TableId::Officials), kAdmin);
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(official("Petrov P.P."), &id)));
    ASSERT_TRUE(id.is_valid());

    std::optional<Record> row;
    ASSERT_TRUE(is_ok(store.read(id, &row)));
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(field_text(*row, "full_name"), "Petrov P.P.");
    EXPECT_EQ(field_i64(*row, "created_by"), kAdmin.v);
    EXPECT_TRUE(field_text(*row, "created_at").has_value());
    EXPECT_EQ(field_text(*row, "created_at"), field_text(*row, "updated_at"));
    EXPECT_FALSE(field_bool(*row, "is_responsible"));

    EXPECT_EQ(audit_rows("officials"), 1u);
}

TEST_F(RecordStoreTest, ReadMissingIsAbsent) {
    RecordStore store(conn_, table_spec(TableId::Officials));
    std::optional<Record> row = Record{};
    ASSERT_TRUE(is_ok(store.read(RecordId{4242}, &row)));
    EXPECT_FALSE(row.has_value());
}

TEST_F(RecordStoreTest, WithoutActorNoAuditIsWritten) {
    RecordStore store(conn_, table_spec(TableId::Officials));
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(official("Sidorov"), &id)));

    std::optional<Record> row;
    ASSERT_TRUE(is_ok(store.read(id, &row)));
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(is_null((*row)["created_by"]));
    EXPECT_EQ(audit_rows("officials"), 0u);
}

TEST_F(RecordStoreTest, CreateRejectsUnknownAndGeneratedColumns) {
    RecordStore officials(conn_, table_spec(TableId::Officials), kAdmin);
    Record bad = official("X");
    bad["shoe_size"] = Value{i64{44}};
    RecordId id = RecordId::invalid();
    Status s = officials.create(bad, &id);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Store);

    RecordStore nomenclature(conn_, table_spec(TableId::Nomenclature), kAdmin);
    Record item;
    item["code"] = Value{std::string("0102003004")};
    item["name"] = Value{std::string("Washer")};
    item["unit"] = Value{std::string("pcs")};
    item["class_code"] = Value{std::string("99")};
    s = nomenclature.create(item, &id);
    EXPECT_EQ(s.code, StatusCode::Invalid);

    EXPECT_EQ(audit_rows("officials"), 0u);
    EXPECT_EQ(audit_rows("nomenclature"), 0u);
}

TEST_F(RecordStoreTest, ConstraintViolationIsConflictAndLeavesNoAudit) {
    RecordStore store(conn_, table_spec(TableId::Departments), kAdmin);
    Record dept;
    dept["code"] = Value{std::string("01")};
    dept["name"] = Value{std::string("Supply")};
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(dept, &id)));

    RecordId dup = RecordId::invalid();
    const Status s = store.create(dept, &dup);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Db);
    EXPECT_FALSE(dup.is_valid());
    EXPECT_EQ(audit_rows("departments"), 1u);
}

//=============================================================================
// Update / Delete
//=============================================================================

TEST_F(RecordStoreTest, UpdateChangesFieldsAndAuditsOldAndNew) {
    RecordStore store(conn_, table_spec(TableId::Officials), kAdmin);
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(official("Orlov", "Clerk"), &id)));

    Record change;
    change["position"] = Value{std::string("Head clerk")};
    bool updated = false;
    ASSERT_TRUE(is_ok(store.update(id, change, &updated)));
    EXPECT_TRUE(updated);

    std::optional<Record> row;
    ASSERT_TRUE(is_ok(store.read(id, &row)));
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(field_text(*row, "position"), "Head clerk");
    EXPECT_EQ(field_text(*row, "full_name"), "Orlov");
    EXPECT_EQ(field_i64(*row, "updated_by"), kAdmin.v);

    AuditFilter f;
    f.table_name = "officials";
    f.record_id = id.v;
    f.action = AuditAction::Update;
    std::vector<AuditEntry> entries;
    ASSERT_TRUE(is_ok(audit_list(conn_, f, &entries)));
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_TRUE(entries[0].old_values.has_value());
    ASSERT_TRUE(entries[0].new_values.has_value());
    EXPECT_NE(entries[0].old_values->find("\"Clerk\""), std::string::npos);
    EXPECT_NE(entries[0].new_values->find("\"Head clerk\""), std::string::npos);
}

TEST_F(RecordStoreTest, UpdateMissingReturnsFalseWithoutAudit) {
    RecordStore store(conn_, table_spec(TableId::Officials), kAdmin);
    bool updated = true;
    ASSERT_TRUE(is_ok(store.update(RecordId{999}, official("Ghost"), &updated)));
    EXPECT_FALSE(updated);
    EXPECT_EQ(audit_rows("officials"), 0u);
}

TEST_F(RecordStoreTest, UpdateRejectsPrimaryKey) {
    RecordStore store(conn_, table_spec(TableId::Officials), kAdmin);
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(official("Belov"), &id)));

    Record change;
    change["id"] = Value{i64{500}};
    bool updated = true;
    EXPECT_EQ(store.update(id, change, &updated).code, StatusCode::Invalid);
    EXPECT_FALSE(updated);
}

TEST_F(RecordStoreTest, FailedUpdateRollsBackChangeAndAudit) {
    RecordStore store(conn_, table_spec(TableId::Officials), kAdmin);
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(official("Kozlov"), &id)));

    Record change;
    change["department_id"] = Value{i64{777}}; // no such department
    bool updated = true;
    const Status s = store.update(id, change, &updated);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_FALSE(updated);

    std::optional<Record> row;
    ASSERT_TRUE(is_ok(store.read(id, &row)));
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(is_null((*row)["department_id"]));
    EXPECT_EQ(audit_rows("officials"), 1u);
}

// The audit row is part of the same transaction: when it cannot be written,
// the data change is undone too.
TEST_F(RecordStoreTest, FailedAuditWriteRollsBackDataChange) {
    RecordStore seed(conn_, table_spec(TableId::Officials), kAdmin);
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(seed.create(official("Orlov", "Clerk"), &id)));

    // No user 999: audit_log.user_id fails its foreign key.
    RecordStore ghost(conn_, table_spec(TableId::Officials), PrincipalId{999});

    RecordId new_id = RecordId::invalid();
    Status s = ghost.create(official("Nobody"), &new_id);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Audit);
    EXPECT_FALSE(new_id.is_valid());
    u64 rows = 0;
    ASSERT_TRUE(is_ok(seed.count({}, &rows)));
    EXPECT_EQ(rows, 1u);

    Record change;
    change["position"] = Value{std::string("Inspector")};
    bool updated = true;
    s = ghost.update(id, change, &updated);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Audit);
    EXPECT_FALSE(updated);
    std::optional<Record> row;
    ASSERT_TRUE(is_ok(seed.read(id, &row)));
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(field_text(*row, "position"), "Clerk");
    EXPECT_TRUE(is_null((*row)["updated_by"]));

    bool removed = true;
    s = ghost.remove(id, &removed);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Audit);
    EXPECT_FALSE(removed);
    bool still_there = false;
    ASSERT_TRUE(is_ok(seed.exists({{"id", Value{id.v}}}, &still_there)));
    EXPECT_TRUE(still_there);

    EXPECT_EQ(audit_rows("officials"), 1u);
}

TEST_F(RecordStoreTest, RemoveDeletesAndAuditsOldValues) {
    RecordStore store(conn_, table_spec(TableId::Officials), kAdmin);
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(official("Fedorov"), &id)));

    bool removed = false;
    ASSERT_TRUE(is_ok(store.remove(id, &removed)));
    EXPECT_TRUE(removed);

    std::optional<Record> row;
    ASSERT_TRUE(is_ok(store.read(id, &row)));
    EXPECT_FALSE(row.has_value());

    AuditFilter f;
    f.action = AuditAction::Delete;
    std::vector<AuditEntry> entries;
    ASSERT_TRUE(is_ok(audit_list(conn_, f, &entries)));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].record_id, id.v);
    EXPECT_TRUE(entries[0].old_values.has_value());
    EXPECT_FALSE(entries[0].new_values.has_value());

    // Second delete finds nothing.
    ASSERT_TRUE(is_ok(store.remove(id, &removed)));
    EXPECT_FALSE(removed);
    EXPECT_EQ(audit_rows("officials"), 2u);
}

//=============================================================================
// Find / Count / Exists
//=============================================================================

TEST_F(RecordStoreTest, FindCountExists) {
    RecordStore store(conn_, table_spec(TableId::Officials), kAdmin);
    const char* names[] = {"Alekseev", "Borisov", "Vasiliev", "Grigoriev"};
    for (const char* n : names) {
        RecordId id = RecordId::invalid();
        ASSERT_TRUE(is_ok(store.create(official(n, n[0] == 'B' ? "Chief" : "Clerk"), &id)));
    }

    FindQuery q;
    q.where["position"] = Value{std::string("Clerk")};
    q.order.push_back(OrderBy{"full_name", true});
    q.limit = 2;
    std::vector<Record> rows;
    ASSERT_TRUE(is_ok(store.find(q, &rows)));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(field_text(rows[0], "full_name"), "Vasiliev");
    EXPECT_EQ(field_text(rows[1], "full_name"), "Grigoriev");

    FindQuery in;
    in.where["full_name"] = std::vector<Value>{Value{std::string("Borisov")}, Value{std::string("Nobody")}};
    ASSERT_TRUE(is_ok(store.find(in, &rows)));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(field_text(rows[0], "position"), "Chief");

    u64 n = 0;
    ASSERT_TRUE(is_ok(store.count({}, &n)));
    EXPECT_EQ(n, 4u);
    ASSERT_TRUE(is_ok(store.count({{"position", Criterion{Value{std::string("Clerk")}}}}, &n)));
    EXPECT_EQ(n, 3u);

    bool found = false;
    ASSERT_TRUE(is_ok(store.exists({{"full_name", Criterion{Value{std::string("Borisov")}}}}, &found)));
    EXPECT_TRUE(found);
    ASSERT_TRUE(is_ok(store.exists({{"full_name", Criterion{Value{std::string("Nobody")}}}}, &found)));
    EXPECT_FALSE(found);
}

TEST_F(RecordStoreTest, CountRejectsMembership) {
    RecordStore store(conn_, table_spec(TableId::Officials));
    Criteria where;
    where["id"] = std::vector<Value>{Value{i64{1}}};
    u64 n = 0;
    EXPECT_EQ(store.count(where, &n).code, StatusCode::Invalid);
}

TEST_F(RecordStoreTest, AuditTableIsAppendOnly) {
    RecordStore store(conn_, table_spec(TableId::AuditLog), kAdmin);
    Record r;
    r["action"] = Value{std::string("CREATE")};
    RecordId id = RecordId::invalid();
    Status s = store.create(r, &id);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(s.domain, StatusDomain::Store);

    bool changed = true;
    EXPECT_EQ(store.update(RecordId{1}, r, &changed).code, StatusCode::PermissionDenied);
    EXPECT_EQ(store.remove(RecordId{1}, &changed).code, StatusCode::PermissionDenied);
    EXPECT_FALSE(changed);

    // Reading is still allowed.
    u64 n = 1;
    EXPECT_TRUE(is_ok(store.count({}, &n)));
    EXPECT_EQ(n, 0u);
}

TEST_F(RecordStoreTest, NomenclatureCodesAreDerived) {
    RecordStore store(conn_, table_spec(TableId::Nomenclature), kAdmin);
    Record item;
    item["code"] = Value{std::string("0102003004")};
    item["name"] = Value{std::string("Washer M8")};
    item["unit"] = Value{std::string("pcs")};
    item["price"] = Value{1.25};
    RecordId id = RecordId::invalid();
    ASSERT_TRUE(is_ok(store.create(item, &id)));

    FindQuery q;
    q.where["group_code"] = Value{std::string("020")};
    std::vector<Record> rows;
    ASSERT_TRUE(is_ok(store.find(q, &rows)));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(field_text(rows[0], "class_code"), "01");
    EXPECT_EQ(field_text(rows[0], "item_number"), "004");
}
