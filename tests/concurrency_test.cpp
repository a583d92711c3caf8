#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "matreg/core/value.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/db/migrations.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/store/audit.hpp"
#include "matreg/store/record_store.hpp"
#include "temp_store.hpp"

using namespace matreg::core;
using matreg::db::Connection;
using matreg::db::TableId;

namespace {

constexpr int kWriters = 2;
constexpr int kPerWriter = 100;

class ConcurrencyTest : public matreg::testing::TempStoreTest {};

} // namespace

// Each thread owns its own connection; the store serializes the writers.
TEST_F(ConcurrencyTest, ParallelWritersLoseNothing) {
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w]() {
            Connection conn;
            if (!is_ok(matreg::db::db_open(cfg_, &conn))) {
                ++failures;
                return;
            }
            matreg::store::RecordStore store(conn, matreg::db::table_spec(TableId::Officials), PrincipalId{1});
            for (int i = 0; i < kPerWriter; ++i) {
                Record r;
                r["full_name"] = Value{"writer" + std::to_string(w) + "_" + std::to_string(i)};
                r["position"] = Value{std::string("Clerk")};
                RecordId id = RecordId::invalid();
                if (!is_ok(store.create(r, &id)) || !id.is_valid()) {
                    ++failures;
                }
            }
            (void)matreg::db::db_close(&conn);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(failures.load(), 0);

    matreg::store::RecordStore store(conn_, matreg::db::table_spec(TableId::Officials));
    u64 rows = 0;
    ASSERT_TRUE(is_ok(store.count({}, &rows)));
    EXPECT_EQ(rows, static_cast<u64>(kWriters * kPerWriter));

    matreg::store::AuditFilter f;
    f.table_name = "officials";
    f.action = matreg::store::AuditAction::Create;
    u64 audits = 0;
    ASSERT_TRUE(is_ok(matreg::store::audit_count(conn_, f, &audits)));
    EXPECT_EQ(audits, static_cast<u64>(kWriters * kPerWriter));
}

// Two connections racing to open a brand-new file apply each migration once.
TEST(ConcurrencyFirstOpen, MigrationsAppliedOnce) {
    const auto dir = matreg::testing::make_temp_dir();
    matreg::db::DbConfig cfg{};
    cfg.path = (dir / "race.db").string();

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            Connection conn;
            if (!is_ok(matreg::db::db_open(cfg, &conn))) {
                ++failures;
                return;
            }
            u32 applied = 0;
            if (!is_ok(matreg::db::migration_run_all(conn, &applied))) {
                ++failures;
            }
            (void)matreg::db::db_close(&conn);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(failures.load(), 0);

    Connection conn;
    ASSERT_TRUE(is_ok(matreg::db::db_open(cfg, &conn)));
    std::vector<matreg::db::MigrationRecord> ledger;
    ASSERT_TRUE(is_ok(matreg::db::migration_list_applied(conn, &ledger)));
    EXPECT_EQ(ledger.size(), 3u);

    std::optional<Record> row;
    ASSERT_TRUE(is_ok(matreg::db::db_fetch_one(conn, "SELECT COUNT(*) AS n FROM roles", {}, &row)));
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(field_i64(*row, "n"), 4);
    (void)matreg::db::db_close(&conn);
    std::filesystem::remove_all(dir);
}
