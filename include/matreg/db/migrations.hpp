#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/db/connection.hpp"

namespace matreg::db {

    // One versioned schema/data change. Statements run in order inside one transaction.
    struct Migration {
        u32 version{0};
        std::string name;
        std::vector<std::string> statements;
    };

    struct MigrationRecord {
        u32 version{0};
        std::string name;
        std::string applied_at;
    };

    // Creates the migrations ledger table if it does not exist.
    [[nodiscard]] matreg::core::Status migration_ensure_ledger(Connection& conn) noexcept;

    [[nodiscard]] matreg::core::Status migration_get_applied(Connection& conn,
        std::unordered_set<u32>* out) noexcept;

    // Ledger rows ordered by version.
    [[nodiscard]] matreg::core::Status migration_list_applied(Connection& conn,
        std::vector<MigrationRecord>* out) noexcept;

    // Applies m and writes its ledger row atomically. A version that is already
    // in the ledger is rejected with Conflict and nothing runs.
    [[nodiscard]] matreg::core::Status migration_apply(Connection& conn, const Migration& m) noexcept;

    // Applies every migration of list not yet in the ledger, in ascending version
    // order. Duplicate versions in list are rejected before anything runs.
    [[nodiscard]] matreg::core::Status migration_run_all(Connection& conn,
        const std::vector<Migration>& list,
        u32* out_applied) noexcept;

    // Same, over builtin_migrations().
    [[nodiscard]] matreg::core::Status migration_run_all(Connection& conn, u32* out_applied) noexcept;

    // 1 initial_schema, 2 add_indexes, 3 initial_data.
    [[nodiscard]] const std::vector<Migration>& builtin_migrations();

} // namespace matreg::db
