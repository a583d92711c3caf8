#include "matreg/db/migrations.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"

namespace matreg::db {

using namespace matreg::core;

namespace {
    // Argon2id (libsodium crypto_pwhash_str, interactive limits) of "admin".
    constexpr const char* kBootstrapAdminHash =
        "$argon2id$v=19$m=65536,t=2,p=1$bJxKLYNeTmUlkIhgXvcLrw$08UoOFqxhPe/1CNqhFidqZl/TWXTSENmfMPJCPlm4Dk";

    std::vector<std::string> initial_schema() {
        return {
            R"sql(CREATE TABLE roles (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name VARCHAR(50) UNIQUE NOT NULL,
                description TEXT,
                can_read BOOLEAN NOT NULL DEFAULT 1,
                can_write BOOLEAN NOT NULL DEFAULT 0,
                can_delete BOOLEAN NOT NULL DEFAULT 0,
                can_approve BOOLEAN NOT NULL DEFAULT 0,
                can_admin BOOLEAN NOT NULL DEFAULT 0,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                created_by INTEGER,
                updated_by INTEGER
            ))sql",
            R"sql(CREATE TABLE users (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                username VARCHAR(50) UNIQUE NOT NULL,
                password_hash VARCHAR(255) NOT NULL,
                full_name VARCHAR(200) NOT NULL,
                position VARCHAR(200),
                is_active BOOLEAN NOT NULL DEFAULT 1,
                role_id INTEGER NOT NULL,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                created_by INTEGER,
                updated_by INTEGER,
                FOREIGN KEY (role_id) REFERENCES roles(id)
            ))sql",
            R"sql(CREATE TABLE audit_log (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                user_id INTEGER NOT NULL,
                action VARCHAR(50) NOT NULL,
                table_name VARCHAR(50) NOT NULL,
                record_id INTEGER,
                old_values JSON,
                new_values JSON,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                FOREIGN KEY (user_id) REFERENCES users(id)
            ))sql",
            R"sql(CREATE TABLE departments (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                code VARCHAR(2) UNIQUE NOT NULL,
                name VARCHAR(200) NOT NULL,
                parent_id INTEGER,
                head_id INTEGER,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                created_by INTEGER,
                updated_by INTEGER,
                FOREIGN KEY (parent_id) REFERENCES departments(id),
                FOREIGN KEY (head_id) REFERENCES officials(id)
            ))sql",
            R"sql(CREATE TABLE officials (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                military_unit VARCHAR(10),
                department_id INTEGER,
                position VARCHAR(200) NOT NULL,
                rank VARCHAR(100),
                full_name VARCHAR(200) NOT NULL,
                is_responsible BOOLEAN NOT NULL DEFAULT 0,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                created_by INTEGER,
                updated_by INTEGER,
                FOREIGN KEY (department_id) REFERENCES departments(id)
            ))sql",
            R"sql(CREATE TABLE material_groups (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                code VARCHAR(5) UNIQUE NOT NULL,
                name VARCHAR(200) NOT NULL,
                department_id INTEGER,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                created_by INTEGER,
                updated_by INTEGER,
                FOREIGN KEY (department_id) REFERENCES departments(id)
            ))sql",
            // The ten-character code is CCGGGSSNNN: class, group, subgroup, item number.
            R"sql(CREATE TABLE nomenclature (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                code CHAR(10) UNIQUE NOT NULL,
                okp_code VARCHAR(20),
                name VARCHAR(500) NOT NULL,
                unit VARCHAR(50) NOT NULL,
                price DECIMAL(15,2) DEFAULT 0,
                weight_unit DECIMAL(10,3),
                weight_total DECIMAL(10,3),
                class_code CHAR(2) GENERATED ALWAYS AS (SUBSTR(code, 1, 2)) STORED,
                group_code CHAR(3) GENERATED ALWAYS AS (SUBSTR(code, 3, 3)) STORED,
                subgroup_code CHAR(2) GENERATED ALWAYS AS (SUBSTR(code, 6, 2)) STORED,
                item_number CHAR(3) GENERATED ALWAYS AS (SUBSTR(code, 8, 3)) STORED,
                department_id INTEGER,
                is_active BOOLEAN NOT NULL DEFAULT 1,
                is_temporary BOOLEAN NOT NULL DEFAULT 0,
                base_document VARCHAR(200),
                document_date DATE,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                created_by INTEGER,
                updated_by INTEGER,
                FOREIGN KEY (department_id) REFERENCES departments(id),
                FOREIGN KEY (created_by) REFERENCES users(id),
                FOREIGN KEY (updated_by) REFERENCES users(id)
            ))sql",
            R"sql(CREATE TABLE categories (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                code INTEGER UNIQUE NOT NULL CHECK (code BETWEEN 1 AND 5),
                name VARCHAR(100) NOT NULL,
                description TEXT,
                created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
                created_by INTEGER,
                updated_by INTEGER
            ))sql",
        };
    }

    std::vector<std::string> add_indexes() {
        return {
            "CREATE INDEX IF NOT EXISTS idx_audit_user ON audit_log(user_id)",
            "CREATE INDEX IF NOT EXISTS idx_audit_date ON audit_log(created_at)",
            "CREATE INDEX IF NOT EXISTS idx_audit_table ON audit_log(table_name, record_id)",
            "CREATE INDEX IF NOT EXISTS idx_nomenclature_code ON nomenclature(code)",
            "CREATE INDEX IF NOT EXISTS idx_nomenclature_class ON nomenclature(class_code)",
            "CREATE INDEX IF NOT EXISTS idx_nomenclature_group ON nomenclature(group_code)",
            "CREATE INDEX IF NOT EXISTS idx_nomenclature_dept ON nomenclature(department_id)",
            "CREATE INDEX IF NOT EXISTS idx_nomenclature_active ON nomenclature(is_active)",
        };
    }

    std::vector<std::string> initial_data() {
        return {
            R"sql(INSERT OR IGNORE INTO roles (name, description, can_read, can_write, can_delete, can_approve, can_admin) VALUES
                ('Administrator', 'Full access', 1, 1, 1, 1, 1),
                ('Operator', 'Data entry and editing', 1, 1, 0, 0, 0),
                ('Manager', 'Document approval', 1, 1, 0, 1, 0),
                ('Observer', 'Read only', 1, 0, 0, 0, 0))sql",
            R"sql(INSERT OR IGNORE INTO categories (code, name) VALUES
                (1, 'First category'),
                (2, 'Second category'),
                (3, 'Third category'),
                (4, 'Fourth category'),
                (5, 'Fifth category'))sql",
            std::string(R"sql(INSERT OR IGNORE INTO users (username, password_hash, full_name, position, role_id)
                VALUES ('admin', ')sql") + kBootstrapAdminHash +
                R"sql(', 'System Administrator', 'Administrator',
                        (SELECT id FROM roles WHERE name = 'Administrator')))sql",
        };
    }

    // Runs m unless its version is already in the ledger. The ledger check happens
    // under the write lock, so two connections racing on a fresh store apply it once.
    [[nodiscard]] Status apply_once(Connection& conn, const Migration& m, bool* applied) noexcept {
        *applied = false;
        const Status s = db_transaction(conn, [&]() -> Status {
            std::optional<Record> row;
            Status st = db_fetch_one(conn, "SELECT version FROM migrations WHERE version = ?",
                                     {Value{static_cast<i64>(m.version)}}, &row);
            if (!is_ok(st) || row.has_value()) {
                return st;
            }
            for (const std::string& sql : m.statements) {
                st = db_execute(conn, sql, {});
                if (!is_ok(st)) {
                    return st;
                }
            }
            st = db_execute(conn, "INSERT INTO migrations (version, name) VALUES (?, ?)",
                            {Value{static_cast<i64>(m.version)}, Value{m.name}});
            if (is_ok(st)) {
                *applied = true;
            }
            return st;
        });
        if (!is_ok(s)) {
            *applied = false;
        }
        return rescope(s, StatusDomain::Migration);
    }
} // namespace

Status migration_ensure_ledger(Connection& conn) noexcept {
    const Status s = db_execute(conn, R"sql(CREATE TABLE IF NOT EXISTS migrations (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        version INTEGER UNIQUE NOT NULL,
        name TEXT NOT NULL,
        applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
    ))sql", {});
    return rescope(s, StatusDomain::Migration);
}

Status migration_get_applied(Connection& conn, std::unordered_set<u32>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }
    try {
        out->clear();
        std::vector<Record> rows;
        const Status s = db_fetch_all(conn, "SELECT version FROM migrations ORDER BY version", {}, &rows);
        if (!is_ok(s)) {
            return rescope(s, StatusDomain::Migration);
        }
        for (const Record& r : rows) {
            if (const auto v = field_i64(r, "version")) {
                out->insert(static_cast<u32>(*v));
            }
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("migrations")->error("reading ledger failed: {}", e.what());
        return make_status(StatusDomain::Migration, StatusCode::Unknown);
    }
}

Status migration_list_applied(Connection& conn, std::vector<MigrationRecord>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }
    try {
        out->clear();
        std::vector<Record> rows;
        const Status s = db_fetch_all(conn,
            "SELECT version, name, applied_at FROM migrations ORDER BY version", {}, &rows);
        if (!is_ok(s)) {
            return rescope(s, StatusDomain::Migration);
        }
        out->reserve(rows.size());
        for (const Record& r : rows) {
            MigrationRecord rec;
            rec.version = static_cast<u32>(field_i64(r, "version").value_or(0));
            rec.name = field_text(r, "name").value_or("");
            rec.applied_at = field_text(r, "applied_at").value_or("");
            out->push_back(std::move(rec));
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("migrations")->error("reading ledger failed: {}", e.what());
        return make_status(StatusDomain::Migration, StatusCode::Unknown);
    }
}

Status migration_apply(Connection& conn, const Migration& m) noexcept {
    auto log = logger("migrations");
    Status s = migration_ensure_ledger(conn);
    if (!is_ok(s)) {
        return s;
    }
    bool applied = false;
    s = apply_once(conn, m, &applied);
    if (!is_ok(s)) {
        log->error("migration {} '{}' failed: {}", m.version, m.name, describe(s));
        return s;
    }
    if (!applied) {
        log->warn("migration {} '{}' is already applied", m.version, m.name);
        return make_status(StatusDomain::Migration, StatusCode::Conflict);
    }
    log->info("migration {} '{}' applied", m.version, m.name);
    return ok_status();
}

Status migration_run_all(Connection& conn, const std::vector<Migration>& list, u32* out_applied) noexcept {
    auto log = logger("migrations");
    try {
        std::vector<const Migration*> ordered;
        ordered.reserve(list.size());
        for (const Migration& m : list) {
            ordered.push_back(&m);
        }
        std::sort(ordered.begin(), ordered.end(),
                  [](const Migration* a, const Migration* b) { return a->version < b->version; });
        for (size_t i = 1; i < ordered.size(); ++i) {
            if (ordered[i]->version == ordered[i - 1]->version) {
                log->error("duplicate migration version {}", ordered[i]->version);
                return make_status(StatusDomain::Migration, StatusCode::Invalid);
            }
        }

        Status s = migration_ensure_ledger(conn);
        if (!is_ok(s)) {
            return s;
        }
        std::unordered_set<u32> done;
        s = migration_get_applied(conn, &done);
        if (!is_ok(s)) {
            return s;
        }

        u32 count = 0;
        for (const Migration* m : ordered) {
            if (done.count(m->version) != 0) {
                continue;
            }
            log->info("applying migration {}: {}", m->version, m->name);
            bool applied = false;
            s = apply_once(conn, *m, &applied);
            if (!is_ok(s)) {
                log->error("migration {} '{}' failed: {}", m->version, m->name, describe(s));
                return s;
            }
            if (applied) {
                ++count;
            }
        }
        if (out_applied != nullptr) {
            *out_applied = count;
        }
        log->info("all migrations applied ({} new)", count);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("migration run failed: {}", e.what());
        return make_status(StatusDomain::Migration, StatusCode::Unknown);
    }
}

Status migration_run_all(Connection& conn, u32* out_applied) noexcept {
    try {
        return migration_run_all(conn, builtin_migrations(), out_applied);
    } catch (const std::exception& e) {
        logger("migrations")->error("building migration list failed: {}", e.what());
        return make_status(StatusDomain::Migration, StatusCode::Unknown);
    }
}

const std::vector<Migration>& builtin_migrations() {
    static const std::vector<Migration> kBuiltin = {
        {1, "initial_schema", initial_schema()},
        {2, "add_indexes", add_indexes()},
        {3, "initial_data", initial_data()},
    };
    return kBuiltin;
}

} // namespace matreg::db
