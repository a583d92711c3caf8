#include "matreg/db/connection.hpp"

#include <sqlite3.h>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"
#include "matreg/db/migrations.hpp"

namespace matreg::db {

using namespace matreg::core;

namespace {
    struct StmtDeleter {
        void operator()(sqlite3_stmt* s) const noexcept { sqlite3_finalize(s); }
    };
    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    constexpr int kBackupMaxRetries = 200;

    [[nodiscard]] bool is_memory_path(const std::string& path) noexcept {
        return path == ":memory:";
    }

    [[nodiscard]] bool pragma_word_ok(const std::string& w) noexcept {
        if (w.empty()) {
            return false;
        }
        for (const char c : w) {
            if (!std::isalnum(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }

    void log_statement_failure(sqlite3* db, std::string_view sql, const Params& params, int rc, const char* msg) {
        logger("db")->error("statement failed: {} (rc={})\nQuery: {}\nParams: {}",
            msg ? msg : (db ? sqlite3_errmsg(db) : "no connection"), rc, sql, values_to_string(params));
    }

    [[nodiscard]] Status exec_plain(sqlite3* db, const char* sql) noexcept {
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            logger("db")->error("statement failed: {} (rc={})\nQuery: {}", err_msg ? err_msg : sqlite3_errmsg(db), rc, sql);
            sqlite3_free(err_msg);
            return status_from_sqlite(rc);
        }
        return ok_status();
    }

    [[nodiscard]] int bind_value(sqlite3_stmt* stmt, int idx, const Value& v) noexcept {
        if (const i64* i = as_i64(v)) {
            return sqlite3_bind_int64(stmt, idx, *i);
        }
        if (const double* d = as_f64(v)) {
            return sqlite3_bind_double(stmt, idx, *d);
        }
        if (const std::string* s = as_text(v)) {
            return sqlite3_bind_text(stmt, idx, s->data(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
        }
        return sqlite3_bind_null(stmt, idx);
    }

    [[nodiscard]] Status bind_all(sqlite3_stmt* stmt, const Params& params) noexcept {
        const int expected = sqlite3_bind_parameter_count(stmt);
        if (expected != static_cast<int>(params.size())) {
            return make_status(StatusDomain::Db, StatusCode::Invalid, SQLITE_RANGE);
        }
        for (size_t i = 0; i < params.size(); ++i) {
            const int rc = bind_value(stmt, static_cast<int>(i + 1), params[i]);
            if (rc != SQLITE_OK) {
                return status_from_sqlite(rc);
            }
        }
        return ok_status();
    }

    [[nodiscard]] Status prepare(Connection& conn, std::string_view sql, const Params& params, StmtPtr* out) noexcept {
        if (!conn.is_open()) {
            logger("db")->error("statement on closed connection\nQuery: {}", sql);
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }
        sqlite3_stmt* raw = nullptr;
        const int rc = sqlite3_prepare_v2(conn.native(), sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
        StmtPtr stmt(raw);
        if (rc != SQLITE_OK || !stmt) {
            log_statement_failure(conn.native(), sql, params, rc, nullptr);
            return rc == SQLITE_OK ? make_status(StatusDomain::Db, StatusCode::Invalid) : status_from_sqlite(rc);
        }
        const Status s = bind_all(stmt.get(), params);
        if (!is_ok(s)) {
            log_statement_failure(conn.native(), sql, params, static_cast<int>(s.aux), "parameter binding failed");
            return s;
        }
        *out = std::move(stmt);
        return ok_status();
    }

    [[nodiscard]] Record read_row(sqlite3_stmt* stmt) {
        Record row;
        const int n = sqlite3_column_count(stmt);
        for (int i = 0; i < n; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            Value v;
            switch (sqlite3_column_type(stmt, i)) {
                case SQLITE_INTEGER:
                    v = sqlite3_column_int64(stmt, i);
                    break;
                case SQLITE_FLOAT:
                    v = sqlite3_column_double(stmt, i);
                    break;
                case SQLITE_TEXT:
                case SQLITE_BLOB: {
                    const auto* p = static_cast<const char*>(sqlite3_column_blob(stmt, i));
                    const int len = sqlite3_column_bytes(stmt, i);
                    v = std::string(p ? p : "", p ? static_cast<size_t>(len) : 0);
                    break;
                }
                default:
                    break;
            }
            row.insert_or_assign(name ? std::string(name) : std::to_string(i), std::move(v));
        }
        return row;
    }

    // Steps to completion, handing each row to on_row.
    template <typename OnRow>
    [[nodiscard]] Status step_all(Connection& conn, sqlite3_stmt* stmt, std::string_view sql, const Params& params,
                                  OnRow&& on_row) {
        for (;;) {
            const int rc = sqlite3_step(stmt);
            if (rc == SQLITE_DONE) {
                return ok_status();
            }
            if (rc == SQLITE_ROW) {
                if (!on_row(stmt)) {
                    return ok_status();
                }
                continue;
            }
            log_statement_failure(conn.native(), sql, params, rc, nullptr);
            return status_from_sqlite(rc);
        }
    }

    [[nodiscard]] std::string backup_stamp() {
        const std::time_t t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[32];
        const size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
        return std::string(buf, n);
    }

    void remove_side_files(const std::string& path) noexcept {
        std::error_code ec;
        std::filesystem::remove(path + "-wal", ec);
        std::filesystem::remove(path + "-shm", ec);
    }

    // Opens a candidate backup read-only and reads its schema.
    // False when the ledger has rows or cannot be read.
    [[nodiscard]] bool ledger_is_empty(Connection& conn) noexcept {
        std::vector<MigrationRecord> applied;
        return is_ok(migration_list_applied(conn, &applied)) && applied.empty();
    }

    [[nodiscard]] Status check_store_file(const std::string& path) noexcept {
        sqlite3* handle = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &handle, SQLITE_OPEN_READONLY, nullptr);
        if (rc == SQLITE_OK) {
            rc = sqlite3_exec(handle, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, nullptr);
        }
        sqlite3_close(handle);
        return rc == SQLITE_OK ? ok_status() : status_from_sqlite(rc);
    }
} // namespace

Status status_from_sqlite(int rc) noexcept {
    const u32 aux = static_cast<u32>(rc);
    switch (rc & 0xff) {
        case SQLITE_OK:
        case SQLITE_ROW:
        case SQLITE_DONE:
            return ok_status();
        case SQLITE_CONSTRAINT:
            return make_status(StatusDomain::Db, StatusCode::Conflict, aux);
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return make_status(StatusDomain::Db, StatusCode::Busy, aux);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return make_status(StatusDomain::Db, StatusCode::Corrupt, aux);
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
            return make_status(StatusDomain::Db, StatusCode::Io, aux);
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_AUTH:
            return make_status(StatusDomain::Db, StatusCode::PermissionDenied, aux);
        case SQLITE_NOTFOUND:
            return make_status(StatusDomain::Db, StatusCode::NotFound, aux);
        case SQLITE_NOMEM:
            return make_status(StatusDomain::Db, StatusCode::Unavailable, aux);
        case SQLITE_ERROR:
        case SQLITE_MISMATCH:
        case SQLITE_RANGE:
        case SQLITE_MISUSE:
        case SQLITE_TOOBIG:
            return make_status(StatusDomain::Db, StatusCode::Invalid, aux);
        default:
            return make_status(StatusDomain::Db, StatusCode::Unknown, aux);
    }
}

// ============================================================================
// Connection
// ============================================================================

Connection::~Connection() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Connection::Connection(Connection&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      cfg_(std::move(other.cfg_)),
      depth_(std::exchange(other.depth_, 0)) {}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        if (db_ != nullptr) {
            sqlite3_close_v2(db_);
        }
        db_ = std::exchange(other.db_, nullptr);
        cfg_ = std::move(other.cfg_);
        depth_ = std::exchange(other.depth_, 0);
    }
    return *this;
}

// ============================================================================
// Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, const std::vector<Migration>& migrations, Connection* out) noexcept {
    if (out == nullptr || cfg.path.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!pragma_word_ok(cfg.journal_mode)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (out->is_open()) {
        if (out->cfg_.path == cfg.path) {
            return ok_status();
        }
        (void)db_close(out);
    }

    auto log = logger("db");
    const bool memory = is_memory_path(cfg.path);
    bool existed = false;
    bool created = false;

    try {
        if (!memory) {
            namespace fs = std::filesystem;
            std::error_code ec;
            existed = fs::exists(cfg.path, ec);
            const fs::path parent = fs::path(cfg.path).parent_path();
            if (!parent.empty()) {
                fs::create_directories(parent, ec);
                if (ec) {
                    log->error("cannot create store directory {}: {}", parent.string(), ec.message());
                    return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(ec.value()));
                }
            }
            if (!existed) {
                // Exclusive create: of several openers racing on a new path, exactly one owns it.
                if (std::FILE* f = std::fopen(cfg.path.c_str(), "wbx")) {
                    std::fclose(f);
                    created = true;
                }
            }
        }

        sqlite3* db = nullptr;
        int rc = sqlite3_open_v2(cfg.path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (rc != SQLITE_OK) {
            log->error("cannot open store {}: {}", cfg.path, db ? sqlite3_errmsg(db) : "out of memory");
            sqlite3_close(db);
            return status_from_sqlite(rc);
        }
        sqlite3_extended_result_codes(db, 1);
        sqlite3_busy_timeout(db, static_cast<int>(cfg.busy_timeout_ms));

        Status s = exec_plain(db, "PRAGMA foreign_keys = ON");
        if (!is_ok(s)) {
            sqlite3_close(db);
            return s;
        }

        const std::string journal_sql = "PRAGMA journal_mode = " + cfg.journal_mode;
        if (!is_ok(exec_plain(db, journal_sql.c_str()))) {
            // In-memory stores and some filesystems refuse WAL; the default journal still works.
            log->warn("journal_mode={} not applied to {}", cfg.journal_mode, cfg.path);
        }
        const std::string cache_sql = "PRAGMA cache_size = " + std::to_string(cfg.cache_pages);
        (void)exec_plain(db, "PRAGMA synchronous = NORMAL");
        (void)exec_plain(db, cache_sql.c_str());
        (void)exec_plain(db, "PRAGMA temp_store = MEMORY");

        out->db_ = db;
        out->cfg_ = cfg;
        out->depth_ = 0;

        if (!existed) {
            log->info("creating new store: {}", cfg.path);
            u32 applied = 0;
            s = migration_run_all(*out, migrations, &applied);
            if (!is_ok(s)) {
                log->critical("schema initialization of {} failed: {}", cfg.path, describe(s));
                const bool discard = created && s.code != StatusCode::Busy && ledger_is_empty(*out);
                (void)db_close(out);
                if (discard) {
                    std::error_code ec;
                    std::filesystem::remove(cfg.path, ec);
                    remove_side_files(cfg.path);
                    log->info("removed half-initialized store {}", cfg.path);
                }
                return s;
            }
        } else {
            log->info("connected to existing store: {}", cfg.path);
        }
        return ok_status();
    } catch (const std::exception& e) {
        log->error("db_open {} failed: {}", cfg.path, e.what());
        (void)db_close(out);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_close(Connection* conn) noexcept {
    if (conn == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (conn->db_ == nullptr) {
        return ok_status();
    }
    const int rc = sqlite3_close_v2(conn->db_);
    conn->db_ = nullptr;
    conn->depth_ = 0;
    if (rc != SQLITE_OK) {
        return status_from_sqlite(rc);
    }
    logger("db")->debug("connection to {} closed", conn->cfg_.path);
    return ok_status();
}

// ============================================================================
// Statements
// ============================================================================

Status db_execute(Connection& conn, std::string_view sql, const Params& params, ExecResult* out) noexcept {
    try {
        StmtPtr stmt;
        Status s = prepare(conn, sql, params, &stmt);
        if (!is_ok(s)) {
            return s;
        }
        s = step_all(conn, stmt.get(), sql, params, [](sqlite3_stmt*) { return true; });
        if (!is_ok(s)) {
            return s;
        }
        if (out != nullptr) {
            out->last_insert_id = sqlite3_last_insert_rowid(conn.native());
            out->changes = sqlite3_changes(conn.native());
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("db")->error("db_execute: {}\nQuery: {}", e.what(), sql);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_open(const DbConfig& cfg, Connection* out) noexcept {
    try {
        return db_open(cfg, builtin_migrations(), out);
    } catch (const std::exception& e) {
        logger("db")->error("db_open {} failed: {}", cfg.path, e.what());
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_execute_many(Connection& conn, std::string_view sql, const std::vector<Params>& rows, ExecResult* out) noexcept {
    if (rows.empty()) {
        if (out != nullptr) {
            *out = ExecResult{};
        }
        return ok_status();
    }
    try {
        ExecResult total{};
        const Status s = db_transaction(conn, [&]() -> Status {
            StmtPtr stmt;
            Status st = prepare(conn, sql, rows.front(), &stmt);
            if (!is_ok(st)) {
                return st;
            }
            for (size_t i = 0; i < rows.size(); ++i) {
                if (i > 0) {
                    sqlite3_reset(stmt.get());
                    sqlite3_clear_bindings(stmt.get());
                    st = bind_all(stmt.get(), rows[i]);
                    if (!is_ok(st)) {
                        log_statement_failure(conn.native(), sql, rows[i], static_cast<int>(st.aux), "parameter binding failed");
                        return st;
                    }
                }
                st = step_all(conn, stmt.get(), sql, rows[i], [](sqlite3_stmt*) { return true; });
                if (!is_ok(st)) {
                    return st;
                }
                total.changes += sqlite3_changes(conn.native());
                total.last_insert_id = sqlite3_last_insert_rowid(conn.native());
            }
            return ok_status();
        });
        if (is_ok(s) && out != nullptr) {
            *out = total;
        }
        return s;
    } catch (const std::exception& e) {
        logger("db")->error("db_execute_many: {}\nQuery: {}", e.what(), sql);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_fetch_one(Connection& conn, std::string_view sql, const Params& params, std::optional<Record>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    try {
        out->reset();
        StmtPtr stmt;
        Status s = prepare(conn, sql, params, &stmt);
        if (!is_ok(s)) {
            return s;
        }
        return step_all(conn, stmt.get(), sql, params, [&](sqlite3_stmt* st) {
            *out = read_row(st);
            return false;
        });
    } catch (const std::exception& e) {
        logger("db")->error("db_fetch_one: {}\nQuery: {}", e.what(), sql);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_fetch_all(Connection& conn, std::string_view sql, const Params& params, std::vector<Record>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    try {
        out->clear();
        StmtPtr stmt;
        Status s = prepare(conn, sql, params, &stmt);
        if (!is_ok(s)) {
            return s;
        }
        return step_all(conn, stmt.get(), sql, params, [&](sqlite3_stmt* st) {
            out->push_back(read_row(st));
            return true;
        });
    } catch (const std::exception& e) {
        logger("db")->error("db_fetch_all: {}\nQuery: {}", e.what(), sql);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_exec_script(Connection& conn, const char* sql) noexcept {
    if (!conn.is_open() || sql == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    return exec_plain(conn.native(), sql);
}

// ============================================================================
// Transactions
// ============================================================================

Transaction::~Transaction() {
    if (active_) {
        (void)rollback();
    }
}

Status Transaction::begin() noexcept {
    if (active_ || !conn_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    level_ = conn_.depth_;
    const std::string sql = level_ == 0 ? std::string("BEGIN IMMEDIATE")
                                        : "SAVEPOINT matreg_sp_" + std::to_string(level_);
    const Status s = exec_plain(conn_.native(), sql.c_str());
    if (!is_ok(s)) {
        return s;
    }
    ++conn_.depth_;
    active_ = true;
    return ok_status();
}

Status Transaction::commit() noexcept {
    if (!active_ || !conn_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (conn_.depth_ != level_ + 1) {
        logger("db")->error("commit of transaction level {} while level {} is open", level_, conn_.depth_ - 1);
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const std::string sql = level_ == 0 ? std::string("COMMIT")
                                        : "RELEASE matreg_sp_" + std::to_string(level_);
    const Status s = exec_plain(conn_.native(), sql.c_str());
    if (!is_ok(s)) {
        return s;
    }
    --conn_.depth_;
    active_ = false;
    return ok_status();
}

Status Transaction::rollback() noexcept {
    if (!active_) {
        return ok_status();
    }
    active_ = false;
    if (conn_.depth_ > 0) {
        --conn_.depth_;
    }
    if (!conn_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    // An error such as SQLITE_FULL may already have ended the transaction.
    if (sqlite3_get_autocommit(conn_.native()) != 0) {
        return ok_status();
    }
    if (level_ == 0) {
        return exec_plain(conn_.native(), "ROLLBACK");
    }
    const std::string name = "matreg_sp_" + std::to_string(level_);
    const std::string sql = "ROLLBACK TO " + name + "; RELEASE " + name;
    return exec_plain(conn_.native(), sql.c_str());
}

void log_transaction_failure(const Connection& conn, Status s) noexcept {
    logger("db")->error("transaction on {} rolled back: {}", conn.config().path, describe(s));
}

// ============================================================================
// Backup / restore
// ============================================================================

Status db_backup(Connection& conn, const std::string& destination_dir, std::string* out_path) noexcept {
    if (!conn.is_open() || out_path == nullptr || destination_dir.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    auto log = logger("backup");
    namespace fs = std::filesystem;

    try {
        std::error_code ec;
        fs::create_directories(destination_dir, ec);
        if (ec) {
            log->error("cannot create backup directory {}: {}", destination_dir, ec.message());
            return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(ec.value()));
        }

        const std::string base = "backup_" + backup_stamp();
        fs::path path = fs::path(destination_dir) / (base + ".db");
        for (u32 n = 1; fs::exists(path, ec); ++n) {
            path = fs::path(destination_dir) / (base + "_" + std::to_string(n) + ".db");
        }

        sqlite3* dest = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &dest, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (rc != SQLITE_OK) {
            log->error("cannot create backup file {}: {}", path.string(), dest ? sqlite3_errmsg(dest) : "out of memory");
            sqlite3_close(dest);
            return status_from_sqlite(rc);
        }

        sqlite3_backup* bk = sqlite3_backup_init(dest, "main", conn.native(), "main");
        if (bk == nullptr) {
            rc = sqlite3_extended_errcode(dest);
            log->error("backup of {} could not start: {}", conn.config().path, sqlite3_errmsg(dest));
            sqlite3_close(dest);
            fs::remove(path, ec);
            return status_from_sqlite(rc);
        }

        int attempts = 0;
        do {
            rc = sqlite3_backup_step(bk, -1);
            if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && ++attempts < kBackupMaxRetries) {
                sqlite3_sleep(25);
                continue;
            }
        } while (rc == SQLITE_OK || ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempts < kBackupMaxRetries));
        sqlite3_backup_finish(bk);
        sqlite3_close(dest);

        if (rc != SQLITE_DONE) {
            log->error("backup of {} to {} failed (rc={})", conn.config().path, path.string(), rc);
            fs::remove(path, ec);
            return status_from_sqlite(rc);
        }

        *out_path = path.string();
        log->info("backup created: {}", *out_path);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("backup of {} failed: {}", conn.config().path, e.what());
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_restore(Connection* conn, const std::string& backup_path) noexcept {
    if (conn == nullptr || conn->config().path.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    auto log = logger("backup");
    namespace fs = std::filesystem;

    try {
        std::error_code ec;
        if (!fs::is_regular_file(backup_path, ec)) {
            log->error("backup file not found: {}", backup_path);
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        if (conn->transaction_depth() > 0) {
            log->error("restore requested inside an open transaction");
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }
        const DbConfig cfg = conn->config();
        if (is_memory_path(cfg.path)) {
            return make_status(StatusDomain::Db, StatusCode::Unsupported);
        }

        Status s = check_store_file(backup_path);
        if (!is_ok(s)) {
            log->error("{} is not a readable store file: {}", backup_path, describe(s));
            return make_status(StatusDomain::Db, StatusCode::Corrupt, s.aux);
        }

        s = db_close(conn);
        if (!is_ok(s)) {
            log->error("restore: closing {} failed: {}", cfg.path, describe(s));
            return s;
        }

        fs::copy_file(backup_path, cfg.path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            log->error("restore: copying {} over {} failed: {}", backup_path, cfg.path, ec.message());
            (void)db_open(cfg, conn);
            return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        remove_side_files(cfg.path);

        s = db_open(cfg, conn);
        if (!is_ok(s)) {
            return s;
        }
        log->info("store {} restored from {}", cfg.path, backup_path);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("restore from {} failed: {}", backup_path, e.what());
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

} // namespace matreg::db
