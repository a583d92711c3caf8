#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/core/types.hpp"
#include "matreg/core/value.hpp"

struct sqlite3;

namespace matreg::db {
    using u32 = matreg::core::u32;
    using i64 = matreg::core::i64;

    using Params = std::vector<matreg::core::Value>;

    struct Migration;

    struct DbConfig {
        std::string path;                // ":memory:" is accepted and always treated as new
        std::string journal_mode{"WAL"};
        i64 cache_pages{10000};
        u32 busy_timeout_ms{5000};
    };

    struct ExecResult {
        i64 last_insert_id{0};
        i64 changes{0};
    };

    // One physical store connection. Move-only; owned and used by a single thread.
    class Connection {
    public:
        Connection() noexcept = default;
        ~Connection();

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&& other) noexcept;
        Connection& operator=(Connection&& other) noexcept;

        [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }
        [[nodiscard]] sqlite3* native() const noexcept { return db_; }
        [[nodiscard]] const DbConfig& config() const noexcept { return cfg_; }
        [[nodiscard]] u32 transaction_depth() const noexcept { return depth_; }

    private:
        friend class Transaction;
        friend matreg::core::Status db_open(const DbConfig& cfg,
            const std::vector<Migration>& migrations,
            Connection* out) noexcept;
        friend matreg::core::Status db_close(Connection* conn) noexcept;

        sqlite3* db_{nullptr};
        DbConfig cfg_{};
        u32 depth_{0};
    };

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Opens cfg.path, creating its directory if needed, and applies the connection
    // pragmas. When the file did not exist, runs migrations before returning. If
    // that fails, the file is deleted only when this call created it and the
    // ledger is still empty, so a store another opener populated survives.
    [[nodiscard]] matreg::core::Status db_open(const DbConfig& cfg,
        const std::vector<Migration>& migrations,
        Connection* out) noexcept;

    // Same, with builtin_migrations().
    [[nodiscard]] matreg::core::Status db_open(const DbConfig& cfg, Connection* out) noexcept;

    // Idempotent. Closing an already closed connection is Ok.
    matreg::core::Status db_close(Connection* conn) noexcept;

    // ========================================================================
    // Statements
    // ========================================================================

    // Failures are logged with the SQL text and bound parameters.
    [[nodiscard]] matreg::core::Status db_execute(Connection& conn,
        std::string_view sql,
        const Params& params,
        ExecResult* out = nullptr) noexcept;

    // Runs sql once per parameter row inside one transaction; all rows or none.
    [[nodiscard]] matreg::core::Status db_execute_many(Connection& conn,
        std::string_view sql,
        const std::vector<Params>& rows,
        ExecResult* out = nullptr) noexcept;

    [[nodiscard]] matreg::core::Status db_fetch_one(Connection& conn,
        std::string_view sql,
        const Params& params,
        std::optional<matreg::core::Record>* out) noexcept;

    [[nodiscard]] matreg::core::Status db_fetch_all(Connection& conn,
        std::string_view sql,
        const Params& params,
        std::vector<matreg::core::Record>* out) noexcept;

    // Unparameterized, may contain several statements.
    [[nodiscard]] matreg::core::Status db_exec_script(Connection& conn, const char* sql) noexcept;

    // ========================================================================
    // Transactions
    // ========================================================================

    // Scoped transaction. The outermost scope on a connection issues BEGIN IMMEDIATE,
    // nested scopes use savepoints. Destruction without commit() rolls back.
    class Transaction {
    public:
        explicit Transaction(Connection& conn) noexcept : conn_(conn) {}
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        [[nodiscard]] matreg::core::Status begin() noexcept;
        [[nodiscard]] matreg::core::Status commit() noexcept;
        matreg::core::Status rollback() noexcept;

        [[nodiscard]] bool active() const noexcept { return active_; }

    private:
        Connection& conn_;
        u32 level_{0};
        bool active_{false};
    };

    void log_transaction_failure(const Connection& conn, matreg::core::Status s) noexcept;

    // Runs fn() -> Status inside a Transaction. Commits when fn succeeds; otherwise
    // rolls back, logs, and returns fn's status unchanged.
    template <typename Fn>
    [[nodiscard]] matreg::core::Status db_transaction(Connection& conn, Fn&& fn) {
        Transaction txn(conn);
        matreg::core::Status s = txn.begin();
        if (!matreg::core::is_ok(s)) {
            return s;
        }
        s = fn();
        if (!matreg::core::is_ok(s)) {
            (void)txn.rollback();
            log_transaction_failure(conn, s);
            return s;
        }
        return txn.commit();
    }

    // ========================================================================
    // Backup / restore
    // ========================================================================

    // Online point-in-time copy to <dir>/backup_YYYYMMDD_HHMMSS.db (local time).
    [[nodiscard]] matreg::core::Status db_backup(Connection& conn,
        const std::string& destination_dir,
        std::string* out_path) noexcept;

    // Closes conn, replaces the live store file with backup_path and reopens conn
    // with the same configuration. Other connections to the same file must be
    // closed by the caller first. NotFound if backup_path does not exist.
    [[nodiscard]] matreg::core::Status db_restore(Connection* conn, const std::string& backup_path) noexcept;

    // Maps a SQLite result code to a Status in the Db domain, aux = extended code.
    [[nodiscard]] matreg::core::Status status_from_sqlite(int rc) noexcept;

} // namespace matreg::db
