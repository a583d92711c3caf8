#include "matreg/store/record_store.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"
#include "matreg/store/audit.hpp"

namespace matreg::store {

using namespace matreg::core;

namespace {
    [[nodiscard]] Status read_only_table(const db::TableSpec& table) {
        logger("store")->error("{} is append-only", table.name);
        return make_status(StatusDomain::Store, StatusCode::PermissionDenied);
    }

    void fill_if_absent(const db::TableSpec& table, Record* fields, const char* column, const Value& v) {
        if (db::has_column(table, column) && fields->find(column) == fields->end()) {
            fields->emplace(column, v);
        }
    }
} // namespace

Status RecordStore::check_writable(const Record& fields, bool updating) const {
    for (const auto& [column, value] : fields) {
        const db::ColumnSpec* col = db::find_column(table_, column);
        if (col == nullptr) {
            logger("store")->error("{}: unknown column '{}'", table_.name, column);
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        if (db::column_has(*col, db::ColumnGenerated)) {
            logger("store")->error("{}: column '{}' is computed and cannot be written", table_.name, column);
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        if (updating && column == table_.primary_key) {
            logger("store")->error("{}: primary key '{}' cannot be updated", table_.name, column);
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
    }
    return ok_status();
}

Status RecordStore::fetch_row(RecordId id, std::optional<Record>* out) noexcept {
    try {
        const std::string sql = std::string("SELECT * FROM ") + table_.name + " WHERE " + table_.primary_key + " = ?";
        return db::db_fetch_one(conn_, sql, {Value{id.v}}, out);
    } catch (const std::exception& e) {
        logger("store")->error("{}: read #{} failed: {}", table_.name, id.v, e.what());
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
}

Status RecordStore::create(const Record& fields, RecordId* out_id) noexcept {
    if (out_id == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (table_.append_only) {
        return read_only_table(table_);
    }
    auto log = logger("store");
    try {
        Status s = check_writable(fields, false);
        if (!is_ok(s)) {
            return s;
        }

        Record data = fields;
        const std::string now = now_timestamp();
        fill_if_absent(table_, &data, "created_at", Value{now});
        fill_if_absent(table_, &data, "updated_at", Value{now});
        if (actor_.is_valid()) {
            fill_if_absent(table_, &data, "created_by", Value{actor_.v});
        }

        std::string sql = std::string("INSERT INTO ") + table_.name;
        db::Params params;
        if (data.empty()) {
            sql += " DEFAULT VALUES";
        } else {
            std::string columns;
            std::string marks;
            params.reserve(data.size());
            for (const auto& [column, value] : data) {
                if (!columns.empty()) {
                    columns += ", ";
                    marks += ", ";
                }
                columns += column;
                marks += '?';
                params.push_back(value);
            }
            sql += " (" + columns + ") VALUES (" + marks + ")";
        }

        RecordId id = RecordId::invalid();
        s = db::db_transaction(conn_, [&]() -> Status {
            db::ExecResult res{};
            Status st = db::db_execute(conn_, sql, params, &res);
            if (!is_ok(st)) {
                return st;
            }
            id = RecordId{res.last_insert_id};
            if (!actor_.is_valid()) {
                return ok_status();
            }
            return audit_append(conn_, actor_, AuditAction::Create, table_.name, id.v, nullptr, &data);
        });
        if (!is_ok(s)) {
            log->error("{}: create failed: {}", table_.name, describe(s));
            return s;
        }
        *out_id = id;
        log->debug("{}: created #{}", table_.name, id.v);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("{}: create failed: {}", table_.name, e.what());
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
}

Status RecordStore::read(RecordId id, std::optional<Record>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    return fetch_row(id, out);
}

Status RecordStore::update(RecordId id, const Record& fields, bool* out_updated) noexcept {
    if (out_updated == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    *out_updated = false;
    if (table_.append_only) {
        return read_only_table(table_);
    }
    auto log = logger("store");
    try {
        Status s = check_writable(fields, true);
        if (!is_ok(s)) {
            return s;
        }

        Record data = fields;
        if (db::has_column(table_, "updated_at")) {
            data.insert_or_assign("updated_at", Value{now_timestamp()});
        }
        if (actor_.is_valid()) {
            fill_if_absent(table_, &data, "updated_by", Value{actor_.v});
        }
        if (data.empty()) {
            log->error("{}: update of #{} with no fields", table_.name, id.v);
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }

        std::string sql = std::string("UPDATE ") + table_.name + " SET ";
        db::Params params;
        params.reserve(data.size() + 1);
        bool first = true;
        for (const auto& [column, value] : data) {
            if (!first) {
                sql += ", ";
            }
            first = false;
            sql += column + " = ?";
            params.push_back(value);
        }
        sql += std::string(" WHERE ") + table_.primary_key + " = ?";
        params.emplace_back(id.v);

        bool found = false;
        s = db::db_transaction(conn_, [&]() -> Status {
            std::optional<Record> old;
            Status st = fetch_row(id, &old);
            if (!is_ok(st) || !old) {
                return st;
            }
            found = true;
            st = db::db_execute(conn_, sql, params);
            if (!is_ok(st) || !actor_.is_valid()) {
                return st;
            }
            return audit_append(conn_, actor_, AuditAction::Update, table_.name, id.v, &*old, &data);
        });
        if (!is_ok(s)) {
            log->error("{}: update of #{} failed: {}", table_.name, id.v, describe(s));
            return s;
        }
        if (!found) {
            log->warn("{}: record #{} not found for update", table_.name, id.v);
            return ok_status();
        }
        *out_updated = true;
        log->debug("{}: updated #{}", table_.name, id.v);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("{}: update of #{} failed: {}", table_.name, id.v, e.what());
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
}

Status RecordStore::remove(RecordId id, bool* out_removed) noexcept {
    if (out_removed == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    *out_removed = false;
    if (table_.append_only) {
        return read_only_table(table_);
    }
    auto log = logger("store");
    try {
        const std::string sql = std::string("DELETE FROM ") + table_.name + " WHERE " + table_.primary_key + " = ?";
        bool found = false;
        const Status s = db::db_transaction(conn_, [&]() -> Status {
            std::optional<Record> old;
            Status st = fetch_row(id, &old);
            if (!is_ok(st) || !old) {
                return st;
            }
            found = true;
            st = db::db_execute(conn_, sql, {Value{id.v}});
            if (!is_ok(st) || !actor_.is_valid()) {
                return st;
            }
            return audit_append(conn_, actor_, AuditAction::Delete, table_.name, id.v, &*old, nullptr);
        });
        if (!is_ok(s)) {
            log->error("{}: delete of #{} failed: {}", table_.name, id.v, describe(s));
            return s;
        }
        if (!found) {
            log->warn("{}: record #{} not found for delete", table_.name, id.v);
            return ok_status();
        }
        *out_removed = true;
        log->debug("{}: deleted #{}", table_.name, id.v);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("{}: delete of #{} failed: {}", table_.name, id.v, e.what());
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
}

Status RecordStore::find(const FindQuery& q, std::vector<Record>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    SqlText st;
    const Status s = build_select(table_, q, &st);
    if (!is_ok(s)) {
        return s;
    }
    return db::db_fetch_all(conn_, st.sql, st.params, out);
}

Status RecordStore::count(const Criteria& where, u64* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    try {
        SqlText st;
        st.sql = std::string("SELECT COUNT(*) AS n FROM ") + table_.name;
        Status s = build_where(table_, where, false, &st);
        if (!is_ok(s)) {
            return s;
        }
        std::optional<Record> row;
        s = db::db_fetch_one(conn_, st.sql, st.params, &row);
        if (!is_ok(s)) {
            return s;
        }
        *out = row ? static_cast<u64>(field_i64(*row, "n").value_or(0)) : 0;
        return ok_status();
    } catch (const std::exception& e) {
        logger("store")->error("{}: count failed: {}", table_.name, e.what());
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
}

Status RecordStore::exists(const Criteria& where, bool* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    u64 n = 0;
    const Status s = count(where, &n);
    if (!is_ok(s)) {
        return s;
    }
    *out = n > 0;
    return ok_status();
}

} // namespace matreg::store
