#include "matreg/store/audit.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"

namespace matreg::store {

using namespace matreg::core;
using json = nlohmann::json;

namespace {
    constexpr const char* kRedacted = "***";

    [[nodiscard]] json to_json(const Value& v) {
        if (const i64* i = as_i64(v)) {
            return *i;
        }
        if (const double* d = as_f64(v)) {
            return *d;
        }
        if (const std::string* s = as_text(v)) {
            return *s;
        }
        return nullptr;
    }

    // WHERE clause and parameters shared by list and count.
    void build_filter(const AuditFilter& f, std::string* where, db::Params* params) {
        std::vector<std::string> terms;
        if (f.table_name) {
            terms.emplace_back("table_name = ?");
            params->emplace_back(*f.table_name);
        }
        if (f.record_id) {
            terms.emplace_back("record_id = ?");
            params->emplace_back(*f.record_id);
        }
        if (f.actor) {
            terms.emplace_back("user_id = ?");
            params->emplace_back(f.actor->v);
        }
        if (f.action) {
            terms.emplace_back("action = ?");
            params->emplace_back(std::string(audit_action_name(*f.action)));
        }
        for (size_t i = 0; i < terms.size(); ++i) {
            *where += i == 0 ? " WHERE " : " AND ";
            *where += terms[i];
        }
    }

    [[nodiscard]] AuditEntry entry_from_row(const Record& r) {
        AuditEntry e;
        e.id = field_i64(r, "id").value_or(0);
        e.actor = PrincipalId{field_i64(r, "user_id").value_or(0)};
        e.action = audit_action_from_name(field_text(r, "action").value_or("")).value_or(AuditAction::Create);
        e.table_name = field_text(r, "table_name").value_or("");
        e.record_id = field_i64(r, "record_id");
        e.old_values = field_text(r, "old_values");
        e.new_values = field_text(r, "new_values");
        e.created_at = field_text(r, "created_at").value_or("");
        return e;
    }
} // namespace

const char* audit_action_name(AuditAction action) noexcept {
    switch (action) {
        case AuditAction::Create: return "CREATE";
        case AuditAction::Update: return "UPDATE";
        case AuditAction::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

std::optional<AuditAction> audit_action_from_name(const std::string& name) noexcept {
    if (name == "CREATE") {
        return AuditAction::Create;
    }
    if (name == "UPDATE") {
        return AuditAction::Update;
    }
    if (name == "DELETE") {
        return AuditAction::Delete;
    }
    return std::nullopt;
}

std::string audit_serialize(const Record& values, const db::TableSpec* table) {
    json obj = json::object();
    for (const auto& [column, value] : values) {
        const db::ColumnSpec* col = table ? db::find_column(*table, column) : nullptr;
        if (col != nullptr && db::column_has(*col, db::ColumnSecret)) {
            obj[column] = kRedacted;
            continue;
        }
        obj[column] = to_json(value);
    }
    return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

Status audit_append(db::Connection& conn,
                    PrincipalId actor,
                    AuditAction action,
                    const std::string& table_name,
                    std::optional<i64> record_id,
                    const Record* old_values,
                    const Record* new_values) noexcept {
    if (!actor.is_valid() || table_name.empty()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }
    try {
        const db::TableSpec* table = db::table_spec_by_name(table_name);
        db::Params params;
        params.reserve(6);
        params.emplace_back(actor.v);
        params.emplace_back(std::string(audit_action_name(action)));
        params.emplace_back(table_name);
        params.emplace_back(record_id ? Value{*record_id} : null_value());
        params.emplace_back(old_values ? Value{audit_serialize(*old_values, table)} : null_value());
        params.emplace_back(new_values ? Value{audit_serialize(*new_values, table)} : null_value());

        const Status s = db::db_execute(conn,
            "INSERT INTO audit_log (user_id, action, table_name, record_id, old_values, new_values) "
            "VALUES (?, ?, ?, ?, ?, ?)",
            params);
        if (!is_ok(s)) {
            logger("audit")->error("audit write for {} {} #{} failed: {}", audit_action_name(action), table_name,
                                   record_id.value_or(0), describe(s));
            return rescope(s, StatusDomain::Audit);
        }
        logger("audit")->debug("{} {} #{} by principal {}", audit_action_name(action), table_name,
                               record_id.value_or(0), actor.v);
        return ok_status();
    } catch (const std::exception& e) {
        logger("audit")->error("audit write failed: {}", e.what());
        return make_status(StatusDomain::Audit, StatusCode::Unknown);
    }
}

Status audit_list(db::Connection& conn, const AuditFilter& filter, std::vector<AuditEntry>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }
    try {
        out->clear();
        std::string sql = "SELECT id, user_id, action, table_name, record_id, old_values, new_values, created_at "
                          "FROM audit_log";
        db::Params params;
        build_filter(filter, &sql, &params);
        sql += " ORDER BY created_at DESC, id DESC";
        if (filter.limit) {
            sql += " LIMIT ?";
            params.emplace_back(static_cast<i64>(*filter.limit));
        }
        std::vector<Record> rows;
        const Status s = db::db_fetch_all(conn, sql, params, &rows);
        if (!is_ok(s)) {
            return rescope(s, StatusDomain::Audit);
        }
        out->reserve(rows.size());
        for (const Record& r : rows) {
            out->push_back(entry_from_row(r));
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("audit")->error("audit query failed: {}", e.what());
        return make_status(StatusDomain::Audit, StatusCode::Unknown);
    }
}

Status audit_count(db::Connection& conn, const AuditFilter& filter, u64* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }
    try {
        std::string sql = "SELECT COUNT(*) AS n FROM audit_log";
        db::Params params;
        build_filter(filter, &sql, &params);
        std::optional<Record> row;
        const Status s = db::db_fetch_one(conn, sql, params, &row);
        if (!is_ok(s)) {
            return rescope(s, StatusDomain::Audit);
        }
        *out = row ? static_cast<u64>(field_i64(*row, "n").value_or(0)) : 0;
        return ok_status();
    } catch (const std::exception& e) {
        logger("audit")->error("audit count failed: {}", e.what());
        return make_status(StatusDomain::Audit, StatusCode::Unknown);
    }
}

} // namespace matreg::store
