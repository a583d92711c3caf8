#include "matreg/store/query.hpp"

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"

namespace matreg::store {

using namespace matreg::core;

namespace {
    [[nodiscard]] Status unknown_column(const db::TableSpec& table, const std::string& column) {
        logger("store")->error("{}: unknown column '{}'", table.name, column);
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
} // namespace

Status build_where(const db::TableSpec& table, const Criteria& where, bool allow_membership, SqlText* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    try {
        bool first = true;
        for (const auto& [column, criterion] : where) {
            if (!db::has_column(table, column)) {
                return unknown_column(table, column);
            }
            out->sql += first ? " WHERE " : " AND ";
            first = false;

            if (const Value* v = std::get_if<Value>(&criterion)) {
                if (is_null(*v)) {
                    out->sql += column + " IS NULL";
                } else {
                    out->sql += column + " = ?";
                    out->params.push_back(*v);
                }
                continue;
            }

            if (!allow_membership) {
                logger("store")->error("{}: membership test on '{}' is not supported here", table.name, column);
                return make_status(StatusDomain::Store, StatusCode::Invalid);
            }
            const auto& list = std::get<std::vector<Value>>(criterion);
            if (list.empty()) {
                out->sql += "1 = 0";
                continue;
            }
            out->sql += column + " IN (";
            for (size_t i = 0; i < list.size(); ++i) {
                out->sql += i == 0 ? "?" : ", ?";
                out->params.push_back(list[i]);
            }
            out->sql += ')';
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("store")->error("building WHERE for {} failed: {}", table.name, e.what());
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
}

Status build_select(const db::TableSpec& table, const FindQuery& q, SqlText* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    try {
        SqlText st;
        st.sql = std::string("SELECT * FROM ") + table.name;
        Status s = build_where(table, q.where, true, &st);
        if (!is_ok(s)) {
            return s;
        }
        for (size_t i = 0; i < q.order.size(); ++i) {
            const OrderBy& o = q.order[i];
            const db::ColumnSpec* col = db::find_column(table, o.column);
            if (col == nullptr) {
                return unknown_column(table, o.column);
            }
            if (!db::column_has(*col, db::ColumnSortable)) {
                logger("store")->error("{}: column '{}' is not sortable", table.name, o.column);
                return make_status(StatusDomain::Store, StatusCode::Invalid);
            }
            st.sql += i == 0 ? " ORDER BY " : ", ";
            st.sql += o.column;
            st.sql += o.descending ? " DESC" : " ASC";
        }
        if (q.limit) {
            st.sql += " LIMIT ?";
            st.params.emplace_back(static_cast<i64>(*q.limit));
        } else if (q.offset) {
            st.sql += " LIMIT -1";
        }
        if (q.offset) {
            st.sql += " OFFSET ?";
            st.params.emplace_back(static_cast<i64>(*q.offset));
        }
        *out = std::move(st);
        return ok_status();
    } catch (const std::exception& e) {
        logger("store")->error("building SELECT for {} failed: {}", table.name, e.what());
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
}

} // namespace matreg::store
