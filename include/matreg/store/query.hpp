#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/core/value.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/db/schema.hpp"

namespace matreg::store {
    using u32 = matreg::core::u32;

    // A single value tests equality (IS NULL for NULL); a list tests membership.
    using Criterion = std::variant<matreg::core::Value, std::vector<matreg::core::Value>>;

    // Column -> criterion, combined with AND. Empty matches every row.
    using Criteria = std::map<std::string, Criterion>;

    struct OrderBy {
        std::string column;
        bool descending{false};
    };

    struct FindQuery {
        Criteria where;
        std::vector<OrderBy> order;
        std::optional<u32> limit;
        std::optional<u32> offset;
    };

    struct SqlText {
        std::string sql;
        db::Params params;
    };

    // Appends the WHERE clause for criteria (nothing when empty). Membership is rejected when
    // allow_membership is false. Unknown columns are Invalid.
    [[nodiscard]] matreg::core::Status build_where(const db::TableSpec& table,
        const Criteria& where,
        bool allow_membership,
        SqlText* out) noexcept;

    // Full SELECT for q. Order columns must be sortable in table.
    [[nodiscard]] matreg::core::Status build_select(const db::TableSpec& table,
        const FindQuery& q,
        SqlText* out) noexcept;

} // namespace matreg::store
