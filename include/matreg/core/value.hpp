#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "matreg/core/types.hpp"

namespace matreg::core {

    // One SQLite cell. std::monostate is SQL NULL.
    using Value = std::variant<std::monostate, i64, double, std::string>;

    // Column name -> value. Ordered so generated SQL and audit JSON are stable.
    using Record = std::map<std::string, Value>;

    [[nodiscard]] inline Value null_value() noexcept { return Value{}; }
    [[nodiscard]] inline Value bool_value(bool b) noexcept { return Value{i64{b ? 1 : 0}}; }

    [[nodiscard]] inline bool is_null(const Value& v) noexcept {
        return std::holds_alternative<std::monostate>(v);
    }

    [[nodiscard]] inline const i64* as_i64(const Value& v) noexcept { return std::get_if<i64>(&v); }
    [[nodiscard]] inline const double* as_f64(const Value& v) noexcept { return std::get_if<double>(&v); }
    [[nodiscard]] inline const std::string* as_text(const Value& v) noexcept { return std::get_if<std::string>(&v); }

    // Field lookups that tolerate absent columns and NULLs.
    [[nodiscard]] std::optional<i64> field_i64(const Record& r, const std::string& column);
    [[nodiscard]] std::optional<std::string> field_text(const Record& r, const std::string& column);
    [[nodiscard]] bool field_bool(const Record& r, const std::string& column);

    // Rendering for log lines: NULL, 42, 1.5, 'text'.
    [[nodiscard]] std::string value_to_string(const Value& v);
    [[nodiscard]] std::string values_to_string(const std::vector<Value>& values);

    // "YYYY-MM-DD HH:MM:SS" in UTC, the same shape as SQLite's CURRENT_TIMESTAMP.
    [[nodiscard]] std::string now_timestamp();

} // namespace matreg::core
