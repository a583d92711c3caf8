#include "matreg/core/value.hpp"

#include <ctime>
#include <type_traits>

namespace matreg::core {

std::optional<i64> field_i64(const Record& r, const std::string& column) {
    const auto it = r.find(column);
    if (it == r.end()) {
        return std::nullopt;
    }
    if (const i64* v = as_i64(it->second)) {
        return *v;
    }
    if (const double* d = as_f64(it->second)) {
        return static_cast<i64>(*d);
    }
    return std::nullopt;
}

std::optional<std::string> field_text(const Record& r, const std::string& column) {
    const auto it = r.find(column);
    if (it == r.end() || is_null(it->second)) {
        return std::nullopt;
    }
    if (const std::string* s = as_text(it->second)) {
        return *s;
    }
    return value_to_string(it->second);
}

bool field_bool(const Record& r, const std::string& column) {
    const std::optional<i64> v = field_i64(r, column);
    return v.has_value() && *v != 0;
}

std::string value_to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + x + "'";
        } else {
            return std::to_string(x);
        }
    }, v);
}

std::string values_to_string(const std::vector<Value>& values) {
    std::string out = "(";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += value_to_string(values[i]);
    }
    out += ')';
    return out;
}

std::string now_timestamp() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, n);
}

} // namespace matreg::core
