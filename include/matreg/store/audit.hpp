#pragma once

#include <optional>
#include <string>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/core/types.hpp"
#include "matreg/core/value.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/db/schema.hpp"

namespace matreg::store {
    using u32 = matreg::core::u32;
    using u64 = matreg::core::u64;
    using i64 = matreg::core::i64;

    enum class AuditAction : u32 {
        Create = 1,
        Update = 2,
        Delete = 3,
    };

    // "CREATE", "UPDATE", "DELETE"
    [[nodiscard]] const char* audit_action_name(AuditAction action) noexcept;
    [[nodiscard]] std::optional<AuditAction> audit_action_from_name(const std::string& name) noexcept;

    struct AuditEntry {
        i64 id{0};
        matreg::core::PrincipalId actor{matreg::core::PrincipalId::invalid()};
        AuditAction action{AuditAction::Create};
        std::string table_name;
        std::optional<i64> record_id;
        std::optional<std::string> old_values; // JSON object text
        std::optional<std::string> new_values; // JSON object text
        std::string created_at;
    };

    // Renders a record as a JSON object. Columns flagged secret in table are
    // replaced with "***"; table may be nullptr.
    [[nodiscard]] std::string audit_serialize(const matreg::core::Record& values, const db::TableSpec* table);

    // Appends one entry on conn. Callers run it in the same transaction as the
    // change it describes.
    [[nodiscard]] matreg::core::Status audit_append(db::Connection& conn,
        matreg::core::PrincipalId actor,
        AuditAction action,
        const std::string& table_name,
        std::optional<i64> record_id,
        const matreg::core::Record* old_values,
        const matreg::core::Record* new_values) noexcept;

    struct AuditFilter {
        std::optional<std::string> table_name;
        std::optional<i64> record_id;
        std::optional<matreg::core::PrincipalId> actor;
        std::optional<AuditAction> action;
        std::optional<u32> limit;
    };

    // Newest first.
    [[nodiscard]] matreg::core::Status audit_list(db::Connection& conn,
        const AuditFilter& filter,
        std::vector<AuditEntry>* out) noexcept;

    // limit is ignored.
    [[nodiscard]] matreg::core::Status audit_count(db::Connection& conn,
        const AuditFilter& filter,
        u64* out) noexcept;

} // namespace matreg::store
