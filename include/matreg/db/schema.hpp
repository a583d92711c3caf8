#pragma once

#include <string_view>
#include <type_traits>

#include "matreg/core/types.hpp"

namespace matreg::db {
    using u32 = matreg::core::u32;

    enum class TableId : u32 {
        Users = 1,
        Roles = 2,
        AuditLog = 3,
        Departments = 4,
        Officials = 5,
        MaterialGroups = 6,
        Nomenclature = 7,
        Categories = 8,
    };

    enum class ColumnType : u32 {
        Integer = 1,
        Real = 2,
        Text = 3,
        Boolean = 4,
        Timestamp = 5,
    };

    enum ColumnFlag : u32 {
        ColumnNone = 0,
        ColumnSortable = 1u << 0,
        ColumnGenerated = 1u << 1, // computed by the store, never written
        ColumnSecret = 1u << 2,    // redacted in audit values and logs
    };

    struct ColumnSpec {
        const char* name{nullptr};
        ColumnType type{ColumnType::Text};
        u32 flags{ColumnNone};
    };

    // Static description of one table. Instances live for the whole program.
    struct TableSpec {
        TableId id{TableId::Users};
        const char* name{nullptr};
        const char* primary_key{"id"};
        const ColumnSpec* columns{nullptr};
        u32 column_count{0};
        bool append_only{false};
    };

    [[nodiscard]] constexpr bool column_has(const ColumnSpec& c, ColumnFlag f) noexcept {
        return (c.flags & static_cast<u32>(f)) != 0;
    }

    [[nodiscard]] const TableSpec& table_spec(TableId id) noexcept;

    // Lookup by SQL table name; nullptr when the table is not part of the schema.
    [[nodiscard]] const TableSpec* table_spec_by_name(std::string_view name) noexcept;

    [[nodiscard]] const ColumnSpec* find_column(const TableSpec& table, std::string_view column) noexcept;

    [[nodiscard]] inline bool has_column(const TableSpec& table, std::string_view column) noexcept {
        return find_column(table, column) != nullptr;
    }

    static_assert(std::is_trivially_copyable_v<ColumnSpec>);
    static_assert(std::is_trivially_copyable_v<TableSpec>);
    static_assert(std::is_standard_layout_v<TableSpec>);

} // namespace matreg::db
