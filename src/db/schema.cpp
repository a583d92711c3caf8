#include "matreg/db/schema.hpp"

namespace matreg::db {

namespace {
    constexpr u32 kSort = ColumnSortable;

    constexpr ColumnSpec kUsers[] = {
        {"id", ColumnType::Integer, kSort},
        {"username", ColumnType::Text, kSort},
        {"password_hash", ColumnType::Text, ColumnSecret},
        {"full_name", ColumnType::Text, kSort},
        {"position", ColumnType::Text, kSort},
        {"is_active", ColumnType::Boolean, kSort},
        {"role_id", ColumnType::Integer, kSort},
        {"created_at", ColumnType::Timestamp, kSort},
        {"updated_at", ColumnType::Timestamp, kSort},
        {"created_by", ColumnType::Integer, ColumnNone},
        {"updated_by", ColumnType::Integer, ColumnNone},
    };

    constexpr ColumnSpec kRoles[] = {
        {"id", ColumnType::Integer, kSort},
        {"name", ColumnType::Text, kSort},
        {"description", ColumnType::Text, ColumnNone},
        {"can_read", ColumnType::Boolean, ColumnNone},
        {"can_write", ColumnType::Boolean, ColumnNone},
        {"can_delete", ColumnType::Boolean, ColumnNone},
        {"can_approve", ColumnType::Boolean, ColumnNone},
        {"can_admin", ColumnType::Boolean, ColumnNone},
        {"created_at", ColumnType::Timestamp, kSort},
        {"updated_at", ColumnType::Timestamp, kSort},
        {"created_by", ColumnType::Integer, ColumnNone},
        {"updated_by", ColumnType::Integer, ColumnNone},
    };

    constexpr ColumnSpec kAuditLog[] = {
        {"id", ColumnType::Integer, kSort},
        {"user_id", ColumnType::Integer, kSort},
        {"action", ColumnType::Text, kSort},
        {"table_name", ColumnType::Text, kSort},
        {"record_id", ColumnType::Integer, kSort},
        {"old_values", ColumnType::Text, ColumnNone},
        {"new_values", ColumnType::Text, ColumnNone},
        {"created_at", ColumnType::Timestamp, kSort},
    };

    constexpr ColumnSpec kDepartments[] = {
        {"id", ColumnType::Integer, kSort},
        {"code", ColumnType::Text, kSort},
        {"name", ColumnType::Text, kSort},
        {"parent_id", ColumnType::Integer, kSort},
        {"head_id", ColumnType::Integer, ColumnNone},
        {"created_at", ColumnType::Timestamp, kSort},
        {"updated_at", ColumnType::Timestamp, kSort},
        {"created_by", ColumnType::Integer, ColumnNone},
        {"updated_by", ColumnType::Integer, ColumnNone},
    };

    constexpr ColumnSpec kOfficials[] = {
        {"id", ColumnType::Integer, kSort},
        {"military_unit", ColumnType::Text, kSort},
        {"department_id", ColumnType::Integer, kSort},
        {"position", ColumnType::Text, kSort},
        {"rank", ColumnType::Text, kSort},
        {"full_name", ColumnType::Text, kSort},
        {"is_responsible", ColumnType::Boolean, kSort},
        {"created_at", ColumnType::Timestamp, kSort},
        {"updated_at", ColumnType::Timestamp, kSort},
        {"created_by", ColumnType::Integer, ColumnNone},
        {"updated_by", ColumnType::Integer, ColumnNone},
    };

    constexpr ColumnSpec kMaterialGroups[] = {
        {"id", ColumnType::Integer, kSort},
        {"code", ColumnType::Text, kSort},
        {"name", ColumnType::Text, kSort},
        {"department_id", ColumnType::Integer, kSort},
        {"created_at", ColumnType::Timestamp, kSort},
        {"updated_at", ColumnType::Timestamp, kSort},
        {"created_by", ColumnType::Integer, ColumnNone},
        {"updated_by", ColumnType::Integer, ColumnNone},
    };

    constexpr ColumnSpec kNomenclature[] = {
        {"id", ColumnType::Integer, kSort},
        {"code", ColumnType::Text, kSort},
        {"okp_code", ColumnType::Text, kSort},
        {"name", ColumnType::Text, kSort},
        {"unit", ColumnType::Text, ColumnNone},
        {"price", ColumnType::Real, kSort},
        {"weight_unit", ColumnType::Real, ColumnNone},
        {"weight_total", ColumnType::Real, ColumnNone},
        {"class_code", ColumnType::Text, kSort | ColumnGenerated},
        {"group_code", ColumnType::Text, kSort | ColumnGenerated},
        {"subgroup_code", ColumnType::Text, kSort | ColumnGenerated},
        {"item_number", ColumnType::Text, kSort | ColumnGenerated},
        {"department_id", ColumnType::Integer, kSort},
        {"is_active", ColumnType::Boolean, kSort},
        {"is_temporary", ColumnType::Boolean, kSort},
        {"base_document", ColumnType::Text, ColumnNone},
        {"document_date", ColumnType::Text, kSort},
        {"created_at", ColumnType::Timestamp, kSort},
        {"updated_at", ColumnType::Timestamp, kSort},
        {"created_by", ColumnType::Integer, ColumnNone},
        {"updated_by", ColumnType::Integer, ColumnNone},
    };

    constexpr ColumnSpec kCategories[] = {
        {"id", ColumnType::Integer, kSort},
        {"code", ColumnType::Integer, kSort},
        {"name", ColumnType::Text, kSort},
        {"description", ColumnType::Text, ColumnNone},
        {"created_at", ColumnType::Timestamp, kSort},
        {"updated_at", ColumnType::Timestamp, kSort},
        {"created_by", ColumnType::Integer, ColumnNone},
        {"updated_by", ColumnType::Integer, ColumnNone},
    };

    template <size_t N>
    constexpr u32 count_of(const ColumnSpec (&)[N]) noexcept {
        return static_cast<u32>(N);
    }

    constexpr TableSpec kTables[] = {
        {TableId::Users, "users", "id", kUsers, count_of(kUsers), false},
        {TableId::Roles, "roles", "id", kRoles, count_of(kRoles), false},
        {TableId::AuditLog, "audit_log", "id", kAuditLog, count_of(kAuditLog), true},
        {TableId::Departments, "departments", "id", kDepartments, count_of(kDepartments), false},
        {TableId::Officials, "officials", "id", kOfficials, count_of(kOfficials), false},
        {TableId::MaterialGroups, "material_groups", "id", kMaterialGroups, count_of(kMaterialGroups), false},
        {TableId::Nomenclature, "nomenclature", "id", kNomenclature, count_of(kNomenclature), false},
        {TableId::Categories, "categories", "id", kCategories, count_of(kCategories), false},
    };
} // namespace

const TableSpec& table_spec(TableId id) noexcept {
    for (const TableSpec& t : kTables) {
        if (t.id == id) {
            return t;
        }
    }
    return kTables[0];
}

const TableSpec* table_spec_by_name(std::string_view name) noexcept {
    for (const TableSpec& t : kTables) {
        if (name == t.name) {
            return &t;
        }
    }
    return nullptr;
}

const ColumnSpec* find_column(const TableSpec& table, std::string_view column) noexcept {
    for (u32 i = 0; i < table.column_count; ++i) {
        if (column == table.columns[i].name) {
            return &table.columns[i];
        }
    }
    return nullptr;
}

} // namespace matreg::db
