#pragma once

#include <string>

#include "matreg/core/types.hpp"

namespace matreg::security {
    using u32 = matreg::core::u32;

    enum class Permission : u32 {
        None = 0,
        Read = 1u << 0,
        Write = 1u << 1,
        Delete = 1u << 2,
        Approve = 1u << 3,
        Admin = 1u << 4,
    };

    [[nodiscard]] constexpr u32 permission_mask(Permission p) noexcept {
        return static_cast<u32>(p);
    }

    // Admin grants every permission.
    [[nodiscard]] constexpr bool has_permission(u32 mask, Permission p) noexcept {
        if ((mask & permission_mask(Permission::Admin)) != 0) {
            return true;
        }
        return p != Permission::None && (mask & permission_mask(p)) == permission_mask(p);
    }

    // Mask from the role table's can_* columns.
    [[nodiscard]] constexpr u32 permission_mask_from_flags(bool read, bool write, bool del, bool approve, bool admin) noexcept {
        return (read ? permission_mask(Permission::Read) : 0u) |
               (write ? permission_mask(Permission::Write) : 0u) |
               (del ? permission_mask(Permission::Delete) : 0u) |
               (approve ? permission_mask(Permission::Approve) : 0u) |
               (admin ? permission_mask(Permission::Admin) : 0u);
    }

    [[nodiscard]] const char* permission_name(Permission p) noexcept;

    // "read,write,admin" or "-" for an empty mask.
    [[nodiscard]] std::string permission_list(u32 mask);

    static_assert(has_permission(permission_mask(Permission::Admin), Permission::Delete));
    static_assert(!has_permission(permission_mask(Permission::Read), Permission::Write));

} // namespace matreg::security
