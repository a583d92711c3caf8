#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/core/models.hpp"
#include "matreg/core/types.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/security/password.hpp"

namespace matreg::session {

    // ========================================================================
    // Authentication
    // ========================================================================

    // Absent (Ok) for an unknown, inactive or mismatching principal; the caller
    // cannot tell which. Only the username is logged.
    [[nodiscard]] matreg::core::Status authenticate(db::Connection& conn,
        const security::PasswordHasher& hasher,
        std::string_view username,
        std::string_view password,
        std::optional<matreg::core::PrincipalInfo>* out) noexcept;

    // ========================================================================
    // Principal accounts
    // ========================================================================

    struct NewPrincipal {
        std::string username;
        std::string password;
        std::string full_name;
        std::string position;
        matreg::core::RoleId role{matreg::core::RoleId::invalid()};
    };

    // {Conflict, Session} when the username exists, active or not.
    [[nodiscard]] matreg::core::Status create_principal(db::Connection& conn,
        const security::PasswordHasher& hasher,
        matreg::core::PrincipalId actor,
        const NewPrincipal& p,
        matreg::core::PrincipalId* out_id) noexcept;

    // *out_changed is false when the principal is missing, old_password does not
    // match, or new_password fails the strength check; out_reason says which.
    [[nodiscard]] matreg::core::Status change_password(db::Connection& conn,
        const security::PasswordHasher& hasher,
        matreg::core::PrincipalId actor,
        matreg::core::PrincipalId id,
        std::string_view old_password,
        std::string_view new_password,
        bool* out_changed,
        std::string* out_reason = nullptr) noexcept;

    // Sets a generated temporary password and returns it; absent when id does not exist.
    [[nodiscard]] matreg::core::Status reset_password(db::Connection& conn,
        const security::PasswordHasher& hasher,
        matreg::core::PrincipalId actor,
        matreg::core::PrincipalId id,
        std::optional<std::string>* out_password) noexcept;

    // Accounts are never deleted; deactivation keeps audit references intact.
    [[nodiscard]] matreg::core::Status set_principal_active(db::Connection& conn,
        matreg::core::PrincipalId actor,
        matreg::core::PrincipalId id,
        bool active,
        bool* out_changed) noexcept;

    [[nodiscard]] inline matreg::core::Status deactivate_principal(db::Connection& conn,
        matreg::core::PrincipalId actor,
        matreg::core::PrincipalId id,
        bool* out_changed) noexcept {
        return set_principal_active(conn, actor, id, false, out_changed);
    }

    [[nodiscard]] inline matreg::core::Status activate_principal(db::Connection& conn,
        matreg::core::PrincipalId actor,
        matreg::core::PrincipalId id,
        bool* out_changed) noexcept {
        return set_principal_active(conn, actor, id, true, out_changed);
    }

    // Active principals with their role, ordered by username.
    [[nodiscard]] matreg::core::Status list_active_principals(db::Connection& conn,
        std::vector<matreg::core::PrincipalInfo>* out) noexcept;

    // ========================================================================
    // Roles
    // ========================================================================

    // Absent when the role does not exist.
    [[nodiscard]] matreg::core::Status role_permissions(db::Connection& conn,
        matreg::core::RoleId id,
        std::optional<matreg::core::u32>* out) noexcept;

    // Ordered by name.
    [[nodiscard]] matreg::core::Status list_roles(db::Connection& conn,
        std::vector<matreg::core::RoleInfo>* out) noexcept;

} // namespace matreg::session
