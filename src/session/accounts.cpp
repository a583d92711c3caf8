#include "matreg/session/accounts.hpp"

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/security/policy.hpp"
#include "matreg/store/record_store.hpp"

namespace matreg::session {

using namespace matreg::core;

namespace {
    constexpr const char* kPrincipalSelect =
        "SELECT u.id, u.username, u.password_hash, u.full_name, u.position, u.is_active, u.role_id, "
        "r.name AS role_name, r.can_read, r.can_write, r.can_delete, r.can_approve, r.can_admin "
        "FROM users u JOIN roles r ON u.role_id = r.id";

    [[nodiscard]] u32 permissions_from_row(const Record& r) {
        return security::permission_mask_from_flags(field_bool(r, "can_read"),
                                                    field_bool(r, "can_write"),
                                                    field_bool(r, "can_delete"),
                                                    field_bool(r, "can_approve"),
                                                    field_bool(r, "can_admin"));
    }

    [[nodiscard]] PrincipalInfo principal_from_row(const Record& r) {
        PrincipalInfo p;
        p.id = PrincipalId{field_i64(r, "id").value_or(0)};
        p.username = field_text(r, "username").value_or("");
        p.full_name = field_text(r, "full_name").value_or("");
        p.position = field_text(r, "position").value_or("");
        p.active = field_bool(r, "is_active");
        p.role = RoleId{field_i64(r, "role_id").value_or(0)};
        p.role_name = field_text(r, "role_name").value_or("");
        p.permissions = permissions_from_row(r);
        return p;
    }

    [[nodiscard]] store::RecordStore users_store(db::Connection& conn, PrincipalId actor) noexcept {
        return store::RecordStore(conn, db::table_spec(db::TableId::Users), actor);
    }

    // Stores a fresh hash of password for id. *out_found is false when id is gone.
    [[nodiscard]] Status store_password(db::Connection& conn,
                                        const security::PasswordHasher& hasher,
                                        PrincipalId actor,
                                        PrincipalId id,
                                        std::string_view password,
                                        bool* out_found) {
        std::string hash;
        const Status s = hasher.hash(password, &hash);
        if (!is_ok(s)) {
            logger("auth")->error("password hashing failed: {}", describe(s));
            return s;
        }
        store::RecordStore users = users_store(conn, actor);
        return users.update(RecordId{id.v}, Record{{"password_hash", Value{std::move(hash)}}}, out_found);
    }
} // namespace

// ============================================================================
// Authentication
// ============================================================================

Status authenticate(db::Connection& conn,
                    const security::PasswordHasher& hasher,
                    std::string_view username,
                    std::string_view password,
                    std::optional<PrincipalInfo>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    out->reset();
    auto log = logger("auth");
    try {
        std::optional<Record> row;
        const Status s = db::db_fetch_one(conn,
            std::string(kPrincipalSelect) + " WHERE u.username = ? AND u.is_active = 1",
            {Value{std::string(username)}}, &row);
        if (!is_ok(s)) {
            return s;
        }
        if (!row) {
            log->warn("login attempt for unknown or inactive user: {}", username);
            return ok_status();
        }
        const std::string stored = field_text(*row, "password_hash").value_or("");
        if (!hasher.verify(password, stored)) {
            log->warn("wrong password for user: {}", username);
            return ok_status();
        }
        *out = principal_from_row(*row);
        log->info("user authenticated: {}", username);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("authentication of {} failed: {}", username, e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

// ============================================================================
// Principal accounts
// ============================================================================

Status create_principal(db::Connection& conn,
                        const security::PasswordHasher& hasher,
                        PrincipalId actor,
                        const NewPrincipal& p,
                        PrincipalId* out_id) noexcept {
    if (out_id == nullptr || p.username.empty() || p.full_name.empty() || !p.role.is_valid()) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    auto log = logger("auth");
    try {
        store::RecordStore users = users_store(conn, actor);
        bool taken = false;
        Status s = users.exists({{"username", Value{p.username}}}, &taken);
        if (!is_ok(s)) {
            return s;
        }
        if (taken) {
            log->error("user {} already exists", p.username);
            return make_status(StatusDomain::Session, StatusCode::Conflict);
        }

        std::string hash;
        s = hasher.hash(p.password, &hash);
        if (!is_ok(s)) {
            log->error("password hashing failed: {}", describe(s));
            return s;
        }

        Record fields{
            {"username", Value{p.username}},
            {"password_hash", Value{std::move(hash)}},
            {"full_name", Value{p.full_name}},
            {"position", p.position.empty() ? null_value() : Value{p.position}},
            {"role_id", Value{p.role.v}},
            {"is_active", bool_value(true)},
        };
        RecordId id = RecordId::invalid();
        s = users.create(fields, &id);
        if (!is_ok(s)) {
            return s;
        }
        *out_id = PrincipalId{id.v};
        log->info("user created: {} (id {})", p.username, id.v);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("creating user {} failed: {}", p.username, e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

Status change_password(db::Connection& conn,
                       const security::PasswordHasher& hasher,
                       PrincipalId actor,
                       PrincipalId id,
                       std::string_view old_password,
                       std::string_view new_password,
                       bool* out_changed,
                       std::string* out_reason) noexcept {
    if (out_changed == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    *out_changed = false;
    auto log = logger("auth");
    try {
        auto finish = [&](const char* reason) {
            if (out_reason != nullptr) {
                *out_reason = reason;
            }
            return ok_status();
        };

        store::RecordStore users = users_store(conn, actor);
        std::optional<Record> row;
        Status s = users.read(RecordId{id.v}, &row);
        if (!is_ok(s)) {
            return s;
        }
        if (!row) {
            return finish("user not found");
        }
        if (!hasher.verify(old_password, field_text(*row, "password_hash").value_or(""))) {
            log->warn("wrong old password on password change for user id {}", id.v);
            return finish("old password does not match");
        }
        const security::StrengthCheck strength = hasher.strength_check(new_password);
        if (!strength.ok) {
            log->warn("weak new password for user id {}: {}", id.v, strength.reason);
            return finish(strength.reason);
        }

        bool found = false;
        s = store_password(conn, hasher, actor, id, new_password, &found);
        if (!is_ok(s)) {
            return s;
        }
        if (!found) {
            return finish("user not found");
        }
        *out_changed = true;
        log->info("password changed for user id {}", id.v);
        return finish("OK");
    } catch (const std::exception& e) {
        log->error("password change for user id {} failed: {}", id.v, e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

Status reset_password(db::Connection& conn,
                      const security::PasswordHasher& hasher,
                      PrincipalId actor,
                      PrincipalId id,
                      std::optional<std::string>* out_password) noexcept {
    if (out_password == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    out_password->reset();
    try {
        std::string temp;
        Status s = hasher.generate_temporary(&temp);
        if (!is_ok(s)) {
            return s;
        }
        bool found = false;
        s = store_password(conn, hasher, actor, id, temp, &found);
        if (!is_ok(s) || !found) {
            return s;
        }
        *out_password = std::move(temp);
        logger("auth")->info("password reset for user id {}", id.v);
        return ok_status();
    } catch (const std::exception& e) {
        logger("auth")->error("password reset for user id {} failed: {}", id.v, e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

Status set_principal_active(db::Connection& conn, PrincipalId actor, PrincipalId id, bool active, bool* out_changed) noexcept {
    if (out_changed == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    try {
        store::RecordStore users = users_store(conn, actor);
        const Status s = users.update(RecordId{id.v}, Record{{"is_active", bool_value(active)}}, out_changed);
        if (is_ok(s) && *out_changed) {
            logger("auth")->info("user id {} {}", id.v, active ? "activated" : "deactivated");
        }
        return s;
    } catch (const std::exception& e) {
        logger("auth")->error("changing active flag of user id {} failed: {}", id.v, e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

Status list_active_principals(db::Connection& conn, std::vector<PrincipalInfo>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    try {
        out->clear();
        std::vector<Record> rows;
        const Status s = db::db_fetch_all(conn,
            std::string(kPrincipalSelect) + " WHERE u.is_active = 1 ORDER BY u.username", {}, &rows);
        if (!is_ok(s)) {
            return s;
        }
        out->reserve(rows.size());
        for (const Record& r : rows) {
            out->push_back(principal_from_row(r));
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("auth")->error("listing users failed: {}", e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

// ============================================================================
// Roles
// ============================================================================

Status role_permissions(db::Connection& conn, RoleId id, std::optional<u32>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    out->reset();
    try {
        store::RecordStore roles(conn, db::table_spec(db::TableId::Roles));
        std::optional<Record> row;
        const Status s = roles.read(RecordId{id.v}, &row);
        if (!is_ok(s) || !row) {
            return s;
        }
        *out = permissions_from_row(*row);
        return ok_status();
    } catch (const std::exception& e) {
        logger("auth")->error("reading role {} failed: {}", id.v, e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

Status list_roles(db::Connection& conn, std::vector<RoleInfo>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    try {
        out->clear();
        store::RecordStore roles(conn, db::table_spec(db::TableId::Roles));
        store::FindQuery q;
        q.order.push_back({"name", false});
        std::vector<Record> rows;
        const Status s = roles.find(q, &rows);
        if (!is_ok(s)) {
            return s;
        }
        out->reserve(rows.size());
        for (const Record& r : rows) {
            RoleInfo info;
            info.id = RoleId{field_i64(r, "id").value_or(0)};
            info.name = field_text(r, "name").value_or("");
            info.description = field_text(r, "description").value_or("");
            info.permissions = permissions_from_row(r);
            out->push_back(std::move(info));
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("auth")->error("listing roles failed: {}", e.what());
        return make_status(StatusDomain::Session, StatusCode::Unknown);
    }
}

} // namespace matreg::session
