#pragma once

#include <chrono>
#include <string>

#include "matreg/core/errors.hpp"
#include "matreg/core/models.hpp"
#include "matreg/core/types.hpp"
#include "matreg/security/policy.hpp"

namespace matreg::session {
    using u32 = matreg::core::u32;

    // The logged-in principal of one application instance. Permission flags
    // are a snapshot taken at login; later role edits apply from the next login.
    // Not thread-safe; owned by the coordinating thread.
    class Session {
    public:
        using Clock = std::chrono::system_clock;

        void login(const matreg::core::PrincipalInfo& principal);
        void logout() noexcept;

        [[nodiscard]] bool is_authenticated() const noexcept { return principal_.is_valid(); }
        [[nodiscard]] bool has_permission(security::Permission p) const noexcept {
            return is_authenticated() && security::has_permission(permissions_, p);
        }

        [[nodiscard]] matreg::core::PrincipalId principal() const noexcept { return principal_; }
        [[nodiscard]] const std::string& username() const noexcept { return username_; }
        [[nodiscard]] matreg::core::RoleId role() const noexcept { return role_; }
        [[nodiscard]] const std::string& role_name() const noexcept { return role_name_; }
        [[nodiscard]] u32 permissions() const noexcept { return permissions_; }
        [[nodiscard]] Clock::time_point login_time() const noexcept { return login_time_; }

    private:
        matreg::core::PrincipalId principal_{matreg::core::PrincipalId::invalid()};
        std::string username_;
        matreg::core::RoleId role_{matreg::core::RoleId::invalid()};
        std::string role_name_;
        u32 permissions_{0};
        Clock::time_point login_time_{};
    };

    // Ok when the session holds p, {PermissionDenied, Session} otherwise.
    [[nodiscard]] matreg::core::Status require_permission(const Session& session, security::Permission p) noexcept;

} // namespace matreg::session
