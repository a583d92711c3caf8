#include "matreg/session/session.hpp"

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"

namespace matreg::session {

using namespace matreg::core;

void Session::login(const PrincipalInfo& principal) {
    principal_ = principal.id;
    username_ = principal.username;
    role_ = principal.role;
    role_name_ = principal.role_name;
    permissions_ = principal.permissions;
    login_time_ = Clock::now();
}

void Session::logout() noexcept {
    principal_ = PrincipalId::invalid();
    username_.clear();
    role_ = RoleId::invalid();
    role_name_.clear();
    permissions_ = 0;
    login_time_ = Clock::time_point{};
}

Status require_permission(const Session& session, security::Permission p) noexcept {
    if (session.has_permission(p)) {
        return ok_status();
    }
    logger("auth")->warn("permission '{}' denied to {}", security::permission_name(p),
                         session.is_authenticated() ? session.username() : std::string("anonymous"));
    return make_status(StatusDomain::Session, StatusCode::PermissionDenied);
}

} // namespace matreg::session
