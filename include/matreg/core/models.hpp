#pragma once

#include <string>

#include "matreg/core/types.hpp"

namespace matreg::core {

    // A user account joined with its role. permissions is a security::Permission mask.
    struct PrincipalInfo {
        PrincipalId id{PrincipalId::invalid()};
        std::string username;
        std::string full_name;
        std::string position;
        bool active{false};
        RoleId role{RoleId::invalid()};
        std::string role_name;
        u32 permissions{0};
    };

    struct RoleInfo {
        RoleId id{RoleId::invalid()};
        std::string name;
        std::string description;
        u32 permissions{0};
    };

} // namespace matreg::core
