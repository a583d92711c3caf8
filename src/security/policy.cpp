#include "matreg/security/policy.hpp"

namespace matreg::security {

    const char* permission_name(Permission p) noexcept {
        switch (p) {
            case Permission::None: return "none";
            case Permission::Read: return "read";
            case Permission::Write: return "write";
            case Permission::Delete: return "delete";
            case Permission::Approve: return "approve";
            case Permission::Admin: return "admin";
        }
        return "unknown";
    }

    std::string permission_list(u32 mask) {
        static constexpr Permission kAll[] = {
            Permission::Read, Permission::Write, Permission::Delete, Permission::Approve, Permission::Admin,
        };
        std::string out;
        for (const Permission p : kAll) {
            if ((mask & permission_mask(p)) == 0) {
                continue;
            }
            if (!out.empty()) {
                out += ',';
            }
            out += permission_name(p);
        }
        return out.empty() ? std::string("-") : out;
    }

} // namespace matreg::security
