#include "matreg/core/errors.hpp"

namespace matreg::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Crypto: return "Crypto";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Config: return "Config";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Migration: return "Migration";
        case StatusDomain::Store: return "Store";
        case StatusDomain::Audit: return "Audit";
        case StatusDomain::Security: return "Security";
        case StatusDomain::Session: return "Session";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
    }
    return "Unknown";
}

std::string describe(Status s) {
    std::string out = status_domain_name(s.domain);
    out += '/';
    out += status_code_name(s.code);
    if (s.aux != 0) {
        out += " (aux=";
        out += std::to_string(s.aux);
        out += ')';
    }
    return out;
}

} // namespace matreg::core
