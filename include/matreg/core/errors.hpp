#pragma once
#include <cstdint>
#include <string>
#include <type_traits>

namespace matreg::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Crypto,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Config,
        Db,
        Migration,
        Store,
        Audit,
        Security,
        Session,
        Cli,
        External,
    };

    // aux carries the SQLite extended result code for Db failures and errno for Io.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Same failure, re-attributed to the layer that reports it.
    [[nodiscard]] constexpr Status rescope(Status s, StatusDomain domain) noexcept {
        if (is_ok(s)) {
            return s;
        }
        return Status{s.code, domain, s.aux};
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    // "Db/Conflict (aux=2067)"
    [[nodiscard]] std::string describe(Status s);

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace matreg::core
