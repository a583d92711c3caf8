#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace matreg::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr{0}}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v > Repr{0}; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    // SQLite rowids start at 1, so 0 doubles as "no id".
    struct PrincipalIdTag {};
    using PrincipalId = Id<PrincipalIdTag, i64>;

    struct RoleIdTag {};
    using RoleId = Id<RoleIdTag, i64>;

    struct RecordIdTag {};
    using RecordId = Id<RecordIdTag, i64>;

    static_assert(std::is_trivially_copyable_v<PrincipalId>);
    static_assert(std::is_trivially_copyable_v<RoleId>);
    static_assert(std::is_trivially_copyable_v<RecordId>);
    static_assert(sizeof(RecordId) == sizeof(i64));

} // namespace matreg::core
