#pragma once

#include <type_traits>

#include "matreg/core/errors.hpp"
#include "matreg/core/types.hpp"

namespace matreg::cli {
    using u8 = matreg::core::u8;
    using u32 = matreg::core::u32;
    using i64 = matreg::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Help = 1,
        Db = 2,
        Dir = 3,
        File = 4,
        Login = 5,
        User = 6,
        Name = 7,
        Position = 8,
        Role = 9,
        Id = 10,
        Table = 11,
        Record = 12,
        Limit = 13,
        Interval = 14,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options fails with Invalid once cap is reached.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options of args; stops at the first non-option token or
    // after "--". *consumed is the number of tokens taken.
    [[nodiscard]] matreg::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins; nullptr when id was not given.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    [[nodiscard]] inline bool option_flag(const ParsedOptions& opts, OptionId id) noexcept {
        return find_option(opts, id) != nullptr;
    }

    [[nodiscard]] inline const char* option_str(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* o = find_option(opts, id);
        return (o != nullptr && o->type == OptionType::String) ? o->value.str : nullptr;
    }

    [[nodiscard]] inline bool option_i64(const ParsedOptions& opts, OptionId id, i64* out) noexcept {
        const ParsedOption* o = find_option(opts, id);
        if (o == nullptr || o->type != OptionType::I64 || out == nullptr) {
            return false;
        }
        *out = o->value.i64v;
        return true;
    }

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace matreg::cli
