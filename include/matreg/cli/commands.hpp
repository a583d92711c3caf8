#pragma once

#include <type_traits>

#include "matreg/cli/options.hpp"
#include "matreg/core/errors.hpp"

namespace matreg::cli {
    using u32 = matreg::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Migrate = 2,
        Backup = 3,
        Restore = 4,
        Users = 5,
        Roles = 6,
        Audit = 7,
        UserAdd = 8,
        UserDel = 9,
        UserEn = 10,
        PasswdReset = 11,
        Login = 12,
        AutoBackup = 13,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* summary{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches args.argv[0] against specs; the invocation's args are the rest.
    [[nodiscard]] matreg::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // The matreg command table.
    [[nodiscard]] const CommandSpec* builtin_commands(u32* count) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace matreg::cli
