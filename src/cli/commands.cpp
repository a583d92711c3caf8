#include "matreg/cli/commands.hpp"

#include <cstring>

namespace matreg::cli {
    namespace {
        constexpr CommandSpec kCommands[] = {
            {CommandId::Help, "help", "show this help"},
            {CommandId::Migrate, "migrate", "apply pending schema migrations"},
            {CommandId::Backup, "backup", "write a backup [--dir DIR]"},
            {CommandId::Restore, "restore", "replace the store with a backup --file PATH"},
            {CommandId::Users, "users", "list active users"},
            {CommandId::Roles, "roles", "list roles and their permissions"},
            {CommandId::Audit, "audit", "show audit entries [--table T] [--record ID] [--limit N]"},
            {CommandId::UserAdd, "useradd", "create a user --user U --name N --role ID [--position P]"},
            {CommandId::UserDel, "userdel", "deactivate a user --id ID"},
            {CommandId::UserEn, "useren", "reactivate a user --id ID"},
            {CommandId::PasswdReset, "passwd-reset", "set a temporary password --id ID"},
            {CommandId::Login, "login", "check credentials and show permissions"},
            {CommandId::AutoBackup, "auto-backup", "back up periodically until interrupted [--interval-min N]"},
        };
    } // namespace

    matreg::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return matreg::core::make_status(matreg::core::StatusDomain::Cli, matreg::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return matreg::core::make_status(matreg::core::StatusDomain::Cli, matreg::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return matreg::core::make_status(matreg::core::StatusDomain::Cli, matreg::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return matreg::core::make_status(matreg::core::StatusDomain::Cli, matreg::core::StatusCode::Invalid);
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                match = &specs[i];
                break;
            }
        }
        if (match == nullptr) {
            return matreg::core::make_status(matreg::core::StatusDomain::Cli, matreg::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return matreg::core::ok_status();
    }

    const CommandSpec* builtin_commands(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
        }
        return kCommands;
    }
} // namespace matreg::cli
