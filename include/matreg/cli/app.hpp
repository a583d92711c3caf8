#pragma once

#include <optional>
#include <string>

#include "matreg/cli/commands.hpp"
#include "matreg/cli/options.hpp"
#include "matreg/core/config.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/security/password.hpp"

namespace matreg::cli {
    inline constexpr int kExitUsage = 2;

    struct CliContext {
        matreg::core::AppConfig cfg;
        matreg::db::Connection conn;
        matreg::security::SodiumPasswordHasher hasher;
        ParsedOptions opts{};
        // Takes precedence over MATREG_PASSWORD and standard input.
        std::optional<std::string> password;
    };

    // Option table for the arguments after the command name.
    [[nodiscard]] const OptionSpec* command_options(u32* count) noexcept;

    // Runs one command against ctx.conn, which must be open and migrated.
    // Returns the process exit code: 0, EXIT_FAILURE, or kExitUsage.
    int run_command(CommandId id, CliContext& ctx);

    void print_usage();

    // Makes a running auto-backup return; safe to call from a signal handler.
    void request_stop() noexcept;

} // namespace matreg::cli
