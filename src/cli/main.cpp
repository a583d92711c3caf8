#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>

#include "matreg/cli/app.hpp"
#include "matreg/cli/commands.hpp"
#include "matreg/cli/options.hpp"
#include "matreg/core/config.hpp"
#include "matreg/core/errors.hpp"
#include "matreg/core/log.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/db/migrations.hpp"

namespace core = matreg::core;
namespace cli = matreg::cli;
namespace db = matreg::db;

// ========================================================================
// Global State
// ========================================================================

void sigint_handler(int sig) {
    (void)sig;
    cli::request_stop();
}

// ========================================================================
// Options
// ========================================================================

const cli::OptionSpec kGlobalOptions[] = {
    {cli::OptionId::Help, cli::OptionType::Flag, "help", 'h'},
    {cli::OptionId::Db, cli::OptionType::String, "db", '\0'},
};

constexpr core::u32 kOptionCapacity = 32;

void print_status_error(const char* context, core::Status s) {
    fprintf(stderr, "error: %s failed (%s)\n", context, core::describe(s).c_str());
    if (s.code == core::StatusCode::Io && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);
    signal(SIGTERM, sigint_handler);

    cli::CliArgs args{argv + 1, argc > 0 ? static_cast<core::u32>(argc - 1) : 0};

    cli::ParsedOption global_buf[kOptionCapacity];
    cli::ParsedOptions global{global_buf, 0, kOptionCapacity};
    core::u32 consumed = 0;
    core::Status s = cli::parse_options(args, kGlobalOptions, sizeof(kGlobalOptions) / sizeof(kGlobalOptions[0]),
                                        &global, &consumed);
    if (!core::is_ok(s)) {
        fprintf(stderr, "error: invalid global option\n");
        cli::print_usage();
        return cli::kExitUsage;
    }
    args.argv += consumed;
    args.argc -= consumed;
    if (cli::option_flag(global, cli::OptionId::Help)) {
        cli::print_usage();
        return EXIT_SUCCESS;
    }
    if (args.argc == 0) {
        cli::print_usage();
        return cli::kExitUsage;
    }

    core::u32 command_count = 0;
    const cli::CommandSpec* commands = cli::builtin_commands(&command_count);
    cli::CommandInvocation inv{};
    s = cli::parse_command(args, commands, command_count, &inv, &consumed);
    if (!core::is_ok(s)) {
        fprintf(stderr, "error: unknown command: %s\n", args.argv[0]);
        cli::print_usage();
        return cli::kExitUsage;
    }

    cli::CliContext ctx;
    cli::ParsedOption cmd_buf[kOptionCapacity];
    ctx.opts = cli::ParsedOptions{cmd_buf, 0, kOptionCapacity};
    core::u32 option_count = 0;
    const cli::OptionSpec* command_options = cli::command_options(&option_count);
    s = cli::parse_options(inv.args, command_options, option_count, &ctx.opts, &consumed);
    if (!core::is_ok(s) || consumed != inv.args.argc) {
        fprintf(stderr, "error: invalid options for %s\n", args.argv[0]);
        return cli::kExitUsage;
    }
    if (inv.id == cli::CommandId::Help || cli::option_flag(ctx.opts, cli::OptionId::Help)) {
        cli::print_usage();
        return EXIT_SUCCESS;
    }

    s = core::config_load_from_env(&ctx.cfg);
    if (!core::is_ok(s)) {
        print_status_error("configuration", s);
        return EXIT_FAILURE;
    }
    if (const char* db_path = cli::option_str(global, cli::OptionId::Db)) {
        ctx.cfg.db_path = db_path;
    }
    s = core::config_ensure_dirs(ctx.cfg);
    if (!core::is_ok(s)) {
        print_status_error("creating data directories", s);
        return EXIT_FAILURE;
    }

    core::LogConfig log_cfg;
    log_cfg.level = ctx.cfg.log_level;
    log_cfg.file = ctx.cfg.log_file;
    if (!ctx.cfg.log_file.empty()) {
        log_cfg.error_file = ctx.cfg.log_dir + "/errors.log";
    }
    log_cfg.max_size_mb = ctx.cfg.log_max_size_mb;
    log_cfg.backup_count = ctx.cfg.log_backup_count;
    s = core::log_init(log_cfg);
    if (!core::is_ok(s)) {
        print_status_error("logging setup", s);
        return EXIT_FAILURE;
    }

    db::DbConfig db_cfg;
    db_cfg.path = ctx.cfg.db_path;
    db_cfg.journal_mode = ctx.cfg.journal_mode;
    db_cfg.cache_pages = ctx.cfg.cache_pages;
    db_cfg.busy_timeout_ms = ctx.cfg.busy_timeout_ms;
    s = db::db_open(db_cfg, &ctx.conn);
    if (!core::is_ok(s)) {
        core::logger("cli")->critical("cannot open store {}: {}", db_cfg.path, core::describe(s));
        print_status_error("opening the store", s);
        core::log_shutdown();
        return EXIT_FAILURE;
    }
    // Pending migrations of an existing store are applied on every start;
    // migrate applies them itself so it can report the count.
    core::u32 applied = 0;
    s = inv.id == cli::CommandId::Migrate ? core::ok_status() : db::migration_run_all(ctx.conn, &applied);
    if (!core::is_ok(s)) {
        core::logger("cli")->critical("schema migration failed: {}", core::describe(s));
        print_status_error("schema migration", s);
        core::log_shutdown();
        return EXIT_FAILURE;
    }

    const int rc = cli::run_command(inv.id, ctx);
    (void)db::db_close(&ctx.conn);
    core::log_shutdown();
    return rc;
}
