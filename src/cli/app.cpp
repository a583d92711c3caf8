#include "matreg/cli/app.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/db/backup.hpp"
#include "matreg/db/migrations.hpp"
#include "matreg/security/policy.hpp"
#include "matreg/session/accounts.hpp"
#include "matreg/session/session.hpp"
#include "matreg/store/audit.hpp"

namespace matreg::cli {
    namespace {
        constexpr OptionSpec kCommandOptions[] = {
            {OptionId::Help, OptionType::Flag, "help", 'h'},
            {OptionId::Dir, OptionType::String, "dir", 'd'},
            {OptionId::File, OptionType::String, "file", 'f'},
            {OptionId::Login, OptionType::String, "login", 'l'},
            {OptionId::User, OptionType::String, "user", 'u'},
            {OptionId::Name, OptionType::String, "name", 'n'},
            {OptionId::Position, OptionType::String, "position", 'p'},
            {OptionId::Role, OptionType::I64, "role", 'r'},
            {OptionId::Id, OptionType::I64, "id", 'i'},
            {OptionId::Table, OptionType::String, "table", 't'},
            {OptionId::Record, OptionType::I64, "record", '\0'},
            {OptionId::Limit, OptionType::I64, "limit", '\0'},
            {OptionId::Interval, OptionType::I64, "interval-min", '\0'},
        };

        volatile std::sig_atomic_t g_running = 1;

        // ========================================================================
        // Error Handling
        // ========================================================================

        void print_error(const char* msg) {
            fprintf(stderr, "error: %s\n", msg);
        }

        void print_status_error(const char* context, core::Status s) {
            fprintf(stderr, "error: %s failed (%s)\n", context, core::describe(s).c_str());
            if (s.code == core::StatusCode::Io && s.aux != 0) {
                fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
            }
        }

        // ========================================================================
        // Authentication
        // ========================================================================

        bool read_password(const CliContext& ctx, std::string* out) {
            if (ctx.password) {
                *out = *ctx.password;
                return true;
            }
            const char* env = std::getenv("MATREG_PASSWORD");
            if (env != nullptr && env[0] != '\0') {
                *out = env;
                return true;
            }
            std::string line;
            if (!std::getline(std::cin, line)) {
                return false;
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            *out = std::move(line);
            return true;
        }

        // Authenticates --login and requires perm (None: any active principal).
        // Returns an exit code, 0 when admitted.
        int login_with(CliContext& ctx, security::Permission perm, session::Session* out) {
            const char* login = option_str(ctx.opts, OptionId::Login);
            if (login == nullptr) {
                print_error("this command needs --login USER");
                return kExitUsage;
            }
            std::string password;
            if (!read_password(ctx, &password)) {
                print_error("no password given (set MATREG_PASSWORD or pipe it on stdin)");
                return kExitUsage;
            }
            std::optional<core::PrincipalInfo> who;
            const core::Status s = session::authenticate(ctx.conn, ctx.hasher, login, password, &who);
            if (!core::is_ok(s)) {
                print_status_error("authentication", s);
                return EXIT_FAILURE;
            }
            if (!who) {
                print_error("authentication failed");
                return EXIT_FAILURE;
            }
            out->login(*who);
            if (perm != security::Permission::None && !core::is_ok(session::require_permission(*out, perm))) {
                fprintf(stderr, "error: %s lacks the '%s' permission\n", login, security::permission_name(perm));
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        bool require_id(const CliContext& ctx, core::i64* out) {
            if (!option_i64(ctx.opts, OptionId::Id, out) || *out <= 0) {
                print_error("this command needs --id ID");
                return false;
            }
            return true;
        }

        // ========================================================================
        // Command Handlers
        // ========================================================================

        int handle_migrate(CliContext& ctx) {
            core::u32 applied = 0;
            core::Status s = db::migration_run_all(ctx.conn, &applied);
            if (!core::is_ok(s)) {
                print_status_error("migrate", s);
                return EXIT_FAILURE;
            }
            std::vector<db::MigrationRecord> ledger;
            s = db::migration_list_applied(ctx.conn, &ledger);
            if (!core::is_ok(s)) {
                print_status_error("migrate", s);
                return EXIT_FAILURE;
            }
            printf("applied %u new migration(s)\n", applied);
            for (const db::MigrationRecord& m : ledger) {
                printf("  %3u  %-20s %s\n", m.version, m.name.c_str(), m.applied_at.c_str());
            }
            return EXIT_SUCCESS;
        }

        int handle_backup(CliContext& ctx) {
            const char* dir = option_str(ctx.opts, OptionId::Dir);
            std::string path;
            const core::Status s = db::db_backup(ctx.conn, dir != nullptr ? dir : ctx.cfg.backup_dir, &path);
            if (!core::is_ok(s)) {
                print_status_error("backup", s);
                return EXIT_FAILURE;
            }
            printf("%s\n", path.c_str());
            return EXIT_SUCCESS;
        }

        int handle_restore(CliContext& ctx) {
            const char* file = option_str(ctx.opts, OptionId::File);
            if (file == nullptr) {
                print_error("restore needs --file PATH");
                return kExitUsage;
            }
            const core::Status s = db::db_restore(&ctx.conn, file);
            if (!core::is_ok(s)) {
                if (s.code == core::StatusCode::NotFound) {
                    fprintf(stderr, "error: backup file not found: %s\n", file);
                } else {
                    print_status_error("restore", s);
                }
                return EXIT_FAILURE;
            }
            printf("restored %s from %s\n", ctx.conn.config().path.c_str(), file);
            return EXIT_SUCCESS;
        }

        int handle_users(CliContext& ctx) {
            std::vector<core::PrincipalInfo> users;
            const core::Status s = session::list_active_principals(ctx.conn, &users);
            if (!core::is_ok(s)) {
                print_status_error("users", s);
                return EXIT_FAILURE;
            }
            printf("%-5s %-20s %-30s %s\n", "ID", "USERNAME", "NAME", "ROLE");
            for (const core::PrincipalInfo& u : users) {
                printf("%-5lld %-20s %-30s %s\n", static_cast<long long>(u.id.v), u.username.c_str(),
                       u.full_name.c_str(), u.role_name.c_str());
            }
            return EXIT_SUCCESS;
        }

        int handle_roles(CliContext& ctx) {
            std::vector<core::RoleInfo> roles;
            const core::Status s = session::list_roles(ctx.conn, &roles);
            if (!core::is_ok(s)) {
                print_status_error("roles", s);
                return EXIT_FAILURE;
            }
            printf("%-5s %-16s %-32s %s\n", "ID", "NAME", "PERMISSIONS", "DESCRIPTION");
            for (const core::RoleInfo& r : roles) {
                printf("%-5lld %-16s %-32s %s\n", static_cast<long long>(r.id.v), r.name.c_str(),
                       security::permission_list(r.permissions).c_str(), r.description.c_str());
            }
            return EXIT_SUCCESS;
        }

        int handle_audit(CliContext& ctx) {
            store::AuditFilter filter;
            if (const char* table = option_str(ctx.opts, OptionId::Table)) {
                filter.table_name = table;
            }
            core::i64 v = 0;
            if (option_i64(ctx.opts, OptionId::Record, &v)) {
                filter.record_id = v;
            }
            filter.limit = 50;
            if (option_i64(ctx.opts, OptionId::Limit, &v)) {
                if (v <= 0) {
                    print_error("--limit must be positive");
                    return kExitUsage;
                }
                filter.limit = static_cast<core::u32>(v);
            }

            std::vector<store::AuditEntry> entries;
            const core::Status s = store::audit_list(ctx.conn, filter, &entries);
            if (!core::is_ok(s)) {
                print_status_error("audit", s);
                return EXIT_FAILURE;
            }
            for (const store::AuditEntry& e : entries) {
                printf("%s  user=%lld  %-6s %s #%s\n", e.created_at.c_str(), static_cast<long long>(e.actor.v),
                       store::audit_action_name(e.action), e.table_name.c_str(),
                       e.record_id ? std::to_string(*e.record_id).c_str() : "-");
                if (e.old_values) {
                    printf("    old: %s\n", e.old_values->c_str());
                }
                if (e.new_values) {
                    printf("    new: %s\n", e.new_values->c_str());
                }
            }
            return EXIT_SUCCESS;
        }

        int handle_useradd(CliContext& ctx) {
            const char* user = option_str(ctx.opts, OptionId::User);
            const char* name = option_str(ctx.opts, OptionId::Name);
            const char* position = option_str(ctx.opts, OptionId::Position);
            core::i64 role = 0;
            if (user == nullptr || name == nullptr || !option_i64(ctx.opts, OptionId::Role, &role)) {
                print_error("useradd needs --user U --name N --role ID");
                return kExitUsage;
            }
            session::Session admin;
            const int rc = login_with(ctx, security::Permission::Admin, &admin);
            if (rc != EXIT_SUCCESS) {
                return rc;
            }

            session::NewPrincipal p;
            p.username = user;
            p.full_name = name;
            p.position = position != nullptr ? position : "";
            p.role = core::RoleId{role};
            core::Status s = ctx.hasher.generate_temporary(&p.password);
            if (!core::is_ok(s)) {
                print_status_error("useradd", s);
                return EXIT_FAILURE;
            }
            core::PrincipalId id = core::PrincipalId::invalid();
            s = session::create_principal(ctx.conn, ctx.hasher, admin.principal(), p, &id);
            if (!core::is_ok(s)) {
                if (s.code == core::StatusCode::Conflict) {
                    fprintf(stderr, "error: user %s already exists\n", user);
                } else {
                    print_status_error("useradd", s);
                }
                return EXIT_FAILURE;
            }
            printf("created user %s (id %lld)\ntemporary password: %s\n", user, static_cast<long long>(id.v),
                   p.password.c_str());
            return EXIT_SUCCESS;
        }

        int handle_set_active(CliContext& ctx, bool active) {
            core::i64 id = 0;
            if (!require_id(ctx, &id)) {
                return kExitUsage;
            }
            session::Session admin;
            const int rc = login_with(ctx, security::Permission::Admin, &admin);
            if (rc != EXIT_SUCCESS) {
                return rc;
            }
            if (!active && id == admin.principal().v) {
                print_error("refusing to deactivate the logged-in user");
                return EXIT_FAILURE;
            }
            bool changed = false;
            const core::Status s = session::set_principal_active(ctx.conn, admin.principal(), core::PrincipalId{id}, active, &changed);
            if (!core::is_ok(s)) {
                print_status_error(active ? "useren" : "userdel", s);
                return EXIT_FAILURE;
            }
            if (!changed) {
                fprintf(stderr, "error: no user with id %lld\n", static_cast<long long>(id));
                return EXIT_FAILURE;
            }
            printf("user %lld %s\n", static_cast<long long>(id), active ? "activated" : "deactivated");
            return EXIT_SUCCESS;
        }

        int handle_passwd_reset(CliContext& ctx) {
            core::i64 id = 0;
            if (!require_id(ctx, &id)) {
                return kExitUsage;
            }
            session::Session admin;
            const int rc = login_with(ctx, security::Permission::Admin, &admin);
            if (rc != EXIT_SUCCESS) {
                return rc;
            }
            std::optional<std::string> temp;
            const core::Status s = session::reset_password(ctx.conn, ctx.hasher, admin.principal(), core::PrincipalId{id}, &temp);
            if (!core::is_ok(s)) {
                print_status_error("passwd-reset", s);
                return EXIT_FAILURE;
            }
            if (!temp) {
                fprintf(stderr, "error: no user with id %lld\n", static_cast<long long>(id));
                return EXIT_FAILURE;
            }
            printf("temporary password: %s\n", temp->c_str());
            return EXIT_SUCCESS;
        }

        int handle_login(CliContext& ctx) {
            session::Session sess;
            const int rc = login_with(ctx, security::Permission::None, &sess);
            if (rc != EXIT_SUCCESS) {
                return rc;
            }
            printf("user:        %s (id %lld)\n", sess.username().c_str(), static_cast<long long>(sess.principal().v));
            printf("role:        %s (id %lld)\n", sess.role_name().c_str(), static_cast<long long>(sess.role().v));
            printf("permissions: %s\n", security::permission_list(sess.permissions()).c_str());
            sess.logout();
            return EXIT_SUCCESS;
        }

        int handle_auto_backup(CliContext& ctx) {
            core::i64 minutes = static_cast<core::i64>(ctx.cfg.auto_backup_minutes);
            if (option_i64(ctx.opts, OptionId::Interval, &minutes) && minutes <= 0) {
                print_error("--interval-min must be positive");
                return kExitUsage;
            }
            if (minutes <= 0) {
                print_error("no backup interval (use --interval-min or MATREG_AUTO_BACKUP_MINUTES)");
                return kExitUsage;
            }

            db::BackupSchedule schedule;
            schedule.backup_dir = ctx.cfg.backup_dir;
            schedule.interval = std::chrono::minutes(minutes);
            schedule.keep = ctx.cfg.backup_keep;

            db::BackupScheduler scheduler;
            const core::Status s = scheduler.start(ctx.conn.config(), schedule);
            if (!core::is_ok(s)) {
                print_status_error("auto-backup", s);
                return EXIT_FAILURE;
            }
            printf("backing up every %lld min into %s; Ctrl-C to stop\n", static_cast<long long>(minutes),
                   schedule.backup_dir.c_str());
            while (g_running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            scheduler.stop();
            printf("auto-backup stopped: %u written, %u failed\n", scheduler.completed(), scheduler.failed());
            return scheduler.failed() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
        }
    } // namespace

    const OptionSpec* command_options(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kCommandOptions) / sizeof(kCommandOptions[0]));
        }
        return kCommandOptions;
    }

    void print_usage() {
        printf("usage: matreg [--db PATH] <command> [options]\n\n");
        printf("Commands:\n");
        core::u32 count = 0;
        const CommandSpec* cmds = builtin_commands(&count);
        for (core::u32 i = 0; i < count; ++i) {
            printf("  %-14s %s\n", cmds[i].name, cmds[i].summary);
        }
        printf("\nCommands that change accounts take --login USER; the password is read from\n");
        printf("MATREG_PASSWORD or the first line of standard input.\n");
    }

    void request_stop() noexcept {
        g_running = 0;
    }

    int run_command(CommandId id, CliContext& ctx) {
        switch (id) {
            case CommandId::Migrate: return handle_migrate(ctx);
            case CommandId::Backup: return handle_backup(ctx);
            case CommandId::Restore: return handle_restore(ctx);
            case CommandId::Users: return handle_users(ctx);
            case CommandId::Roles: return handle_roles(ctx);
            case CommandId::Audit: return handle_audit(ctx);
            case CommandId::UserAdd: return handle_useradd(ctx);
            case CommandId::UserDel: return handle_set_active(ctx, false);
            case CommandId::UserEn: return handle_set_active(ctx, true);
            case CommandId::PasswdReset: return handle_passwd_reset(ctx);
            case CommandId::Login: return handle_login(ctx);
            case CommandId::AutoBackup: return handle_auto_backup(ctx);
            case CommandId::Help:
            case CommandId::None:
                break;
        }
        print_usage();
        return EXIT_SUCCESS;
    }

} // namespace matreg::cli
