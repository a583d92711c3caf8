#include "matreg/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"

namespace matreg::core {

namespace {
    [[nodiscard]] std::string get_str(const EnvLookup& lookup, const char* name, const std::string& def) {
        const char* v = lookup(name);
        if (v == nullptr || v[0] == '\0') {
            return def;
        }
        return std::string(v);
    }

    template <typename T>
    [[nodiscard]] bool get_num(const EnvLookup& lookup, const char* name, T def, T* out) noexcept {
        const char* v = lookup(name);
        if (v == nullptr || v[0] == '\0') {
            *out = def;
            return true;
        }
        const char* end = v + std::strlen(v);
        T parsed{};
        auto r = std::from_chars(v, end, parsed, 10);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = parsed;
        return true;
    }

    [[nodiscard]] std::string default_data_dir(const EnvLookup& lookup) {
        const char* home = lookup("HOME");
        if (home != nullptr && home[0] != '\0') {
            return (std::filesystem::path(home) / "matreg").string();
        }
        return "/tmp/matreg";
    }

    [[nodiscard]] bool journal_mode_valid(const std::string& mode) noexcept {
        static constexpr const char* kModes[] = {"WAL", "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "OFF"};
        for (const char* m : kModes) {
            if (mode == m) {
                return true;
            }
        }
        return false;
    }
} // namespace

Status config_load(const EnvLookup& lookup, AppConfig* out) noexcept {
    if (out == nullptr || !lookup) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }
    auto log = logger("config");

    try {
        AppConfig cfg{};
        namespace fs = std::filesystem;

        cfg.data_dir = get_str(lookup, "MATREG_DATA_DIR", default_data_dir(lookup));
        const fs::path data(cfg.data_dir);
        cfg.db_path = get_str(lookup, "MATREG_DB_PATH", (data / "database" / "matreg.db").string());
        cfg.backup_dir = get_str(lookup, "MATREG_BACKUP_DIR", (data / "backups").string());
        cfg.log_dir = get_str(lookup, "MATREG_LOG_DIR", (data / "logs").string());

        const char* file_var = lookup("MATREG_LOG_FILE");
        if (file_var == nullptr) {
            cfg.log_file = (fs::path(cfg.log_dir) / "matreg.log").string();
        } else if (file_var[0] == '\0') {
            cfg.log_file.clear();
        } else {
            const fs::path p(file_var);
            cfg.log_file = p.is_absolute() ? p.string() : (fs::path(cfg.log_dir) / p).string();
        }

        cfg.log_level = get_str(lookup, "MATREG_LOG_LEVEL", "info");
        if (!log_level_valid(cfg.log_level)) {
            log->error("MATREG_LOG_LEVEL: unknown level '{}'", cfg.log_level);
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }

        cfg.journal_mode = get_str(lookup, "MATREG_DB_JOURNAL_MODE", "WAL");
        if (!journal_mode_valid(cfg.journal_mode)) {
            log->error("MATREG_DB_JOURNAL_MODE: unknown mode '{}'", cfg.journal_mode);
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }

        struct U32Var {
            const char* name;
            u32 def;
            u32* dst;
        };
        const U32Var u32_vars[] = {
            {"MATREG_LOG_MAX_SIZE_MB", 10, &cfg.log_max_size_mb},
            {"MATREG_LOG_BACKUP_COUNT", 5, &cfg.log_backup_count},
            {"MATREG_DB_BUSY_TIMEOUT_MS", 5000, &cfg.busy_timeout_ms},
            {"MATREG_AUTO_BACKUP_MINUTES", 0, &cfg.auto_backup_minutes},
            {"MATREG_BACKUP_KEEP", 10, &cfg.backup_keep},
        };
        for (const U32Var& v : u32_vars) {
            if (!get_num<u32>(lookup, v.name, v.def, v.dst)) {
                log->error("{}: expected a non-negative integer, got '{}'", v.name, lookup(v.name));
                return make_status(StatusDomain::Config, StatusCode::Invalid);
            }
        }
        if (!get_num<i64>(lookup, "MATREG_DB_CACHE_PAGES", 10000, &cfg.cache_pages)) {
            log->error("MATREG_DB_CACHE_PAGES: expected an integer, got '{}'", lookup("MATREG_DB_CACHE_PAGES"));
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }

        *out = std::move(cfg);
        return ok_status();
    } catch (const std::exception& e) {
        log->error("configuration load failed: {}", e.what());
        return make_status(StatusDomain::Config, StatusCode::Unknown);
    }
}

Status config_load_from_env(AppConfig* out) noexcept {
    return config_load([](const char* name) { return std::getenv(name); }, out);
}

Status config_ensure_dirs(const AppConfig& cfg) noexcept {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path db_parent = fs::path(cfg.db_path).parent_path();
    for (const fs::path& dir : {fs::path(cfg.data_dir), db_parent, fs::path(cfg.backup_dir), fs::path(cfg.log_dir)}) {
        if (dir.empty()) {
            continue;
        }
        fs::create_directories(dir, ec);
        if (ec) {
            logger("config")->error("cannot create directory {}: {}", dir.string(), ec.message());
            return make_status(StatusDomain::Config, StatusCode::Io, static_cast<u32>(ec.value()));
        }
    }
    return ok_status();
}

} // namespace matreg::core
