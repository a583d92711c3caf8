#pragma once

#include <functional>
#include <string>

#include "matreg/core/errors.hpp"
#include "matreg/core/types.hpp"

namespace matreg::core {

    struct AppConfig {
        std::string data_dir;
        std::string db_path;
        std::string backup_dir;
        std::string log_dir;
        std::string log_file;          // absolute, or empty when file logging is off
        std::string log_level{"info"};
        u32 log_max_size_mb{10};
        u32 log_backup_count{5};

        std::string journal_mode{"WAL"};
        i64 cache_pages{10000};
        u32 busy_timeout_ms{5000};

        u32 auto_backup_minutes{0};    // 0 disables the backup timer
        u32 backup_keep{10};
    };

    // Returns the value of an environment-style variable, or nullptr when unset.
    using EnvLookup = std::function<const char*(const char*)>;

    // Reads MATREG_* variables through lookup. Unset or empty variables take defaults.
    [[nodiscard]] Status config_load(const EnvLookup& lookup, AppConfig* out) noexcept;

    [[nodiscard]] Status config_load_from_env(AppConfig* out) noexcept;

    // Creates data, database, backup and log directories.
    [[nodiscard]] Status config_ensure_dirs(const AppConfig& cfg) noexcept;

} // namespace matreg::core
