#pragma once

#include <memory>
#include <string>

#include <spdlog/fwd.h>

#include "matreg/core/errors.hpp"
#include "matreg/core/types.hpp"

namespace matreg::core {

    struct LogConfig {
        std::string level{"info"};     // trace, debug, info, warn, error, critical, off
        std::string file;              // rotating log of every level; empty disables
        std::string error_file;        // rotating log of error and above; empty disables
        u32 max_size_mb{10};
        u32 backup_count{5};
        bool console{true};            // stderr, info and above
    };

    // Installs the process-wide sinks. Loggers created earlier keep their old sinks.
    [[nodiscard]] Status log_init(const LogConfig& cfg) noexcept;

    // Drops every registered logger and the installed sinks.
    void log_shutdown() noexcept;

    // Named subsystem logger ("db", "store", "auth", ...). Created on first use
    // from the installed sinks, or a stderr sink at warn level if log_init never ran.
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger(const char* name) noexcept;

    [[nodiscard]] bool log_level_valid(const std::string& level) noexcept;

} // namespace matreg::core
