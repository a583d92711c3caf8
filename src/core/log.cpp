#include "matreg/core/log.hpp"

#include <mutex>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace matreg::core {

namespace {
    constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S - %n - %l - %v";

    struct LogState {
        std::mutex mutex;
        std::vector<spdlog::sink_ptr> sinks;
        spdlog::level::level_enum level{spdlog::level::warn};
    };

    LogState& state() {
        static LogState s;
        return s;
    }

    [[nodiscard]] bool parse_level(const std::string& text, spdlog::level::level_enum* out) noexcept {
        static constexpr const char* kNames[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
        for (int i = 0; i < static_cast<int>(sizeof(kNames) / sizeof(kNames[0])); ++i) {
            if (text == kNames[i]) {
                *out = static_cast<spdlog::level::level_enum>(i);
                return true;
            }
        }
        if (text == "warning") {
            *out = spdlog::level::warn;
            return true;
        }
        return false;
    }

    std::shared_ptr<spdlog::logger> make_logger(const char* name, const LogState& s) {
        std::vector<spdlog::sink_ptr> sinks = s.sinks;
        if (sinks.empty()) {
            auto fallback = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            fallback->set_pattern(kPattern);
            sinks.push_back(std::move(fallback));
        }
        auto lg = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        lg->set_level(s.level);
        lg->flush_on(spdlog::level::warn);
        return lg;
    }
} // namespace

bool log_level_valid(const std::string& level) noexcept {
    spdlog::level::level_enum lvl{};
    return parse_level(level, &lvl);
}

Status log_init(const LogConfig& cfg) noexcept {
    spdlog::level::level_enum lvl{};
    if (!parse_level(cfg.level, &lvl)) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }

    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (cfg.console) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_level(spdlog::level::info);
            sinks.push_back(std::move(console));
        }
        const size_t max_bytes = static_cast<size_t>(cfg.max_size_mb == 0 ? 1 : cfg.max_size_mb) * 1024 * 1024;
        if (!cfg.file.empty()) {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, max_bytes, cfg.backup_count);
            file->set_level(spdlog::level::trace);
            sinks.push_back(std::move(file));
        }
        if (!cfg.error_file.empty()) {
            auto errors = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.error_file, max_bytes, cfg.backup_count);
            errors->set_level(spdlog::level::err);
            sinks.push_back(std::move(errors));
        }
    } catch (const spdlog::spdlog_ex&) {
        return make_status(StatusDomain::Config, StatusCode::Io);
    }

    for (auto& sink : sinks) {
        sink->set_pattern(kPattern);
    }

    LogState& s = state();
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        s.sinks = std::move(sinks);
        s.level = lvl;
        spdlog::drop_all();
    }

    auto lg = logger("app");
    lg->info("logging initialized (level={}, file={})", cfg.level, cfg.file.empty() ? "-" : cfg.file);
    return ok_status();
}

void log_shutdown() noexcept {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    spdlog::drop_all();
    s.sinks.clear();
    s.level = spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> logger(const char* name) noexcept {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    try {
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto lg = make_logger(name, s);
        spdlog::register_logger(lg);
        return lg;
    } catch (const std::exception&) {
        return spdlog::default_logger();
    }
}

} // namespace matreg::core
