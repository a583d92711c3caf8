#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/db/connection.hpp"

namespace matreg::db {

    // backup_YYYYMMDD_HHMMSS[_N].db files in dir, oldest first.
    [[nodiscard]] matreg::core::Status db_list_backups(const std::string& dir,
        std::vector<std::string>* out) noexcept;

    // Deletes the oldest backups until at most keep remain. keep == 0 keeps everything.
    [[nodiscard]] matreg::core::Status db_prune_backups(const std::string& dir,
        u32 keep,
        u32* out_removed) noexcept;

    struct BackupSchedule {
        std::string backup_dir;
        std::chrono::milliseconds interval{std::chrono::minutes(30)};
        u32 keep{10};
    };

    // Periodic backup worker. The worker thread owns its own Connection, opened in
    // start() and never touched by any other thread.
    class BackupScheduler {
    public:
        BackupScheduler() = default;
        ~BackupScheduler();

        BackupScheduler(const BackupScheduler&) = delete;
        BackupScheduler& operator=(const BackupScheduler&) = delete;

        [[nodiscard]] matreg::core::Status start(const DbConfig& db, const BackupSchedule& schedule) noexcept;

        // Wakes the worker and joins it. Safe to call when not running.
        void stop() noexcept;

        [[nodiscard]] bool running() const noexcept { return worker_.joinable(); }

        // Backups written since start().
        [[nodiscard]] u32 completed() const noexcept { return completed_.load(); }
        [[nodiscard]] u32 failed() const noexcept { return failed_.load(); }

    private:
        void run(Connection conn, BackupSchedule schedule) noexcept;

        std::thread worker_;
        std::mutex mutex_;
        std::condition_variable wake_;
        bool stop_requested_{false};
        std::atomic<u32> completed_{0};
        std::atomic<u32> failed_{0};
    };

} // namespace matreg::db
