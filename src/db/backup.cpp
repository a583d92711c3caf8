#include "matreg/db/backup.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

#include "matreg/core/log.hpp"

namespace matreg::db {

using namespace matreg::core;

namespace {
    struct BackupFile {
        std::string path;
        std::string stamp; // YYYYMMDD_HHMMSS
        u32 seq{0};        // same-second collision suffix
    };

    // backup_YYYYMMDD_HHMMSS.db or backup_YYYYMMDD_HHMMSS_N.db
    [[nodiscard]] bool parse_backup_name(const std::string& name, BackupFile* out) {
        static constexpr std::string_view kPrefix = "backup_";
        static constexpr std::string_view kSuffix = ".db";
        static constexpr size_t kStampLen = 15;
        if (name.size() < kPrefix.size() + kStampLen + kSuffix.size()) {
            return false;
        }
        if (name.compare(0, kPrefix.size(), kPrefix) != 0 ||
            name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0) {
            return false;
        }
        const std::string stamp = name.substr(kPrefix.size(), kStampLen);
        for (size_t i = 0; i < stamp.size(); ++i) {
            const bool digit = stamp[i] >= '0' && stamp[i] <= '9';
            if (i == 8 ? stamp[i] != '_' : !digit) {
                return false;
            }
        }
        const std::string rest = name.substr(kPrefix.size() + kStampLen,
                                             name.size() - kPrefix.size() - kStampLen - kSuffix.size());
        u32 seq = 0;
        if (!rest.empty()) {
            if (rest.size() < 2 || rest[0] != '_') {
                return false;
            }
            for (size_t i = 1; i < rest.size(); ++i) {
                if (rest[i] < '0' || rest[i] > '9') {
                    return false;
                }
                seq = seq * 10 + static_cast<u32>(rest[i] - '0');
            }
        }
        out->stamp = stamp;
        out->seq = seq;
        return true;
    }

    [[nodiscard]] Status scan_backups(const std::string& dir, std::vector<BackupFile>* out) {
        namespace fs = std::filesystem;
        out->clear();
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            return ok_status();
        }
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            BackupFile f;
            if (!parse_backup_name(it->path().filename().string(), &f)) {
                continue;
            }
            f.path = it->path().string();
            out->push_back(std::move(f));
        }
        if (ec) {
            logger("backup")->error("cannot list {}: {}", dir, ec.message());
            return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        std::sort(out->begin(), out->end(), [](const BackupFile& a, const BackupFile& b) {
            if (a.stamp != b.stamp) {
                return a.stamp < b.stamp;
            }
            return a.seq < b.seq;
        });
        return ok_status();
    }
} // namespace

Status db_list_backups(const std::string& dir, std::vector<std::string>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    try {
        std::vector<BackupFile> files;
        const Status s = scan_backups(dir, &files);
        if (!is_ok(s)) {
            return s;
        }
        out->clear();
        for (BackupFile& f : files) {
            out->push_back(std::move(f.path));
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("backup")->error("listing backups in {} failed: {}", dir, e.what());
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

Status db_prune_backups(const std::string& dir, u32 keep, u32* out_removed) noexcept {
    u32 removed = 0;
    if (out_removed != nullptr) {
        *out_removed = 0;
    }
    if (keep == 0) {
        return ok_status();
    }
    try {
        std::vector<BackupFile> files;
        const Status s = scan_backups(dir, &files);
        if (!is_ok(s)) {
            return s;
        }
        auto log = logger("backup");
        while (files.size() > keep) {
            std::error_code ec;
            std::filesystem::remove(files.front().path, ec);
            if (ec) {
                log->error("prune failed for {}: {}", files.front().path, ec.message());
                if (out_removed != nullptr) {
                    *out_removed = removed;
                }
                return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(ec.value()));
            }
            log->info("pruned old backup {}", files.front().path);
            files.erase(files.begin());
            ++removed;
        }
        if (out_removed != nullptr) {
            *out_removed = removed;
        }
        return ok_status();
    } catch (const std::exception& e) {
        logger("backup")->error("pruning backups in {} failed: {}", dir, e.what());
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
}

// ============================================================================
// BackupScheduler
// ============================================================================

BackupScheduler::~BackupScheduler() {
    stop();
}

Status BackupScheduler::start(const DbConfig& db, const BackupSchedule& schedule) noexcept {
    if (running()) {
        return make_status(StatusDomain::Db, StatusCode::Conflict);
    }
    if (schedule.backup_dir.empty() || schedule.interval.count() <= 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Connection conn;
    const Status s = db_open(db, &conn);
    if (!is_ok(s)) {
        return s;
    }
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = false;
        }
        completed_.store(0);
        failed_.store(0);
        worker_ = std::thread(&BackupScheduler::run, this, std::move(conn), schedule);
    } catch (const std::exception& e) {
        logger("backup")->error("cannot start backup scheduler: {}", e.what());
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    logger("backup")->info("auto-backup every {} ms into {}, keeping {}",
                           schedule.interval.count(), schedule.backup_dir, schedule.keep);
    return ok_status();
}

void BackupScheduler::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void BackupScheduler::run(Connection conn, BackupSchedule schedule) noexcept {
    auto log = logger("backup");
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (wake_.wait_for(lock, schedule.interval, [this] { return stop_requested_; })) {
                break;
            }
        }
        std::string path;
        Status s = db_backup(conn, schedule.backup_dir, &path);
        if (!is_ok(s)) {
            ++failed_;
            log->error("scheduled backup failed: {}", describe(s));
            continue;
        }
        u32 removed = 0;
        s = db_prune_backups(schedule.backup_dir, schedule.keep, &removed);
        if (!is_ok(s)) {
            log->warn("pruning after scheduled backup failed: {}", describe(s));
        }
        ++completed_;
    }
    (void)db_close(&conn);
    log->info("auto-backup stopped after {} backups", completed_.load());
}

} // namespace matreg::db
