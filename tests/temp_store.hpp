#pragma once

#include <filesystem>
#include <string>

#include <unistd.h>

#include <gtest/gtest.h>

#include "matreg/core/errors.hpp"
#include "matreg/db/connection.hpp"

namespace matreg::testing {

    // Fresh directory under the system temp dir, unique per test and process.
    inline std::filesystem::path make_temp_dir() {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "matreg_";
        if (info != nullptr) {
            name += std::string(info->test_suite_name()) + "_" + info->name();
        }
        name += "_" + std::to_string(::getpid());
        const std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    // Opens a migrated store in a temporary directory; everything is removed in TearDown.
    class TempStoreTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = make_temp_dir();
            cfg_.path = (dir_ / "store.db").string();
            const matreg::core::Status s = matreg::db::db_open(cfg_, &conn_);
            ASSERT_TRUE(matreg::core::is_ok(s)) << matreg::core::describe(s);
        }

        void TearDown() override {
            (void)matreg::db::db_close(&conn_);
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        std::filesystem::path dir_;
        matreg::db::DbConfig cfg_{};
        matreg::db::Connection conn_;
    };

} // namespace matreg::testing
