//src/test/test_support.h

#pragma once

#include "gtest/gtest.h"

#include "core/errors/SdbError.hpp"

#include <filesystem>
#include <functional>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

// Fixture base: a fresh data directory per test, removed afterwards.
class TempDataDirTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::random_device rd;
        test_dir = (fs::temp_directory_path() /
                    ("lsdb_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                     std::to_string(rd()))).string();
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        if (ec) {
            std::cerr << "Warning: Could not clean up test directory " << test_dir << ": " << ec.message() << std::endl;
        }
    }
};

// Kind of the SdbError thrown by fn; records a failure when nothing is thrown.
inline lsdb::ErrorKind faultKind(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const lsdb::SdbError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected an SdbError";
    return lsdb::ErrorKind::InternalError;
}
