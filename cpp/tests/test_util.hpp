// rootio – shared test helpers
#pragma once

#include <gtest/gtest.h>
#include "rootio/error.hpp"

#include <cstdio>
#include <string>

namespace rootio {
namespace test {

/// Unique scratch path per test, removed by the fixture.
inline std::string temp_path(const std::string& suffix = ".root") {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string(info->test_suite_name()) + "_" + info->name();
    for (auto& c : name)
        if (c == '/') c = '_';
    return ::testing::TempDir() + "rootio_" + name + suffix;
}

class TempFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = temp_path();
        std::remove(path_.c_str());
    }
    void TearDown() override { std::remove(path_.c_str()); }

    std::string path_;
};

} // namespace test
} // namespace rootio

/// Expect `stmt` to throw rootio::Error with `expected_code`.
#define EXPECT_ROOTIO_ERROR(stmt, expected_code)                                       \
    do {                                                                        \
        try {                                                                   \
            stmt;                                                               \
            ADD_FAILURE() << "expected rootio::Error from " #stmt;             \
        } catch (const rootio::Error& e) {                                      \
            EXPECT_EQ(e.code(), expected_code) << e.what();                          \
        }                                                                       \
    } while (0)
