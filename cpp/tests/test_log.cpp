#include "test_util.hpp"
#include "rootio/log.hpp"

using namespace rootio;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = log_level(); }
    void TearDown() override { set_log_level(saved_); }

    LogLevel saved_ = LogLevel::kWarning;
};

TEST_F(LogTest, ParsesLevelNames) {
    LogLevel l = LogLevel::kInfo;
    EXPECT_TRUE(parse_log_level("trace", l));
    EXPECT_EQ(l, LogLevel::kTrace);
    EXPECT_TRUE(parse_log_level("off", l));
    EXPECT_EQ(l, LogLevel::kOff);
    EXPECT_FALSE(parse_log_level("loud", l));
    EXPECT_EQ(l, LogLevel::kOff);
}

TEST_F(LogTest, ThresholdFiltersLines) {
    set_log_level(LogLevel::kError);
    ::testing::internal::CaptureStderr();
    warning() << "hidden";
    error() << "shown " << 42;
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("ERROR shown 42"), std::string::npos);
}

TEST_F(LogTest, OffSilencesEverything) {
    set_log_level(LogLevel::kOff);
    ::testing::internal::CaptureStderr();
    error() << "nothing";
    EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
}

TEST(ErrorTest, CarriesCode) {
    try {
        fail(ErrorCode::kCorruptBasket, "bad basket");
        FAIL() << "fail() returned";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::kCorruptBasket);
        EXPECT_STREQ(e.what(), "rootio: bad basket");
    }
    EXPECT_STREQ(error_code_name(ErrorCode::kUnknownVersion), "UnknownVersion");
}
