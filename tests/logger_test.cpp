#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "../src/utils/logger.hpp"

namespace {
    class LoggerTest : public ::testing::Test {
       protected:
        void SetUp() override {
            previous_level_ = logging::get_level();
            previous_buf_ = std::clog.rdbuf(captured_.rdbuf());
        }

        void TearDown() override {
            std::clog.rdbuf(previous_buf_);
            logging::set_level(previous_level_);
        }

        std::ostringstream captured_;

       private:
        logging::LogLevel previous_level_ = logging::LogLevel::WARN;
        std::streambuf* previous_buf_ = nullptr;
    };
}  // namespace

TEST_F(LoggerTest, LevelFiltersMessages) {
    logging::set_level(logging::LogLevel::WARN);

    EXPECT_FALSE(logging::enabled(logging::LogLevel::DEBUG));
    EXPECT_FALSE(logging::enabled(logging::LogLevel::INFO));
    EXPECT_TRUE(logging::enabled(logging::LogLevel::WARN));
    EXPECT_TRUE(logging::enabled(logging::LogLevel::ERROR));
    EXPECT_FALSE(logging::enabled(logging::LogLevel::OFF));
}

TEST_F(LoggerTest, DisabledLevelSkipsExpression) {
    logging::set_level(logging::LogLevel::ERROR);
    int evaluated = 0;

    COURIER_LOG_DEBUG("never " << ++evaluated);
    COURIER_LOG_ERROR("always " << ++evaluated);

    EXPECT_EQ(evaluated, 1);
    EXPECT_EQ(captured_.str().find("never"), std::string::npos);
    EXPECT_NE(captured_.str().find("[ERROR] courier: always 1"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    logging::set_level(logging::LogLevel::OFF);

    COURIER_LOG_ERROR("dropped");

    EXPECT_TRUE(captured_.str().empty());
}
