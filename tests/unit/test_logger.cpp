// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Logger Unit Tests                                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "internal/utils/logger.hpp"
#include "sqlparse/sqlparse.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace sqlparse;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = std::filesystem::temp_directory_path() /
                    ("sqlparse_logger_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".log");
        std::filesystem::remove(log_path_);
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove(log_path_);
    }

    std::string read_log() const {
        std::ifstream file(log_path_);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    std::filesystem::path log_path_;
};

TEST_F(LoggerTest, SilentUntilInitialized) {
    EXPECT_FALSE(Logger::is_initialized());
    Logger::info("dropped {}", 1);
    EXPECT_FALSE(Logger::is_initialized());
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::level_from_string("trace"), LogLevel::TRACE);
    EXPECT_EQ(Logger::level_from_string("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::level_from_string("warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::level_from_string("off"), LogLevel::OFF);
    EXPECT_EQ(Logger::level_from_string("loud"), LogLevel::INFO);
}

TEST_F(LoggerTest, ParserLogsToFile) {
    Logger::init(log_path_.string(), LogLevel::DEBUG);
    ASSERT_TRUE(Logger::is_initialized());

    auto result = parse("SELECT a FROM users");
    ASSERT_TRUE(result);
    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());

    std::string log = read_log();
    EXPECT_NE(log.find("Parsed SELECT statement on 'users'"), std::string::npos) << log;
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    Logger::init(log_path_.string(), LogLevel::ERROR);
    auto result = parse("SELECT a FROM users");
    ASSERT_TRUE(result);
    Logger::error("explicit error {}", 7);
    Logger::shutdown();

    std::string log = read_log();
    EXPECT_EQ(log.find("Parsed SELECT"), std::string::npos);
    EXPECT_NE(log.find("explicit error 7"), std::string::npos);
}
