#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <filesystem>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace pagestore::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        test_dir = make_test_dir("logger_test");
        log_file = test_dir / "pagestore.log";
        boost::log::core::get()->remove_all_sinks();
        Logger::init(log_file.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove_all(test_dir);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        return read_file(log_file).find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::set_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST(LoggerLevelTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("trace"), boost::log::trivial::trace);
    EXPECT_EQ(Logger::parse_level("warning"), boost::log::trivial::warning);
    EXPECT_EQ(Logger::parse_level("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(Logger::parse_level("loud"), std::invalid_argument);
}
