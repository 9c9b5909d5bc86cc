#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <filesystem>
#include "chainvault/logger/logger.hpp"
#include "test_utils.hpp"

using namespace chainvault::logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_dir = make_temp_dir("logger_test");
        log_file = log_dir / "test.log";
    }

    void TearDown() override {
        // Ensure all logs are written, then restore the shared test sink
        shutdown_logging();
        init_logging();
        std::filesystem::remove_all(log_dir);
    }

    std::string read_log() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    bool log_contains(const std::string& text) {
        return read_log().find(text) != std::string::npos;
    }

    std::filesystem::path log_dir;
    std::filesystem::path log_file;
};

TEST_F(LoggerTest, BasicLogging) {
    chainvault::logger::init_logging(log_file.string());
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Logger: Logging to"));
    EXPECT_TRUE(log_contains("[info] [Thread"));
    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
}

TEST_F(LoggerTest, ThreadLogging) {
    chainvault::logger::init_logging(log_file.string());
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    chainvault::logger::init_logging(log_file.string(), boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(info) << "Also filtered";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_FALSE(log_contains("Also filtered"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, AppendsAcrossRestarts) {
    chainvault::logger::init_logging(log_file.string());
    BOOST_LOG_TRIVIAL(info) << "First run";
    shutdown_logging();

    chainvault::logger::init_logging(log_file.string(), boost::log::trivial::trace);
    BOOST_LOG_TRIVIAL(trace) << "Second run";

    EXPECT_TRUE(log_contains("First run"));
    EXPECT_TRUE(log_contains("Second run"));
}

TEST_F(LoggerTest, ShutdownStopsWriting) {
    chainvault::logger::init_logging(log_file.string());
    BOOST_LOG_TRIVIAL(info) << "Before shutdown";
    shutdown_logging();
    BOOST_LOG_TRIVIAL(info) << "After shutdown";

    EXPECT_TRUE(log_contains("Before shutdown"));
    EXPECT_FALSE(log_contains("After shutdown"));
}
