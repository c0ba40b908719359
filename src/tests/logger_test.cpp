#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include "error/netfile_error.hpp"
#include "logger/logger.hpp"
#include "test_utils.hpp"

namespace logging = netfile::logging;

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    log_path = temp_path("netfile-log-");
    logging::init_logging(log_path.string(), logging::severity_level::trace);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    std::filesystem::remove(log_path);
    // Back to the quiet console setup the other suites expect
    init_logging();
  }

  bool log_contains(const std::string& text) {
    boost::log::core::get()->flush();
    return read_whole_file(log_path).find(text) != std::string::npos;
  }

  std::filesystem::path log_path;
};

TEST_F(LoggerTest, BasicLogging) {
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
  EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    BOOST_LOG_TRIVIAL(info) << "Message from thread";
  });
  t.join();

  EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  logging::set_log_level(logging::severity_level::warning);

  BOOST_LOG_TRIVIAL(debug) << "Should not appear";
  BOOST_LOG_TRIVIAL(warning) << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, DisableLogging) {
  logging::disable_logging();
  BOOST_LOG_TRIVIAL(error) << "Dropped message";
  EXPECT_FALSE(log_contains("Dropped message"));
}

TEST_F(LoggerTest, ReinitializingAppends) {
  BOOST_LOG_TRIVIAL(info) << "First run";
  logging::init_logging(log_path.string(), logging::severity_level::info);
  BOOST_LOG_TRIVIAL(info) << "Second run";

  EXPECT_TRUE(log_contains("First run"));
  EXPECT_TRUE(log_contains("Second run"));
}

TEST(LogLevelTest, ParsesNames) {
  EXPECT_EQ(logging::parse_log_level("trace"), logging::severity_level::trace);
  EXPECT_EQ(logging::parse_log_level("DEBUG"), logging::severity_level::debug);
  EXPECT_EQ(logging::parse_log_level("Info"), logging::severity_level::info);
  EXPECT_EQ(logging::parse_log_level("warn"), logging::severity_level::warning);
  EXPECT_EQ(logging::parse_log_level("warning"), logging::severity_level::warning);
  EXPECT_EQ(logging::parse_log_level("error"), logging::severity_level::error);
  EXPECT_EQ(logging::parse_log_level("fatal"), logging::severity_level::fatal);
  EXPECT_THROW(logging::parse_log_level("loud"), netfile::Error);
}
