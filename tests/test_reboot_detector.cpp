#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "io/collectors/base_collector.hpp"
#include "io/collectors/reboot_detector.hpp"

class RebootDetectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "hostwatch_reboot_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    state_file_ = (dir_ / "state" / "last_uptime").string();
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  void set_uptime(const std::string &content) {
    std::ofstream(dir_ / "uptime", std::ios::trunc) << content;
  }

  std::filesystem::path dir_;
  std::string state_file_;
};

TEST_F(RebootDetectorTest, ParsesProcUptime) {
  EXPECT_DOUBLE_EQ(*RebootDetector::parse_uptime("12345.67 54321.00\n"),
                   12345.67);
  EXPECT_FALSE(RebootDetector::parse_uptime("garbage").has_value());
}

TEST_F(RebootDetectorTest, GrowingUptimeIsNotAReboot) {
  RebootDetector detector(dir_.string(), state_file_);
  set_uptime("100.0 10.0\n");
  EXPECT_FALSE(detector.check().has_value());
  set_uptime("110.0 10.0\n");
  EXPECT_FALSE(detector.check().has_value());
  EXPECT_DOUBLE_EQ(*detector.last_uptime(), 110.0);
}

TEST_F(RebootDetectorTest, DroppingUptimeIsAReboot) {
  RebootDetector detector(dir_.string(), state_file_);
  set_uptime("5000.0 1.0\n");
  detector.check();
  set_uptime("42.5 1.0\n");
  auto rebooted = detector.check();
  ASSERT_TRUE(rebooted.has_value());
  EXPECT_DOUBLE_EQ(*rebooted, 42.5);

  // Reported once
  set_uptime("50.0 1.0\n");
  EXPECT_FALSE(detector.check().has_value());
}

TEST_F(RebootDetectorTest, YoungPreviousUptimeIsIgnored) {
  RebootDetector detector(dir_.string(), state_file_);
  set_uptime("8.0 1.0\n");
  detector.check();
  set_uptime("3.0 1.0\n");
  EXPECT_FALSE(detector.check().has_value());
}

TEST_F(RebootDetectorTest, RebootAcrossRestartIsDetected) {
  {
    RebootDetector detector(dir_.string(), state_file_);
    set_uptime("86400.0 1.0\n");
    detector.check();
  }
  set_uptime("30.0 1.0\n");
  RebootDetector restarted(dir_.string(), state_file_);
  ASSERT_TRUE(restarted.last_uptime().has_value());
  EXPECT_TRUE(restarted.check().has_value());
}

TEST_F(RebootDetectorTest, UnreadableUptimeIsTransient) {
  RebootDetector detector((dir_ / "missing").string(), state_file_);
  EXPECT_THROW(detector.check(), TransientReadError);
}
