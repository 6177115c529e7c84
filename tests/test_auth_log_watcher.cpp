#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "core/config.hpp"
#include "io/log_readers/auth_log_watcher.hpp"

namespace {
const char *ACCEPTED_EXTERNAL =
    "Mar  3 10:15:42 web-01 sshd[1234]: Accepted publickey for deploy from "
    "203.0.113.7 port 52514 ssh2: ED25519 SHA256:abc";
const char *ACCEPTED_LAN =
    "Mar  3 10:16:00 web-01 sshd[1240]: Accepted password for root from "
    "192.168.1.20 port 40000 ssh2";
const char *FAILED =
    "Mar  3 10:17:00 web-01 sshd[1250]: Failed password for root from "
    "198.51.100.1 port 40001 ssh2";
} // namespace

class AuthLogWatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "hostwatch_auth_log_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    config_.auth_log_path = (dir_ / "auth.log").string();
    config_.position_file = (dir_ / "position").string();
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  void append(const std::string &text) {
    std::ofstream out(config_.auth_log_path, std::ios::app);
    out << text;
  }

  std::filesystem::path dir_;
  Config::SshConfig config_;
};

TEST_F(AuthLogWatcherTest, ParsesAcceptedLine) {
  auto login = AuthLogWatcher::parse_line(ACCEPTED_EXTERNAL);
  ASSERT_TRUE(login.has_value());
  EXPECT_EQ(login->timestamp, "Mar  3 10:15:42");
  EXPECT_EQ(login->host, "web-01");
  EXPECT_EQ(login->user, "deploy");
  EXPECT_EQ(login->source_ip, "203.0.113.7");

  EXPECT_FALSE(AuthLogWatcher::parse_line(FAILED).has_value());
  EXPECT_FALSE(AuthLogWatcher::parse_line("").has_value());
}

TEST_F(AuthLogWatcherTest, ExcludesPrivateRangesAndNonIpv4) {
  AuthLogWatcher watcher(config_);
  EXPECT_TRUE(watcher.is_excluded("127.0.0.1"));
  EXPECT_TRUE(watcher.is_excluded("10.20.30.40"));
  EXPECT_TRUE(watcher.is_excluded("192.168.1.20"));
  EXPECT_TRUE(watcher.is_excluded("::1"));
  EXPECT_FALSE(watcher.is_excluded("203.0.113.7"));
}

TEST_F(AuthLogWatcherTest, ReportsOnlyNewExternalLogins) {
  append(std::string(ACCEPTED_EXTERNAL) + "\n" + ACCEPTED_LAN + "\n" + FAILED +
         "\n");
  AuthLogWatcher watcher(config_);

  auto logins = watcher.poll();
  ASSERT_EQ(logins.size(), 1u);
  EXPECT_EQ(logins[0].user, "deploy");

  EXPECT_TRUE(watcher.poll().empty());

  append(std::string(ACCEPTED_EXTERNAL) + "\n");
  EXPECT_EQ(watcher.poll().size(), 1u);
}

TEST_F(AuthLogWatcherTest, PartialLineWaitsForNewline) {
  std::string line(ACCEPTED_EXTERNAL);
  append(line.substr(0, 30));
  AuthLogWatcher watcher(config_);
  EXPECT_TRUE(watcher.poll().empty());
  EXPECT_EQ(watcher.position(), 0u);

  append(line.substr(30) + "\n");
  EXPECT_EQ(watcher.poll().size(), 1u);
}

TEST_F(AuthLogWatcherTest, PositionSurvivesRestart) {
  append(std::string(ACCEPTED_EXTERNAL) + "\n");
  {
    AuthLogWatcher watcher(config_);
    EXPECT_EQ(watcher.poll().size(), 1u);
  }
  AuthLogWatcher restarted(config_);
  EXPECT_GT(restarted.position(), 0u);
  EXPECT_TRUE(restarted.poll().empty());
}

TEST_F(AuthLogWatcherTest, TruncatedLogIsReadFromStart) {
  append(std::string(ACCEPTED_EXTERNAL) + "\n" + ACCEPTED_EXTERNAL + "\n");
  AuthLogWatcher watcher(config_);
  EXPECT_EQ(watcher.poll().size(), 2u);

  std::ofstream(config_.auth_log_path, std::ios::trunc)
      << ACCEPTED_EXTERNAL << "\n";
  EXPECT_EQ(watcher.poll().size(), 1u);
}

TEST_F(AuthLogWatcherTest, MissingLogYieldsNothing) {
  AuthLogWatcher watcher(config_);
  EXPECT_TRUE(watcher.poll().empty());
}
