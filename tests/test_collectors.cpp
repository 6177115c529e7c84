#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <filesystem>
#include <fstream>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

#include "core/config.hpp"
#include "io/collectors/base_collector.hpp"
#include "io/collectors/cpu_collector.hpp"
#include "io/collectors/disk_collector.hpp"
#include "io/collectors/internet_collector.hpp"
#include "io/collectors/memory_collector.hpp"
#include "io/collectors/temperature_collector.hpp"

class CollectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() / "hostwatch_collector_test";
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  void write(const std::filesystem::path &relative, const std::string &content) {
    std::filesystem::path path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
  }

  std::filesystem::path root_;
};

TEST_F(CollectorTest, CpuLineParsing) {
  CpuTimes times;
  ASSERT_TRUE(CpuCollector::parse_cpu_line(
      "cpu  100 0 50 800 50 0 0 0 0 0", times));
  EXPECT_EQ(times.total(), 1000u);
  EXPECT_EQ(times.busy(), 150u);

  EXPECT_FALSE(CpuCollector::parse_cpu_line("cpu0 1 2 3 4", times));
  EXPECT_FALSE(CpuCollector::parse_cpu_line("cpu 1 2", times));
}

TEST_F(CollectorTest, CpuFirstSamplePrimesThenReportsDelta) {
  write("stat", "cpu  100 0 100 800 0 0 0 0\ncpu0 1 1 1 1\n");
  CpuCollector collector(root_.string());
  EXPECT_THROW(collector.sample(), TransientReadError);

  // +300 busy, +100 idle
  write("stat", "cpu  300 0 200 900 0 0 0 0\n");
  EXPECT_DOUBLE_EQ(collector.sample(), 75.0);

  // No progress at all reads as idle
  EXPECT_DOUBLE_EQ(collector.sample(), 0.0);
  EXPECT_EQ(collector.resource(), "cpu");
}

TEST_F(CollectorTest, CpuMissingFileIsTransient) {
  CpuCollector collector((root_ / "nope").string());
  EXPECT_THROW(collector.sample(), TransientReadError);
}

TEST_F(CollectorTest, MemoryUsesAvailable) {
  write("meminfo", "MemTotal:       1000 kB\n"
                   "MemFree:         100 kB\n"
                   "MemAvailable:    250 kB\n");
  MemoryCollector collector(root_.string());
  EXPECT_DOUBLE_EQ(collector.sample(), 75.0);
  EXPECT_STREQ(collector.unit(), "%");
}

TEST_F(CollectorTest, MemoryWithoutAvailableIsTransient) {
  write("meminfo", "MemTotal: 1000 kB\nMemFree: 100 kB\n");
  MemoryCollector collector(root_.string());
  EXPECT_THROW(collector.sample(), TransientReadError);
}

TEST_F(CollectorTest, TemperatureTakesHottestZone) {
  write("class/thermal/thermal_zone0/temp", "45000\n");
  write("class/thermal/thermal_zone1/temp", "71500\n");
  write("class/thermal/cooling_device0/temp", "99000\n");
  TemperatureCollector collector(root_.string());
  EXPECT_DOUBLE_EQ(collector.sample(), 71.5);
}

TEST_F(CollectorTest, TemperatureWithoutZonesIsTransient) {
  std::filesystem::create_directories(root_ / "class" / "thermal");
  TemperatureCollector collector(root_.string());
  EXPECT_THROW(collector.sample(), TransientReadError);
}

TEST_F(CollectorTest, DiskReportsPercentageForExistingPath) {
  DiskCollector collector(root_.string());
  double usage = collector.sample();
  EXPECT_GE(usage, 0.0);
  EXPECT_LE(usage, 100.0);
  EXPECT_EQ(collector.resource(), "disk:" + root_.string());
}

TEST_F(CollectorTest, DiskMissingMountPointIsTransient) {
  DiskCollector collector((root_ / "missing").string());
  EXPECT_THROW(collector.sample(), TransientReadError);
}

class InternetCollectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listen_fd_, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)),
              0);
    ASSERT_EQ(listen(listen_fd_, 4), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len),
              0);
    port_ = ntohs(addr.sin_port);
  }

  void TearDown() override {
    if (listen_fd_ >= 0)
      close(listen_fd_);
  }

  int listen_fd_ = -1;
  int port_ = 0;
};

TEST_F(InternetCollectorTest, ReachableHostReadsOne) {
  EXPECT_TRUE(InternetCollector::try_connect("127.0.0.1", port_, 1000));

  Config::InternetConfig config;
  config.hosts = {"127.0.0.1"};
  config.port = port_;
  config.timeout_ms = 1000;
  InternetCollector collector(config);
  EXPECT_DOUBLE_EQ(collector.sample(), 1.0);
}

TEST_F(InternetCollectorTest, ClosedPortReadsZero) {
  int closed_port = port_;
  close(listen_fd_);
  listen_fd_ = -1;

  Config::InternetConfig config;
  config.hosts = {"127.0.0.1"};
  config.port = closed_port;
  config.timeout_ms = 500;
  InternetCollector collector(config);
  EXPECT_DOUBLE_EQ(collector.sample(), 0.0);
}

TEST_F(InternetCollectorTest, AnyReachableHostIsEnough) {
  Config::InternetConfig config;
  config.hosts = {"::1", "127.0.0.1"}; // Listener is IPv4 only
  config.port = port_;
  config.timeout_ms = 1000;
  InternetCollector collector(config);
  EXPECT_DOUBLE_EQ(collector.sample(), 1.0);
}
