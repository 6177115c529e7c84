#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/alert.hpp"
#include "core/config.hpp"
#include "core/notification_dispatcher.hpp"
#include "io/transport/base_transport.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

class MockTransport : public INotificationTransport {
public:
  MOCK_METHOD(bool, send, (const std::string &), (override));
  const char *get_name() const override { return "MockTransport"; }
  std::string get_transport_type() const override { return "mock"; }
};

// Records every message it receives
class RecordingTransport : public INotificationTransport {
public:
  bool send(const std::string &text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(text);
    return true;
  }
  const char *get_name() const override { return "RecordingTransport"; }
  std::string get_transport_type() const override { return "recording"; }

  std::vector<std::string> messages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

private:
  std::mutex mutex_;
  std::vector<std::string> messages_;
};

// Blocks inside send() until released
class GatedTransport : public INotificationTransport {
public:
  bool send(const std::string &) override {
    entered_.set_value();
    release_.get_future().wait();
    return true;
  }
  const char *get_name() const override { return "GatedTransport"; }
  std::string get_transport_type() const override { return "gated"; }

  void wait_entered() { entered_future_.wait(); }
  void release() { release_.set_value(); }

private:
  std::promise<void> entered_;
  std::future<void> entered_future_ = entered_.get_future();
  std::promise<void> release_;
};

Notification make_notification(NotificationKind kind,
                               const std::string &identity) {
  Notification n;
  n.kind = kind;
  n.identity = identity;
  n.alert_type = alert_type_of(identity);
  n.timestamp_ms = 1700000000000ULL;
  n.snapshot = MetricSnapshot{93.456, 90.0, "%"};
  return n;
}

} // namespace

class NotificationDispatcherTest : public ::testing::Test {
protected:
  void SetUp() override { dispatcher_.set_hostname("web-01"); }

  NotificationDispatcher dispatcher_;
};

TEST_F(NotificationDispatcherTest, RendersInitialWithValueAndThreshold) {
  std::string text =
      dispatcher_.render(make_notification(NotificationKind::INITIAL, "cpu:host"));
  EXPECT_EQ(text, "⚠️ *CPU alert* on web-01\nCurrent: 93.5% (threshold: 90.0%)");
}

TEST_F(NotificationDispatcherTest, RendersDiskTitleWithMountPoint) {
  std::string text = dispatcher_.render(
      make_notification(NotificationKind::INITIAL, "disk:/data"));
  EXPECT_THAT(text, HasSubstr("*Disk /data alert* on web-01"));
}

TEST_F(NotificationDispatcherTest, RendersInternetWithoutPercentages) {
  Notification n = make_notification(NotificationKind::INITIAL,
                                     "internet:connection");
  n.snapshot = MetricSnapshot{0.0, 1.0, ""};
  EXPECT_EQ(dispatcher_.render(n),
            "⚠️ *Internet connection alert* on web-01\nNo configured host "
            "answered");
}

TEST_F(NotificationDispatcherTest, RendersReminderWithCount) {
  Notification n = make_notification(NotificationKind::REMINDER, "ram:host");
  n.reminder_count = 2;
  std::string text = dispatcher_.render(n);
  EXPECT_EQ(text.rfind("🔄 REMINDER (2) - ⚠️ *RAM alert* on web-01", 0), 0u);
}

TEST_F(NotificationDispatcherTest, RendersRecoveryWithDuration) {
  Notification n = make_notification(NotificationKind::RECOVERY, "cpu:host");
  n.duration_ms = (3600 + 120 + 3) * 1000ULL;
  EXPECT_EQ(dispatcher_.render(n),
            "✅ RESOLVED - CPU on web-01 (duration: 1h 2m 3s)");
}

TEST_F(NotificationDispatcherTest, RendersEventVerbatim) {
  Notification n = make_notification(NotificationKind::EVENT, "ssh:1.2.3.4");
  n.text = "*SSH connection detected*";
  EXPECT_EQ(dispatcher_.render(n), "*SSH connection detected*");
}

TEST_F(NotificationDispatcherTest, NoTransportMeansNotDelivered) {
  EXPECT_EQ(dispatcher_.transport_count(), 0u);
  EXPECT_FALSE(dispatcher_.dispatch(
      make_notification(NotificationKind::INITIAL, "cpu:host")));
}

TEST_F(NotificationDispatcherTest, NoneKindIsNeverSent) {
  auto mock = std::make_unique<MockTransport>();
  EXPECT_CALL(*mock, send(_)).Times(0);
  dispatcher_.add_transport(std::move(mock));

  EXPECT_TRUE(dispatcher_.dispatch(
      make_notification(NotificationKind::NONE, "cpu:host")));
}

TEST_F(NotificationDispatcherTest, FansOutAndSucceedsIfAnyTransportAccepts) {
  auto failing = std::make_unique<MockTransport>();
  auto working = std::make_unique<MockTransport>();
  EXPECT_CALL(*failing, send(HasSubstr("*CPU alert*"))).WillOnce(Return(false));
  EXPECT_CALL(*working, send(HasSubstr("*CPU alert*"))).WillOnce(Return(true));
  dispatcher_.add_transport(std::move(failing));
  dispatcher_.add_transport(std::move(working));

  EXPECT_TRUE(dispatcher_.dispatch(
      make_notification(NotificationKind::INITIAL, "cpu:host")));
}

TEST_F(NotificationDispatcherTest, AllTransportsFailingIsReported) {
  auto failing = std::make_unique<MockTransport>();
  EXPECT_CALL(*failing, send(_)).WillOnce(Return(false));
  dispatcher_.add_transport(std::move(failing));

  EXPECT_FALSE(dispatcher_.dispatch(
      make_notification(NotificationKind::RECOVERY, "cpu:host")));
}

TEST_F(NotificationDispatcherTest, QueuedNotificationsAreDrainedOnStop) {
  auto recording = std::make_unique<RecordingTransport>();
  RecordingTransport *sink = recording.get();
  dispatcher_.add_transport(std::move(recording));

  dispatcher_.start();
  EXPECT_TRUE(dispatcher_.is_running());
  dispatcher_.enqueue(make_notification(NotificationKind::INITIAL, "cpu:host"));
  dispatcher_.enqueue(make_notification(NotificationKind::NONE, "ram:host"));
  dispatcher_.enqueue(make_notification(NotificationKind::INITIAL, "ram:host"));
  dispatcher_.stop();
  EXPECT_FALSE(dispatcher_.is_running());

  auto messages = sink->messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_THAT(messages[0], HasSubstr("CPU"));
  EXPECT_THAT(messages[1], HasSubstr("RAM"));
}

TEST_F(NotificationDispatcherTest, ReconfigureBuildsTransportsFromConfig) {
  Config::AppConfig config;
  config.alerts_to_stdout = true;
  config.alerting.syslog_enabled = true;
  config.hostname = "db-02";
  dispatcher_.reconfigure(config);
  EXPECT_EQ(dispatcher_.transport_count(), 2u);

  EXPECT_THAT(dispatcher_.render(
                  make_notification(NotificationKind::INITIAL, "cpu:host")),
              HasSubstr("on db-02"));

  // Reload replaces the list
  config.alerting.syslog_enabled = false;
  dispatcher_.reconfigure(config);
  EXPECT_EQ(dispatcher_.transport_count(), 1u);
}

TEST_F(NotificationDispatcherTest, ReconfigureDoesNotWaitForSlowSend) {
  auto gated = std::make_unique<GatedTransport>();
  GatedTransport *gate = gated.get();
  dispatcher_.add_transport(std::move(gated));

  auto sending = std::async(std::launch::async,
                            [this] { return dispatcher_.send_text("slow"); });
  gate->wait_entered();

  Config::AppConfig config;
  config.alerts_to_stdout = true;
  auto reconfiguring = std::async(std::launch::async,
                                  [this, &config] { dispatcher_.reconfigure(config); });
  EXPECT_EQ(reconfiguring.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);

  // The in-flight send still owns the replaced transport
  gate->release();
  EXPECT_TRUE(sending.get());
  reconfiguring.get();
  EXPECT_EQ(dispatcher_.transport_count(), 1u);
}

TEST_F(NotificationDispatcherTest, InvalidTelegramUrlDisablesOnlyTelegram) {
  Config::AppConfig config;
  config.telegram.enabled = true;
  config.telegram.bot_token = "123:abc";
  config.telegram.chat_id = "42";
  config.telegram.api_url = "not a url";
  config.alerts_to_stdout = true;
  dispatcher_.reconfigure(config);
  EXPECT_EQ(dispatcher_.transport_count(), 1u);
}

TEST(AlertTitleTest, NamesKnownAndUnknownTypes) {
  EXPECT_EQ(alert_title("cpu:host"), "CPU");
  EXPECT_EQ(alert_title("ram:host"), "RAM");
  EXPECT_EQ(alert_title("disk:/"), "Disk /");
  EXPECT_EQ(alert_title("temperature:host"), "Temperature");
  EXPECT_EQ(alert_title("internet:connection"), "Internet connection");
  EXPECT_EQ(alert_title("swap:host"), "Swap");
}
