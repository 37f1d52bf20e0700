// End-to-end tests: a running BeaconSender observed by a BeaconListener.
#include "simpdiscover/simpdiscover.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace {

// Beacons are addressed to loopback so the tests do not depend on the host
// having a broadcast route.
simpdiscover::SenderConfig SenderFor(uint16_t port, const std::string& name) {
  simpdiscover::SenderConfig config;
  config.service_port = 8080;
  config.service_name = name;
  config.broadcast_port = port;
  config.broadcast_address = "127.0.0.1";
  config.send_period = std::chrono::milliseconds(50);
  config.log_callback = [](const std::string&) {};
  return config;
}

simpdiscover::ListenerConfig ListenerFor(const std::string& name) {
  simpdiscover::ListenerConfig config;
  config.service_name = name;
  config.listening_port = 0;
  config.log_callback = [](const std::string&) {};
  return config;
}

}  // namespace

TEST(EndToEndTest, ListenerReceivesMatchingBeacon) {
  simpdiscover::BeaconListener listener(ListenerFor("svc-A"));
  ASSERT_TRUE(listener.Open());

  simpdiscover::BeaconSender sender(SenderFor(listener.local_port(), "svc-A"));
  ASSERT_TRUE(sender.Open());
  ASSERT_TRUE(sender.Start());

  simpdiscover::Beacon beacon;
  simpdiscover::Error error;
  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(listener.Wait(std::chrono::seconds(2), &beacon, &error)) << error.message;
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
  sender.Stop();

  EXPECT_EQ(beacon.service_port, 8080);
  EXPECT_EQ(beacon.service_name, "svc-A");
  EXPECT_EQ(beacon.service_ip, "127.0.0.1");
}

TEST(EndToEndTest, UnmatchedFilterTimesOut) {
  simpdiscover::BeaconListener listener(ListenerFor("svc-Z"));
  ASSERT_TRUE(listener.Open());

  simpdiscover::BeaconSender sender(SenderFor(listener.local_port(), "svc-A"));
  ASSERT_TRUE(sender.Open());
  ASSERT_TRUE(sender.Start());

  simpdiscover::Error error;
  EXPECT_FALSE(listener.Wait(std::chrono::milliseconds(300), nullptr, &error));
  sender.Stop();

  EXPECT_EQ(error.code, simpdiscover::ErrorCode::kTimeout);
  EXPECT_GT(listener.GetMetrics().filtered, 0u);
  EXPECT_EQ(listener.GetMetrics().beacons_matched, 0u);
}

TEST(EndToEndTest, TwoServicesOnOnePort) {
  simpdiscover::BeaconListener listener(ListenerFor("svc-B"));
  ASSERT_TRUE(listener.Open());

  simpdiscover::SenderConfig config_b = SenderFor(listener.local_port(), "svc-B");
  config_b.service_port = 9090;
  simpdiscover::BeaconSender sender_a(SenderFor(listener.local_port(), "svc-A"));
  simpdiscover::BeaconSender sender_b(config_b);
  ASSERT_TRUE(sender_a.Open());
  ASSERT_TRUE(sender_b.Open());
  ASSERT_TRUE(sender_a.Start());
  ASSERT_TRUE(sender_b.Start());

  simpdiscover::Beacon beacon;
  simpdiscover::Error error;
  ASSERT_TRUE(listener.Wait(std::chrono::seconds(2), &beacon, &error)) << error.message;
  sender_a.Stop();
  sender_b.Stop();

  EXPECT_EQ(beacon.service_name, "svc-B");
  EXPECT_EQ(beacon.service_port, 9090);
}

TEST(EndToEndTest, DestroyingRunningSenderStopsIt) {
  simpdiscover::BeaconListener listener(ListenerFor("svc-A"));
  ASSERT_TRUE(listener.Open());
  {
    simpdiscover::BeaconSender sender(SenderFor(listener.local_port(), "svc-A"));
    ASSERT_TRUE(sender.Open());
    ASSERT_TRUE(sender.Start());
    ASSERT_TRUE(listener.Wait(std::chrono::seconds(2), nullptr));
  }
  SUCCEED();
}
