// Tests for the beacon wire format.
#include "simpdiscover/frame_codec.h"

#include <gtest/gtest.h>

TEST(FrameCodecTest, EncodeLayout) {
  const auto packet = simpdiscover::EncodeBeacon(8080, "svc-A");

  ASSERT_EQ(packet.size(), 9u);
  EXPECT_EQ(packet[0], 0xBE);
  EXPECT_EQ(packet[1], 0xEF);
  EXPECT_EQ(packet[2], 0x1F);
  EXPECT_EQ(packet[3], 0x90);
  EXPECT_EQ(std::string(packet.begin() + 4, packet.end()), "svc-A");
}

TEST(FrameCodecTest, DecodeBeacon) {
  const auto packet = simpdiscover::EncodeBeacon(1234, "BeaconTestService");

  simpdiscover::BeaconFrame frame;
  ASSERT_TRUE(simpdiscover::DecodeBeacon(packet, &frame));
  EXPECT_EQ(frame.service_port, 1234);
  EXPECT_EQ(frame.service_name, "BeaconTestService");
}

TEST(FrameCodecTest, PortExtremes) {
  simpdiscover::BeaconFrame frame;
  ASSERT_TRUE(simpdiscover::DecodeBeacon(simpdiscover::EncodeBeacon(0, "a"), &frame));
  EXPECT_EQ(frame.service_port, 0);
  ASSERT_TRUE(simpdiscover::DecodeBeacon(simpdiscover::EncodeBeacon(65535, "a"), &frame));
  EXPECT_EQ(frame.service_port, 65535);
}

TEST(FrameCodecTest, EmptyNameIsHeaderOnly) {
  const auto packet = simpdiscover::EncodeBeacon(80, "");
  EXPECT_EQ(packet.size(), simpdiscover::kBeaconHeaderSize);

  simpdiscover::BeaconFrame frame;
  frame.service_name = "stale";
  ASSERT_TRUE(simpdiscover::DecodeBeacon(packet, &frame));
  EXPECT_EQ(frame.service_port, 80);
  EXPECT_TRUE(frame.service_name.empty());
}

TEST(FrameCodecTest, NameBytesAreOpaque) {
  const std::string name("\x00\xff\x01svc\x00", 7);
  const auto packet = simpdiscover::EncodeBeacon(9, name);

  simpdiscover::BeaconFrame frame;
  ASSERT_TRUE(simpdiscover::DecodeBeacon(packet, &frame));
  EXPECT_EQ(frame.service_name, name);
  EXPECT_EQ(frame.service_name.size(), 7u);
}

TEST(FrameCodecTest, MaximumNameLength) {
  const std::string name(simpdiscover::kMaxServiceNameLength, 'n');
  const auto packet = simpdiscover::EncodeBeacon(443, name);
  EXPECT_EQ(packet.size(), simpdiscover::kMaxDatagramSize);

  simpdiscover::BeaconFrame frame;
  ASSERT_TRUE(simpdiscover::DecodeBeacon(packet, &frame));
  EXPECT_EQ(frame.service_name, name);
}

TEST(FrameCodecTest, RejectWrongMagic) {
  auto packet = simpdiscover::EncodeBeacon(8080, "svc-A");
  packet[0] = 0xCA;
  packet[1] = 0xFE;

  simpdiscover::BeaconFrame frame;
  EXPECT_FALSE(simpdiscover::DecodeBeacon(packet, &frame));
  EXPECT_FALSE(simpdiscover::IsBeacon(packet.data(), packet.size()));
}

TEST(FrameCodecTest, RejectByteSwappedMagic) {
  const std::vector<uint8_t> packet = {0xEF, 0xBE, 0x00, 0x50, 'x'};
  simpdiscover::BeaconFrame frame;
  EXPECT_FALSE(simpdiscover::DecodeBeacon(packet, &frame));
}

TEST(FrameCodecTest, RejectUndersizedPacket) {
  simpdiscover::BeaconFrame frame;
  EXPECT_FALSE(simpdiscover::DecodeBeacon(std::vector<uint8_t>{}, &frame));
  EXPECT_FALSE(simpdiscover::DecodeBeacon(std::vector<uint8_t>{0xBE}, &frame));
  EXPECT_FALSE(simpdiscover::DecodeBeacon(std::vector<uint8_t>{0xBE, 0xEF, 0x00}, &frame));
}

TEST(FrameCodecTest, RejectPlainText) {
  // A bare text announcement is not a beacon.
  const std::vector<uint8_t> packet = {'H', 'e', 'l', 'l', 'o'};
  simpdiscover::BeaconFrame frame;
  EXPECT_FALSE(simpdiscover::DecodeBeacon(packet, &frame));
}

TEST(FrameCodecTest, NullInputsAreRejected) {
  const auto packet = simpdiscover::EncodeBeacon(1, "x");
  EXPECT_FALSE(simpdiscover::DecodeBeacon(packet, nullptr));
  simpdiscover::BeaconFrame frame;
  EXPECT_FALSE(simpdiscover::DecodeBeacon(nullptr, 8, &frame));
  EXPECT_FALSE(simpdiscover::IsBeacon(nullptr, 0));
}
