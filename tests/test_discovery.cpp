// Tests for discovery response parsing and broadcast collection.
#include "fake_device.h"
#include "orvibo/test_hooks.h"

#include <gtest/gtest.h>

namespace {

const orvibo::Identity kIdentity = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06};

}  // namespace

TEST(DiscoveryParsingTest, ParsesIrdaResponse) {
  const auto response = tests::DiscoveryResponse(kIdentity, "IRD005");
  orvibo::DeviceRecord record;
  ASSERT_TRUE(orvibo::test::ParseDiscoveryResponse(response, false, &record));
  EXPECT_EQ(record.identity, kIdentity);
  EXPECT_EQ(record.kind, orvibo::DeviceKind::kIrda);
}

TEST(DiscoveryParsingTest, ParsesSwitchResponse) {
  const auto response = tests::DiscoveryResponse(kIdentity, "SOC002");
  orvibo::DeviceRecord record;
  ASSERT_TRUE(orvibo::test::ParseDiscoveryResponse(response, false, &record));
  EXPECT_EQ(record.kind, orvibo::DeviceKind::kSwitch);
}

TEST(DiscoveryParsingTest, UnknownTagKeepsIdentity) {
  const auto response = tests::DiscoveryResponse(kIdentity, "XYZ001");
  orvibo::DeviceRecord record;
  ASSERT_TRUE(orvibo::test::ParseDiscoveryResponse(response, true, &record));
  EXPECT_EQ(record.identity, kIdentity);
  EXPECT_EQ(record.kind, orvibo::DeviceKind::kUnknown);
}

TEST(DiscoveryParsingTest, RejectsGhostResponse) {
  const auto response = orvibo::EncodeFrame(orvibo::Command::kDiscover, {orvibo::Bytes{0x00, 0x01}});
  orvibo::DeviceRecord record;
  EXPECT_FALSE(orvibo::test::ParseDiscoveryResponse(response, true, &record));
  EXPECT_FALSE(orvibo::test::ParseDiscoveryResponse(
      orvibo::EncodeFrame(orvibo::Command::kDiscover), true, &record));
}

TEST(DiscoveryParsingTest, TagScanOnlyWhenEnabled) {
  // Tag placed after extra bytes, away from its fixed offset.
  const auto response = orvibo::EncodeFrame(
      orvibo::Command::kDiscover,
      {orvibo::Bytes{0x00}, tests::IdentityBytes(kIdentity), orvibo::Bytes(30, 0x00),
       tests::ToBytes("IRD005")});
  orvibo::DeviceRecord record;
  ASSERT_TRUE(orvibo::test::ParseDiscoveryResponse(response, false, &record));
  EXPECT_EQ(record.kind, orvibo::DeviceKind::kUnknown);
  ASSERT_TRUE(orvibo::test::ParseDiscoveryResponse(response, true, &record));
  EXPECT_EQ(record.kind, orvibo::DeviceKind::kIrda);
}

TEST(DiscoveryTest, CollectsRespondingDevice) {
  tests::FakeDevice device([](const orvibo::Bytes&) {
    return std::vector<tests::FakeDevice::Reply>{
        {tests::DiscoveryResponse(kIdentity, "IRD005")}};
  });
  const orvibo::Config config = tests::LoopbackConfig(device.port());

  orvibo::TransportMetrics metrics;
  const auto devices = orvibo::DiscoverAll(config, &metrics);
  ASSERT_EQ(devices.size(), 1u);
  const auto& record = devices.at("127.0.0.1");
  EXPECT_EQ(record.address, "127.0.0.1");
  EXPECT_EQ(record.identity, kIdentity);
  EXPECT_EQ(record.kind, orvibo::DeviceKind::kIrda);
  EXPECT_EQ(metrics.frames_sent, 1u);

  const auto requests = device.ReceivedWith(orvibo::Command::kDiscover);
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].data, orvibo::EncodeFrame(orvibo::Command::kDiscover));
}

TEST(DiscoveryTest, GhostAndMalformedRepliesAreFiltered) {
  tests::FakeDevice device([](const orvibo::Bytes&) {
    auto malformed = tests::DiscoveryResponse(kIdentity, "IRD005");
    malformed[3] = 0x01;
    return std::vector<tests::FakeDevice::Reply>{
        {orvibo::EncodeFrame(orvibo::Command::kDiscover, {orvibo::Bytes{0x00}})},
        {malformed},
    };
  });
  const orvibo::Config config = tests::LoopbackConfig(device.port());

  orvibo::TransportMetrics metrics;
  EXPECT_TRUE(orvibo::DiscoverAll(config, &metrics).empty());
  EXPECT_EQ(metrics.malformed_frames, 1u);
}

TEST(DiscoveryTest, DiscoverDeviceFindsAddress) {
  tests::FakeDevice device([](const orvibo::Bytes&) {
    return std::vector<tests::FakeDevice::Reply>{
        {tests::DiscoveryResponse(kIdentity, "SOC002")}};
  });
  const orvibo::Config config = tests::LoopbackConfig(device.port());

  const orvibo::DeviceRecord record = orvibo::DiscoverDevice("127.0.0.1", config);
  EXPECT_EQ(record.kind, orvibo::DeviceKind::kSwitch);

  EXPECT_THROW(orvibo::DiscoverDevice("127.0.0.2", config), orvibo::DeviceNotFoundError);
}

TEST(DiscoveryTest, FromAddressResolvesIdentityAndKind) {
  tests::FakeDevice device([](const orvibo::Bytes&) {
    return std::vector<tests::FakeDevice::Reply>{
        {tests::DiscoveryResponse(kIdentity, "IRD005")}};
  });
  orvibo::Device resolved =
      orvibo::Device::FromAddress("127.0.0.1", tests::LoopbackConfig(device.port()));
  EXPECT_EQ(resolved.identity(), kIdentity);
  EXPECT_EQ(resolved.kind(), orvibo::DeviceKind::kIrda);
  EXPECT_EQ(resolved.ToString(), "Orvibo[type=irda, ip=127.0.0.1, mac=010203040506]");
}

TEST(DiscoveryTest, SilentNetworkYieldsNothing) {
  tests::FakeDevice device([](const orvibo::Bytes&) {
    return std::vector<tests::FakeDevice::Reply>{};
  });
  const orvibo::Config config = tests::LoopbackConfig(device.port());
  EXPECT_TRUE(orvibo::DiscoverAll(config).empty());
  EXPECT_THROW(orvibo::DiscoverDevice("127.0.0.1", config), orvibo::DeviceNotFoundError);
}
