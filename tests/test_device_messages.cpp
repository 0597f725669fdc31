#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <chrono>
#include <stdexcept>

#include "data/device_info.hpp"

namespace {

using namespace lanlink::data;
namespace json = boost::json;

DeviceInfo make_info() {
  DeviceInfo info;
  info.alias = "studio-mac";
  info.device_model = "MacBook";
  info.version = "2.1";
  info.device_type = DeviceType::Desktop;
  info.fingerprint = "fp-123";
  info.api_port = 53317;
  info.protocol = "https";
  return info;
}

TEST(DeviceMessagesTest, DeviceInfoWireShape) {
  auto jv = json::value_from(make_info());
  const auto &obj = jv.as_object();
  EXPECT_EQ(obj.at("alias").as_string(), "studio-mac");
  EXPECT_EQ(obj.at("device_model").as_string(), "MacBook");
  EXPECT_EQ(obj.at("device_type").as_string(), "Desktop");
  EXPECT_EQ(obj.at("api_port").to_number<int>(), 53317);
  EXPECT_EQ(obj.at("protocol").as_string(), "https");

  auto back = json::value_to<DeviceInfo>(jv);
  EXPECT_EQ(back.alias, "studio-mac");
  EXPECT_EQ(back.device_type, DeviceType::Desktop);
  EXPECT_EQ(back.api_port, 53317);
}

TEST(DeviceMessagesTest, OptionalFieldsBecomeNull) {
  auto info = make_info();
  info.device_model.reset();
  info.device_type.reset();
  auto jv = json::value_from(info);
  EXPECT_TRUE(jv.as_object().at("device_model").is_null());
  EXPECT_TRUE(jv.as_object().at("device_type").is_null());

  auto back = json::value_to<DeviceInfo>(jv);
  EXPECT_FALSE(back.device_model.has_value());
  EXPECT_FALSE(back.device_type.has_value());
}

TEST(DeviceMessagesTest, RejectsIncompleteOrUnknownValues) {
  EXPECT_THROW(json::value_to<DeviceInfo>(json::parse(R"({"alias":"x"})")),
               std::runtime_error);
  auto jv = json::value_from(make_info());
  jv.as_object()["device_type"] = "Toaster";
  EXPECT_THROW(json::value_to<DeviceInfo>(jv), std::runtime_error);
  jv = json::value_from(make_info());
  jv.as_object()["api_port"] = 70000;
  EXPECT_THROW(json::value_to<DeviceInfo>(jv), std::runtime_error);
}

TEST(DeviceMessagesTest, DeviceTypeNames) {
  for (auto t : {DeviceType::Mobile, DeviceType::Desktop, DeviceType::Web,
                 DeviceType::Headless, DeviceType::Server}) {
    EXPECT_EQ(device_type_from_string(to_string(t)), t);
  }
  EXPECT_FALSE(device_type_from_string("desktop").has_value());
}

TEST(DeviceMessagesTest, MessageUsesEpochSecondsAndEmptyDefaults) {
  DiscoveredDevice dev;
  dev.alias = "phone";
  dev.fingerprint = "fp-9";
  dev.last_seen = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(1'700'000'123'456));
  dev.ips = {"10.0.0.2", "fe80::2"};

  auto msg = DiscoveredDeviceMessage::from_device(dev);
  EXPECT_EQ(msg.last_seen_unix_epoch, 1'700'000'123);
  EXPECT_EQ(msg.device_model, "");
  EXPECT_EQ(msg.device_type, "");

  auto jv = json::value_from(msg);
  const auto &obj = jv.as_object();
  EXPECT_EQ(obj.at("last_seen_unix_epoch").to_number<std::int64_t>(),
            1'700'000'123);
  EXPECT_EQ(obj.at("ips").as_array().size(), 2u);
}

TEST(DeviceMessagesTest, DiscoveredDevicePersistsMilliseconds) {
  DiscoveredDevice dev;
  dev.alias = "phone";
  dev.device_type = DeviceType::Mobile;
  dev.fingerprint = "fp-9";
  dev.last_seen = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(1'700'000'123'456));
  auto jv = json::value_from(dev);
  EXPECT_EQ(jv.as_object().at("last_seen").to_number<std::int64_t>(),
            1'700'000'123'456);
  auto back = json::value_to<DiscoveredDevice>(jv);
  EXPECT_EQ(back.last_seen, dev.last_seen);
  EXPECT_EQ(back.device_type, DeviceType::Mobile);
}

} // namespace
