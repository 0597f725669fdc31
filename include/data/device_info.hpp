#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanlink {
namespace data {

enum class DeviceType { Mobile, Desktop, Web, Headless, Server };

std::string to_string(DeviceType type);
std::optional<DeviceType> device_type_from_string(const std::string &name);

// What the local node advertises about itself. Built once per session.
struct DeviceInfo {
  std::string alias;
  std::optional<std::string> device_model;
  std::string version;
  std::optional<DeviceType> device_type;
  std::string fingerprint;
  std::uint16_t api_port{0};
  std::string protocol{"http"};

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const DeviceInfo &info);
  friend DeviceInfo tag_invoke(const boost::json::value_to_tag<DeviceInfo> &,
                               const boost::json::value &jv);
};

// A peer's most recent announcement. Keyed by fingerprint.
struct DiscoveredDevice {
  std::string alias;
  std::optional<std::string> device_model;
  std::optional<DeviceType> device_type;
  std::string fingerprint;
  std::chrono::system_clock::time_point last_seen{};
  std::vector<std::string> ips;

  // Persisted form: last_seen as unix epoch milliseconds.
  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const DiscoveredDevice &dev);
  friend DiscoveredDevice
  tag_invoke(const boost::json::value_to_tag<DiscoveredDevice> &,
             const boost::json::value &jv);
};

// Outbound notification for one discovery event.
struct DiscoveredDeviceMessage {
  std::string alias;
  std::string device_model;
  std::string device_type;
  std::string fingerprint;
  std::int64_t last_seen_unix_epoch{0};
  std::vector<std::string> ips;

  static DiscoveredDeviceMessage from_device(const DiscoveredDevice &device);

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv,
                         const DiscoveredDeviceMessage &msg);
};

} // namespace data
} // namespace lanlink
