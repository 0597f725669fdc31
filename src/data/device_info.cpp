#include "data/device_info.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace lanlink {
namespace data {
namespace json = boost::json;

namespace {

const json::object &RequireObject(const json::value &jv, const char *ctx) {
  if (!jv.is_object()) {
    throw std::runtime_error(fmt::format("{} must be an object", ctx));
  }
  return jv.as_object();
}

std::string RequireString(const json::object &obj, const char *key,
                          const char *ctx) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return std::string(p->as_string().c_str());
    }
  }
  throw std::runtime_error(
      fmt::format("{} missing string field '{}'", ctx, key));
}

std::optional<std::string> OptionalString(const json::object &obj,
                                          const char *key, const char *ctx) {
  auto *p = obj.if_contains(key);
  if (!p || p->is_null()) {
    return std::nullopt;
  }
  if (!p->is_string()) {
    throw std::runtime_error(
        fmt::format("{} field '{}' is not a string", ctx, key));
  }
  return std::string(p->as_string().c_str());
}

std::int64_t RequireInt(const json::object &obj, const char *key,
                        const char *ctx) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_int64()) {
      return p->as_int64();
    }
    if (p->is_uint64()) {
      return static_cast<std::int64_t>(p->as_uint64());
    }
  }
  throw std::runtime_error(
      fmt::format("{} missing integer field '{}'", ctx, key));
}

std::optional<DeviceType> OptionalDeviceType(const json::object &obj,
                                             const char *ctx) {
  auto name = OptionalString(obj, "device_type", ctx);
  if (!name) {
    return std::nullopt;
  }
  auto type = device_type_from_string(*name);
  if (!type) {
    throw std::runtime_error(
        fmt::format("{} has unknown device_type '{}'", ctx, *name));
  }
  return type;
}

json::value OptionalToJson(const std::optional<std::string> &v) {
  if (v) {
    return json::value(*v);
  }
  return nullptr;
}

json::value DeviceTypeToJson(const std::optional<DeviceType> &t) {
  if (t) {
    return json::value(to_string(*t));
  }
  return nullptr;
}

} // namespace

std::string to_string(DeviceType type) {
  switch (type) {
  case DeviceType::Mobile:
    return "Mobile";
  case DeviceType::Desktop:
    return "Desktop";
  case DeviceType::Web:
    return "Web";
  case DeviceType::Headless:
    return "Headless";
  case DeviceType::Server:
    return "Server";
  }
  return "Unknown";
}

std::optional<DeviceType> device_type_from_string(const std::string &name) {
  if (name == "Mobile")
    return DeviceType::Mobile;
  if (name == "Desktop")
    return DeviceType::Desktop;
  if (name == "Web")
    return DeviceType::Web;
  if (name == "Headless")
    return DeviceType::Headless;
  if (name == "Server")
    return DeviceType::Server;
  return std::nullopt;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DeviceInfo &info) {
  jv = json::object{{"alias", info.alias},
                    {"device_model", OptionalToJson(info.device_model)},
                    {"version", info.version},
                    {"device_type", DeviceTypeToJson(info.device_type)},
                    {"fingerprint", info.fingerprint},
                    {"api_port", info.api_port},
                    {"protocol", info.protocol}};
}

DeviceInfo tag_invoke(const json::value_to_tag<DeviceInfo> &,
                      const json::value &jv) {
  constexpr const char *ctx = "DeviceInfo";
  const auto &obj = RequireObject(jv, ctx);
  DeviceInfo info;
  info.alias = RequireString(obj, "alias", ctx);
  info.device_model = OptionalString(obj, "device_model", ctx);
  info.version = RequireString(obj, "version", ctx);
  info.device_type = OptionalDeviceType(obj, ctx);
  info.fingerprint = RequireString(obj, "fingerprint", ctx);
  auto port = RequireInt(obj, "api_port", ctx);
  if (port < 0 || port > 65535) {
    throw std::runtime_error(fmt::format("{} api_port out of range", ctx));
  }
  info.api_port = static_cast<std::uint16_t>(port);
  info.protocol = RequireString(obj, "protocol", ctx);
  return info;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DiscoveredDevice &dev) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    dev.last_seen.time_since_epoch())
                    .count();
  json::array ips;
  for (const auto &ip : dev.ips) {
    ips.emplace_back(ip);
  }
  jv = json::object{{"alias", dev.alias},
                    {"device_model", OptionalToJson(dev.device_model)},
                    {"device_type", DeviceTypeToJson(dev.device_type)},
                    {"fingerprint", dev.fingerprint},
                    {"last_seen", millis},
                    {"ips", std::move(ips)}};
}

DiscoveredDevice tag_invoke(const json::value_to_tag<DiscoveredDevice> &,
                            const json::value &jv) {
  constexpr const char *ctx = "DiscoveredDevice";
  const auto &obj = RequireObject(jv, ctx);
  DiscoveredDevice dev;
  dev.alias = RequireString(obj, "alias", ctx);
  dev.device_model = OptionalString(obj, "device_model", ctx);
  dev.device_type = OptionalDeviceType(obj, ctx);
  dev.fingerprint = RequireString(obj, "fingerprint", ctx);
  dev.last_seen = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(RequireInt(obj, "last_seen", ctx)));
  if (auto *p = obj.if_contains("ips"); p && p->is_array()) {
    for (const auto &ip : p->as_array()) {
      if (!ip.is_string()) {
        throw std::runtime_error(
            fmt::format("{} ips entries must be strings", ctx));
      }
      dev.ips.emplace_back(ip.as_string().c_str());
    }
  }
  return dev;
}

DiscoveredDeviceMessage
DiscoveredDeviceMessage::from_device(const DiscoveredDevice &device) {
  DiscoveredDeviceMessage msg;
  msg.alias = device.alias;
  msg.device_model = device.device_model.value_or("");
  msg.device_type = device.device_type ? to_string(*device.device_type) : "";
  msg.fingerprint = device.fingerprint;
  msg.last_seen_unix_epoch =
      std::chrono::duration_cast<std::chrono::seconds>(
          device.last_seen.time_since_epoch())
          .count();
  msg.ips = device.ips;
  return msg;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DiscoveredDeviceMessage &msg) {
  json::array ips;
  for (const auto &ip : msg.ips) {
    ips.emplace_back(ip);
  }
  jv = json::object{{"alias", msg.alias},
                    {"device_model", msg.device_model},
                    {"device_type", msg.device_type},
                    {"fingerprint", msg.fingerprint},
                    {"last_seen_unix_epoch", msg.last_seen_unix_epoch},
                    {"ips", std::move(ips)}};
}

} // namespace data
} // namespace lanlink
