#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lanlink {

struct DiscoveryConfig {
  std::string multicast_group{"224.0.0.167"};
  std::uint16_t port{57863};
  // Local address the listener binds to and joins the group on.
  std::string listen_interface{"0.0.0.0"};
  int announce_interval_seconds{3};
  int retention_seconds{30};
  int multicast_ttl{1};
  bool multicast_loopback{true};

  friend DiscoveryConfig
  tag_invoke(const boost::json::value_to_tag<DiscoveryConfig> &,
             const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("DiscoveryConfig is not an object");
    }
    const auto &obj = jv.as_object();
    DiscoveryConfig cfg{};
    if (auto *p = obj.if_contains("multicast_group")) {
      cfg.multicast_group = p->as_string().c_str();
    }
    if (auto *p = obj.if_contains("port")) {
      auto port = p->to_number<std::int64_t>();
      if (port < 0 || port > 65535) {
        throw std::runtime_error("discovery port out of range");
      }
      cfg.port = static_cast<std::uint16_t>(port);
    }
    if (auto *p = obj.if_contains("listen_interface")) {
      cfg.listen_interface = p->as_string().c_str();
    }
    if (auto *p = obj.if_contains("announce_interval_seconds")) {
      cfg.announce_interval_seconds = p->to_number<int>();
    }
    if (auto *p = obj.if_contains("retention_seconds")) {
      cfg.retention_seconds = p->to_number<int>();
    }
    if (auto *p = obj.if_contains("multicast_ttl")) {
      cfg.multicast_ttl = p->to_number<int>();
    }
    if (auto *p = obj.if_contains("multicast_loopback")) {
      cfg.multicast_loopback = p->as_bool();
    }
    if (cfg.announce_interval_seconds <= 0 || cfg.retention_seconds <= 0) {
      throw std::runtime_error(
          "announce_interval_seconds and retention_seconds must be positive");
    }
    return cfg;
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const DiscoveryConfig &cfg) {
    jv = boost::json::object{
        {"multicast_group", cfg.multicast_group},
        {"port", cfg.port},
        {"listen_interface", cfg.listen_interface},
        {"announce_interval_seconds", cfg.announce_interval_seconds},
        {"retention_seconds", cfg.retention_seconds},
        {"multicast_ttl", cfg.multicast_ttl},
        {"multicast_loopback", cfg.multicast_loopback}};
  }
};

} // namespace lanlink
