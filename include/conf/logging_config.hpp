#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lanlink {

struct LoggingConfig {
  std::string log_dir{"logs"};
  std::string log_file{"lanlink"};
  std::string level{"info"};
  std::uint64_t rotation_size{10 * 1024 * 1024};
  bool console{false};

  friend LoggingConfig tag_invoke(const boost::json::value_to_tag<LoggingConfig> &,
                                  const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    const auto &obj = jv.as_object();
    LoggingConfig cfg{};
    if (auto *p = obj.if_contains("log_dir"); p && p->is_string()) {
      cfg.log_dir = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("log_file"); p && p->is_string()) {
      cfg.log_file = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("level"); p && p->is_string()) {
      cfg.level = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("rotation_size")) {
      cfg.rotation_size = boost::json::value_to<std::uint64_t>(*p);
    }
    if (auto *p = obj.if_contains("console")) {
      cfg.console = p->as_bool();
    }
    return cfg;
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const LoggingConfig &cfg) {
    jv = boost::json::object{{"log_dir", cfg.log_dir},
                             {"log_file", cfg.log_file},
                             {"level", cfg.level},
                             {"rotation_size", cfg.rotation_size},
                             {"console", cfg.console}};
  }
};

} // namespace lanlink
