#include "conf/lanlink_config.hpp"

#include <boost/asio/ip/host_name.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <exception>
#include <stdexcept>

#include "my_error_codes.hpp"
#include "util/file_util.hpp"

namespace lanlink {
namespace json = boost::json;

namespace {

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

std::string default_alias() {
  boost::system::error_code ec;
  auto host = boost::asio::ip::host_name(ec);
  if (ec || host.empty()) {
    return "lanlink";
  }
  return host;
}

json::object read_json_object(const fs::path &file) {
  auto content = fileutil::read_file_if_exists(file);
  if (content.is_err()) {
    throw std::runtime_error(content.error().what);
  }
  if (!content.value()) {
    return {};
  }
  boost::system::error_code ec;
  auto jv = json::parse(*content.value(), ec);
  if (ec) {
    throw std::runtime_error(fmt::format("Failed to parse {}: {}",
                                         file.string(), ec.message()));
  }
  if (!jv.is_object()) {
    throw std::runtime_error(
        fmt::format("Configuration file is not a JSON object: {}",
                    file.string()));
  }
  return jv.as_object();
}

} // namespace

LanlinkConfig tag_invoke(const json::value_to_tag<LanlinkConfig> &,
                         const json::value &jv) {
  try {
    if (auto *jo_p = jv.if_object()) {
      LanlinkConfig cfg{};
      if (auto *p = jo_p->if_contains("base_dir"))
        cfg.base_dir = fs::path(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("alias"))
        cfg.alias = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("device_model"))
        cfg.device_model = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("device_type"))
        cfg.device_type = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("version"))
        cfg.version = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("api_port")) {
        auto port = p->to_number<std::int64_t>();
        if (port < 0 || port > 65535) {
          throw std::runtime_error("api_port out of range");
        }
        cfg.api_port = static_cast<std::uint16_t>(port);
      }
      if (auto *p = jo_p->if_contains("protocol"))
        cfg.protocol = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("certificate_file"))
        cfg.certificate_file = fs::path(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("trust_anchor_file"))
        cfg.trust_anchor_file = fs::path(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("trust_anchor_dir"))
        cfg.trust_anchor_dir = fs::path(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("io_threads"))
        cfg.io_threads = p->to_number<int>();
      if (auto *p = jo_p->if_contains("discovery"))
        cfg.discovery = json::value_to<DiscoveryConfig>(*p);
      if (auto *p = jo_p->if_contains("logging"))
        cfg.logging = json::value_to<LoggingConfig>(*p);
      return cfg;
    }
    throw std::runtime_error("LanlinkConfig is not an object");
  } catch (const std::exception &e) {
    throw std::runtime_error(
        fmt::format("error in parsing LanlinkConfig: {}", e.what()));
  }
}

DefaultPaths resolve_default_paths() {
  fs::path config_dir = get_env_path("LANLINK_CONFIG_DIR");
  fs::path base_dir = get_env_path("LANLINK_BASE_DIR");

  if (config_dir.empty()) {
    fs::path xdg = get_env_path("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
      config_dir = xdg / "lanlink";
    } else {
      config_dir = get_env_path("HOME") / ".config" / "lanlink";
    }
  }
  if (base_dir.empty()) {
    fs::path xdg = get_env_path("XDG_DATA_HOME");
    if (!xdg.empty()) {
      base_dir = xdg / "lanlink";
    } else {
      base_dir = get_env_path("HOME") / ".local" / "share" / "lanlink";
    }
  }
  return {config_dir, base_dir};
}

void merge_json(json::object &target, const json::object &source) {
  for (const auto &[key, value] : source) {
    auto *existing = target.if_contains(key);
    if (existing && existing->is_object() && value.is_object()) {
      merge_json(existing->as_object(), value.as_object());
    } else {
      target[key] = value;
    }
  }
}

LanlinkConfigProviderFile::LanlinkConfigProviderFile(
    const fs::path &config_dir, const fs::path &default_base_dir)
    : config_dir_(config_dir) {
  json::object merged = read_json_object(config_dir_ / kApplicationJson);
  merge_json(merged, read_json_object(config_dir_ / kApplicationOverrideJson));
  config_ = json::value_to<LanlinkConfig>(json::value(std::move(merged)));

  // LANLINK_BASE_DIR wins over the file.
  fs::path env_base = get_env_path("LANLINK_BASE_DIR");
  if (!env_base.empty()) {
    config_.base_dir = env_base;
  } else if (config_.base_dir.empty()) {
    config_.base_dir = default_base_dir;
  }
  if (config_.alias.empty()) {
    config_.alias = default_alias();
  }
  if (config_.logging.log_dir.empty() ||
      fs::path(config_.logging.log_dir).is_relative()) {
    config_.logging.log_dir =
        (config_.base_dir / config_.logging.log_dir).string();
  }
}

monad::MyVoidResult LanlinkConfigProviderFile::save(const json::object &content) {
  auto f = config_dir_ / kApplicationOverrideJson;
  json::object jo;
  try {
    jo = read_json_object(f);
  } catch (const std::exception &e) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::CONFIG::MALFORMED, e.what()));
  }
  merge_json(jo, content);
  if (auto r = fileutil::ensure_directory(config_dir_); r.is_err()) {
    return r;
  }
  return fileutil::write_file_atomic(f, fileutil::pretty_print(jo));
}

} // namespace lanlink
