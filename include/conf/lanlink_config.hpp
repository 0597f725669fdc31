#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

#include "conf/discovery_config.hpp"
#include "conf/logging_config.hpp"
#include "result_monad.hpp"

namespace lanlink {
namespace fs = std::filesystem;

inline constexpr const char kApplicationJson[] = "application.json";
inline constexpr const char kApplicationOverrideJson[] =
    "application.override.json";

struct LanlinkConfig {
  // Holds .known-clients and .discovered.
  fs::path base_dir{};
  std::string alias{};
  std::string device_model{"lanlink"};
  std::string device_type{"Desktop"};
  std::string version{"0.1.0"};
  std::uint16_t api_port{7863};
  std::string protocol{"http"};
  // PEM certificate whose public key identifies this node.
  fs::path certificate_file{};
  // Roots for chain validation. Both empty means the system default paths.
  fs::path trust_anchor_file{};
  fs::path trust_anchor_dir{};
  int io_threads{2};
  DiscoveryConfig discovery{};
  LoggingConfig logging{};

  friend LanlinkConfig tag_invoke(const boost::json::value_to_tag<LanlinkConfig> &,
                                  const boost::json::value &jv);
};

struct DefaultPaths {
  fs::path config_dir;
  fs::path base_dir;
};

// Environment precedence (highest first):
// 1. LANLINK_CONFIG_DIR / LANLINK_BASE_DIR, each overriding its own path
// 2. XDG_CONFIG_HOME / XDG_DATA_HOME with a "lanlink" subdirectory
// 3. ~/.config/lanlink and ~/.local/share/lanlink
DefaultPaths resolve_default_paths();

// Deep merge: objects are merged key by key, anything else is replaced.
void merge_json(boost::json::object &target, const boost::json::object &source);

class ILanlinkConfigProvider {
public:
  virtual ~ILanlinkConfigProvider() = default;

  virtual const LanlinkConfig &get() const = 0;
  virtual LanlinkConfig &get() = 0;

  // Merge `content` into the override file.
  virtual monad::MyVoidResult save(const boost::json::object &content) = 0;
};

// Reads `<config_dir>/application.json` (defaults when absent) and merges
// `application.override.json` over it. Throws std::runtime_error when either
// file is not a valid configuration.
class LanlinkConfigProviderFile : public ILanlinkConfigProvider {
public:
  LanlinkConfigProviderFile(const fs::path &config_dir,
                            const fs::path &default_base_dir);

  const LanlinkConfig &get() const override { return config_; }
  LanlinkConfig &get() override { return config_; }

  monad::MyVoidResult save(const boost::json::object &content) override;

private:
  fs::path config_dir_;
  LanlinkConfig config_;
};

} // namespace lanlink
