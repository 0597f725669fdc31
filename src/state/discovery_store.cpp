#include "state/discovery_store.hpp"

#include <boost/json.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <exception>

#include "my_error_codes.hpp"
#include "util/file_util.hpp"
#include "util/my_logging.hpp"

namespace lanlink {
namespace state {
namespace json = boost::json;

DiscoveryStore::DiscoveryStore(const std::filesystem::path &base_dir,
                               std::chrono::seconds retention, Clock clock)
    : path_(base_dir / kDiscoveredFileName), retention_(retention),
      clock_(std::move(clock)) {}

bool DiscoveryStore::is_stale(const data::DiscoveredDevice &device,
                              std::chrono::system_clock::time_point now) const {
  // A timestamp from the future means the clock moved; treat it as expired.
  if (device.last_seen > now) {
    return true;
  }
  return now - device.last_seen >= retention_;
}

monad::MyResult<std::vector<data::DiscoveredDevice>> DiscoveryStore::load() {
  using R = monad::MyResult<std::vector<data::DiscoveredDevice>>;
  auto content = fileutil::read_file_if_exists(path_);
  if (content.is_err()) {
    return R::Err(std::move(content).error());
  }

  std::vector<data::DiscoveredDevice> loaded;
  if (content.value()) {
    try {
      auto jv = json::parse(*content.value());
      loaded = json::value_to<std::vector<data::DiscoveredDevice>>(jv);
    } catch (const std::exception &e) {
      return R::Err(monad::make_error(
          my_errors::PERSISTENCE::SERIALIZATION,
          fmt::format("Failed to deserialize {}: {}", path_.string(),
                      e.what())));
    }
  }

  // One entry per fingerprint; a hand-edited file may repeat one.
  std::vector<data::DiscoveredDevice> unique;
  for (auto &device : loaded) {
    auto it = std::find_if(unique.begin(), unique.end(),
                           [&](const data::DiscoveredDevice &d) {
                             return d.fingerprint == device.fingerprint;
                           });
    if (it == unique.end()) {
      unique.push_back(std::move(device));
    } else if (device.last_seen > it->last_seen) {
      *it = std::move(device);
    }
  }
  loaded = std::move(unique);

  {
    std::lock_guard lock(mutex_);
    devices_ = loaded;
  }
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << fmt::format("Loaded {} discovered devices from {}", loaded.size(),
                     path_.string());
  return R::Ok(std::move(loaded));
}

monad::MyVoidResult DiscoveryStore::save() {
  std::lock_guard save_lock(save_mutex_);
  std::vector<data::DiscoveredDevice> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = devices_;
  }
  return save_snapshot(std::move(snapshot));
}

monad::MyVoidResult
DiscoveryStore::save_snapshot(std::vector<data::DiscoveredDevice> devices) {
  const auto now = clock_();
  json::array fresh;
  for (const auto &device : devices) {
    if (!is_stale(device, now)) {
      fresh.push_back(json::value_from(device));
    }
  }
  BOOST_LOG_SEV(app_logger(), trivial::trace)
      << fmt::format("Saving {} of {} discovered devices", fresh.size(),
                     devices.size());
  return fileutil::write_file_atomic(path_, fileutil::pretty_print(fresh));
}

monad::MyVoidResult DiscoveryStore::prune_expired() {
  std::lock_guard save_lock(save_mutex_);
  std::vector<data::DiscoveredDevice> snapshot;
  {
    std::lock_guard lock(mutex_);
    const auto now = clock_();
    std::erase_if(devices_,
                  [&](const auto &device) { return is_stale(device, now); });
    snapshot = devices_;
  }
  return save_snapshot(std::move(snapshot));
}

void DiscoveryStore::update_device(data::DiscoveredDevice device) {
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const data::DiscoveredDevice &d) {
                             return d.fingerprint == device.fingerprint;
                           });
    if (it != devices_.end()) {
      *it = std::move(device);
    } else {
      devices_.push_back(std::move(device));
    }
  }
  if (auto r = save(); r.is_err()) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "Failed to auto-save device updates: " << r.error().what;
  }
}

std::vector<data::DiscoveredDevice> DiscoveryStore::get_devices() const {
  std::lock_guard lock(mutex_);
  return devices_;
}

} // namespace state
} // namespace lanlink
