#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>

#include "data/device_info.hpp"
#include "result_monad.hpp"

namespace lanlink {
namespace state {

inline constexpr const char kDiscoveredFileName[] = ".discovered";

// Recently discovered peers, cached in memory and mirrored to
// `<base>/.discovered`. Staleness is applied lazily: save() persists only the
// fresh subset, prune_expired() also drops stale entries from memory.
class DiscoveryStore {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit DiscoveryStore(
      const std::filesystem::path &base_dir,
      std::chrono::seconds retention = std::chrono::seconds(30),
      Clock clock = [] { return std::chrono::system_clock::now(); });

  // Replace the cache with the file content. A missing file is an empty set.
  monad::MyResult<std::vector<data::DiscoveredDevice>> load();

  monad::MyVoidResult save();

  monad::MyVoidResult prune_expired();

  // Upsert by fingerprint, then save. A failed save is logged, not returned.
  void update_device(data::DiscoveredDevice device);

  std::vector<data::DiscoveredDevice> get_devices() const;

  bool is_stale(const data::DiscoveredDevice &device,
                std::chrono::system_clock::time_point now) const;

  const std::filesystem::path &path() const { return path_; }

private:
  monad::MyVoidResult save_snapshot(std::vector<data::DiscoveredDevice> devices);

  std::filesystem::path path_;
  std::chrono::seconds retention_;
  Clock clock_;
  mutable std::mutex mutex_;
  // Serializes file writes so an older snapshot never overwrites a newer one.
  std::mutex save_mutex_;
  std::vector<data::DiscoveredDevice> devices_;
};

} // namespace state
} // namespace lanlink
