#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "data/device_info.hpp"
#include "discovery/broadcaster.hpp"
#include "discovery/discovery_service.hpp"
#include "util/cancellation_token.hpp"

namespace lanlink {
namespace discovery {

// Owns the broadcast and listen loops of one node. Each operation moves
// Idle -> Running -> Idle; starting a running operation stops the old run
// first, so at most one loop of each kind is alive.
//
// start/stop calls wait a bounded time for the replaced loop to end and must
// not be made from the io_context threads that run the discovery service. The
// destructor waits until every loop has reported completion.
class DeviceScanner {
public:
  DeviceScanner(IDiscoveryService &service,
                std::shared_ptr<IBroadcaster> broadcaster,
                std::chrono::milliseconds announce_interval =
                    std::chrono::seconds(3),
                std::chrono::milliseconds stop_wait = std::chrono::seconds(5));
  ~DeviceScanner();

  DeviceScanner(const DeviceScanner &) = delete;
  DeviceScanner &operator=(const DeviceScanner &) = delete;

  monad::MyVoidResult start_broadcast(const data::DeviceInfo &info,
                                      std::chrono::seconds duration);
  void stop_broadcast();
  bool is_broadcasting() const { return is_broadcasting_.load(); }

  monad::MyVoidResult start_listening(const data::DeviceInfo &info);
  void stop_listening();
  bool is_listening() const;

  std::vector<data::DiscoveredDevice> get_devices() const;

  // Number of broadcast loops that have started and not yet finished.
  int active_broadcasts() const;

private:
  void on_device(data::DiscoveredDevice device);
  void on_broadcast_done(std::uint64_t generation);
  void on_listen_stopped(std::uint64_t generation);
  void stop_broadcast_locked();
  void stop_listening_locked();

  IDiscoveryService &service_;
  std::shared_ptr<IBroadcaster> broadcaster_;
  std::chrono::milliseconds announce_interval_;
  std::chrono::milliseconds stop_wait_;

  // Serializes start/stop requests.
  std::mutex control_mutex_;

  mutable std::mutex broadcast_mutex_;
  std::condition_variable broadcast_cv_;
  std::optional<CancellationToken> broadcast_token_;
  std::uint64_t broadcast_generation_{0};
  int active_broadcasts_{0};
  std::atomic<bool> is_broadcasting_{false};

  mutable std::mutex listen_mutex_;
  std::condition_variable listen_cv_;
  std::optional<CancellationToken> listen_token_;
  std::uint64_t listen_generation_{0};
  int active_listeners_{0};

  mutable std::shared_mutex devices_mutex_;
  std::map<std::string, data::DiscoveredDevice> devices_;
};

} // namespace discovery
} // namespace lanlink
