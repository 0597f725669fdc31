#include "discovery/device_scanner.hpp"

#include <fmt/format.h>

#include "util/my_logging.hpp"

namespace lanlink {
namespace discovery {

DeviceScanner::DeviceScanner(IDiscoveryService &service,
                             std::shared_ptr<IBroadcaster> broadcaster,
                             std::chrono::milliseconds announce_interval,
                             std::chrono::milliseconds stop_wait)
    : service_(service), broadcaster_(std::move(broadcaster)),
      announce_interval_(announce_interval), stop_wait_(stop_wait) {}

DeviceScanner::~DeviceScanner() {
  std::lock_guard control(control_mutex_);
  stop_broadcast_locked();
  stop_listening_locked();
  // Loop callbacks capture this; outlast every one of them.
  {
    std::unique_lock lock(broadcast_mutex_);
    broadcast_cv_.wait(lock, [this]() { return active_broadcasts_ == 0; });
  }
  std::unique_lock lock(listen_mutex_);
  listen_cv_.wait(lock, [this]() { return active_listeners_ == 0; });
}

monad::MyVoidResult
DeviceScanner::start_broadcast(const data::DeviceInfo &info,
                               std::chrono::seconds duration) {
  std::lock_guard control(control_mutex_);
  stop_broadcast_locked();

  CancellationToken token;
  std::uint64_t generation = 0;
  {
    std::lock_guard lock(broadcast_mutex_);
    generation = ++broadcast_generation_;
    broadcast_token_ = token;
    ++active_broadcasts_;
    is_broadcasting_.store(true);
  }

  auto started = service_.start_announcing(
      info, announce_interval_,
      std::chrono::duration_cast<std::chrono::milliseconds>(duration), token,
      [this, generation]() { on_broadcast_done(generation); });
  if (started.is_err()) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Failed to start broadcast: " << started.error().what;
    on_broadcast_done(generation);
    return started;
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << fmt::format("Broadcasting as '{}' for {}s", info.alias,
                     duration.count());
  return monad::MyVoidResult::Ok();
}

void DeviceScanner::stop_broadcast() {
  std::lock_guard control(control_mutex_);
  stop_broadcast_locked();
}

void DeviceScanner::stop_broadcast_locked() {
  std::optional<CancellationToken> token;
  {
    std::lock_guard lock(broadcast_mutex_);
    token.swap(broadcast_token_);
  }
  if (!token) {
    return;
  }
  // Cancel outside the lock: the loop's completion callback takes it.
  token->cancel();

  std::unique_lock lock(broadcast_mutex_);
  if (!broadcast_cv_.wait_for(lock, stop_wait_,
                              [this]() { return active_broadcasts_ == 0; })) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "Broadcast loop did not stop in time";
  }
  is_broadcasting_.store(false);
}

void DeviceScanner::on_broadcast_done(std::uint64_t generation) {
  std::lock_guard lock(broadcast_mutex_);
  --active_broadcasts_;
  // A finished older run must not touch the state of a newer one.
  if (generation == broadcast_generation_) {
    broadcast_token_.reset();
    is_broadcasting_.store(false);
  }
  broadcast_cv_.notify_all();
}

int DeviceScanner::active_broadcasts() const {
  std::lock_guard lock(broadcast_mutex_);
  return active_broadcasts_;
}

monad::MyVoidResult DeviceScanner::start_listening(const data::DeviceInfo &info) {
  std::lock_guard control(control_mutex_);
  // Replacing a listener always closes the old socket first.
  stop_listening_locked();

  CancellationToken token;
  std::uint64_t generation = 0;
  {
    std::lock_guard lock(listen_mutex_);
    generation = ++listen_generation_;
    listen_token_ = token;
    ++active_listeners_;
  }

  auto bound = service_.listen(
      info, token,
      [this](data::DiscoveredDevice device) { on_device(std::move(device)); },
      [this, generation]() { on_listen_stopped(generation); });
  if (bound.is_err()) {
    on_listen_stopped(generation);
    return monad::MyVoidResult::Err(std::move(bound).error());
  }
  return monad::MyVoidResult::Ok();
}

void DeviceScanner::stop_listening() {
  std::lock_guard control(control_mutex_);
  stop_listening_locked();
}

void DeviceScanner::stop_listening_locked() {
  std::optional<CancellationToken> token;
  {
    std::lock_guard lock(listen_mutex_);
    token.swap(listen_token_);
  }
  if (!token) {
    return;
  }
  token->cancel();

  std::unique_lock lock(listen_mutex_);
  if (!listen_cv_.wait_for(lock, stop_wait_,
                           [this]() { return active_listeners_ == 0; })) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "Listen loop did not stop in time";
  }
}

void DeviceScanner::on_listen_stopped(std::uint64_t generation) {
  std::lock_guard lock(listen_mutex_);
  --active_listeners_;
  if (generation == listen_generation_) {
    listen_token_.reset();
  }
  listen_cv_.notify_all();
}

bool DeviceScanner::is_listening() const {
  std::lock_guard lock(listen_mutex_);
  return listen_token_.has_value();
}

void DeviceScanner::on_device(data::DiscoveredDevice device) {
  auto message = data::DiscoveredDeviceMessage::from_device(device);
  {
    std::unique_lock lock(devices_mutex_);
    auto key = device.fingerprint;
    devices_.insert_or_assign(std::move(key), std::move(device));
  }
  if (broadcaster_) {
    broadcaster_->broadcast(message);
  }
}

std::vector<data::DiscoveredDevice> DeviceScanner::get_devices() const {
  std::shared_lock lock(devices_mutex_);
  std::vector<data::DiscoveredDevice> out;
  out.reserve(devices_.size());
  for (const auto &[fingerprint, device] : devices_) {
    out.push_back(device);
  }
  return out;
}

} // namespace discovery
} // namespace lanlink
