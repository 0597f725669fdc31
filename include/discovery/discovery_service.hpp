#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "conf/discovery_config.hpp"
#include "data/device_info.hpp"
#include "result_monad.hpp"
#include "util/cancellation_token.hpp"

namespace lanlink {
namespace discovery {

using DeviceCallback = std::function<void(data::DiscoveredDevice)>;
using DoneCallback = std::function<void()>;

// Decode one announcement. Returns nothing for malformed datagrams, foreign
// payloads and the node's own announcement.
std::optional<data::DiscoveredDevice>
process_datagram(const char *data, std::size_t size,
                 const boost::asio::ip::address &sender,
                 const std::string &own_fingerprint,
                 std::chrono::system_clock::time_point now);

class IDiscoveryService {
public:
  virtual ~IDiscoveryService() = default;

  // Send one announcement. Fire-and-forget: success only means the datagram
  // was handed to the network stack.
  virtual monad::MyVoidResult announce(const data::DeviceInfo &info) = 0;

  // Announce now and then every `interval` until `token` is cancelled or
  // `duration` (when set) has elapsed. `on_done` runs exactly once when the
  // loop ends, unless an error is returned.
  virtual monad::MyVoidResult
  start_announcing(const data::DeviceInfo &info,
                   std::chrono::milliseconds interval,
                   std::optional<std::chrono::milliseconds> duration,
                   CancellationToken token, DoneCallback on_done) = 0;

  // Bind the listener synchronously, then receive in the background. Bind and
  // join failures are returned here; the loop itself never stops because of a
  // bad datagram. `on_stopped` runs exactly once after the socket is closed.
  // Returns the bound local port.
  virtual monad::MyResult<std::uint16_t>
  listen(const data::DeviceInfo &self, CancellationToken token,
         DeviceCallback on_device, DoneCallback on_stopped) = 0;

  // Stop every loop started by this service and release the sockets.
  virtual void shutdown() = 0;
};

// UDP multicast implementation on an asio io_context. Handlers run on the
// context's threads; shutdown() must not be called from one of them.
// shutdown() waits a bounded time; the destructor waits for every loop to
// finish, so the io_context must still be running when it is destroyed.
class DiscoveryService : public IDiscoveryService {
public:
  DiscoveryService(boost::asio::io_context &ioc, DiscoveryConfig config);
  ~DiscoveryService() override;

  DiscoveryService(const DiscoveryService &) = delete;
  DiscoveryService &operator=(const DiscoveryService &) = delete;

  monad::MyVoidResult announce(const data::DeviceInfo &info) override;

  monad::MyVoidResult
  start_announcing(const data::DeviceInfo &info,
                   std::chrono::milliseconds interval,
                   std::optional<std::chrono::milliseconds> duration,
                   CancellationToken token, DoneCallback on_done) override;

  monad::MyResult<std::uint16_t> listen(const data::DeviceInfo &self,
                                        CancellationToken token,
                                        DeviceCallback on_device,
                                        DoneCallback on_stopped) override;

  void shutdown() override;

  const DiscoveryConfig &config() const { return config_; }

private:
  class Session;
  class AnnounceSession;
  class ListenSession;

  using SessionId = std::uint64_t;

  monad::MyVoidResult register_session(const std::shared_ptr<Session> &s,
                                       SessionId &id);
  void on_session_finished(SessionId id);

  boost::asio::io_context &ioc_;
  DiscoveryConfig config_;

  std::mutex sessions_mutex_;
  std::condition_variable sessions_cv_;
  std::map<SessionId, std::shared_ptr<Session>> sessions_;
  SessionId next_session_id_{0};
  bool shut_down_{false};
};

} // namespace discovery
} // namespace lanlink
