#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>

#include "conf/discovery_config.hpp"
#include "data/device_info.hpp"
#include "discovery/discovery_service.hpp"
#include "result_monad.hpp"
#include "state/discovery_store.hpp"
#include "util/cancellation_token.hpp"

namespace lanlink {
namespace discovery {

// Announce and listen bound to a persistent DiscoveryStore. One cancellation
// token covers every loop started here.
class DiscoveryRuntime {
public:
  // Creates `base_dir` if needed and loads `<base>/.discovered`.
  static monad::MyResult<std::unique_ptr<DiscoveryRuntime>>
  create(boost::asio::io_context &ioc, const DiscoveryConfig &config,
         const std::filesystem::path &base_dir);

  static monad::MyResult<std::unique_ptr<DiscoveryRuntime>>
  create(std::unique_ptr<IDiscoveryService> service,
         std::unique_ptr<state::DiscoveryStore> store);

  ~DiscoveryRuntime();

  DiscoveryRuntime(const DiscoveryRuntime &) = delete;
  DiscoveryRuntime &operator=(const DiscoveryRuntime &) = delete;

  // Start the listener (its bind error is returned) and the periodic
  // announcement of `info`.
  monad::MyVoidResult start_service(const data::DeviceInfo &info,
                                    std::chrono::milliseconds interval);

  // Cancel the token, stop the service, then flush the store. Idempotent.
  void shutdown();

  state::DiscoveryStore &store() { return *store_; }
  std::vector<data::DiscoveredDevice> get_devices() const {
    return store_->get_devices();
  }

private:
  DiscoveryRuntime(std::unique_ptr<IDiscoveryService> service,
                   std::unique_ptr<state::DiscoveryStore> store);

  // Declared first so it outlives any listener callback that reaches it while
  // the service is torn down.
  std::unique_ptr<state::DiscoveryStore> store_;
  std::unique_ptr<IDiscoveryService> service_;
  CancellationToken cancel_token_;
  std::mutex mutex_;
  bool started_{false};
  bool shut_down_{false};
};

} // namespace discovery
} // namespace lanlink
