#include "discovery/discovery_runtime.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/file_util.hpp"
#include "util/my_logging.hpp"

namespace lanlink {
namespace discovery {

DiscoveryRuntime::DiscoveryRuntime(
    std::unique_ptr<IDiscoveryService> service,
    std::unique_ptr<state::DiscoveryStore> store)
    : store_(std::move(store)), service_(std::move(service)) {}

DiscoveryRuntime::~DiscoveryRuntime() { shutdown(); }

monad::MyResult<std::unique_ptr<DiscoveryRuntime>>
DiscoveryRuntime::create(boost::asio::io_context &ioc,
                         const DiscoveryConfig &config,
                         const std::filesystem::path &base_dir) {
  using R = monad::MyResult<std::unique_ptr<DiscoveryRuntime>>;
  if (auto r = fileutil::ensure_directory(base_dir); r.is_err()) {
    return R::Err(std::move(r).error());
  }
  return create(std::make_unique<DiscoveryService>(ioc, config),
                std::make_unique<state::DiscoveryStore>(
                    base_dir, std::chrono::seconds(config.retention_seconds)));
}

monad::MyResult<std::unique_ptr<DiscoveryRuntime>>
DiscoveryRuntime::create(std::unique_ptr<IDiscoveryService> service,
                         std::unique_ptr<state::DiscoveryStore> store) {
  using R = monad::MyResult<std::unique_ptr<DiscoveryRuntime>>;
  if (!service || !store) {
    return R::Err(monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                                    "Discovery service and store are required"));
  }
  auto loaded = store->load();
  if (loaded.is_err()) {
    return R::Err(std::move(loaded).error());
  }
  return R::Ok(std::unique_ptr<DiscoveryRuntime>(
      new DiscoveryRuntime(std::move(service), std::move(store))));
}

monad::MyVoidResult
DiscoveryRuntime::start_service(const data::DeviceInfo &info,
                                std::chrono::milliseconds interval) {
  std::lock_guard lock(mutex_);
  if (shut_down_ || started_) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        shut_down_ ? "Discovery runtime is shut down"
                   : "Discovery runtime already started"));
  }
  if (interval <= std::chrono::milliseconds::zero()) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          "Announce interval must be positive"));
  }

  auto *store = store_.get();
  auto bound = service_->listen(
      info, cancel_token_,
      [store](data::DiscoveredDevice device) {
        store->update_device(std::move(device));
      },
      [] {
        BOOST_LOG_SEV(app_logger(), trivial::debug)
            << "Discovery runtime listener stopped";
      });
  if (bound.is_err()) {
    return monad::MyVoidResult::Err(std::move(bound).error());
  }

  auto announcing = service_->start_announcing(
      info, interval, std::nullopt, cancel_token_, [] {
        BOOST_LOG_SEV(app_logger(), trivial::debug)
            << "Discovery runtime announcer stopped";
      });
  if (announcing.is_err()) {
    // The listener of this attempt is gone; later starts get a fresh token.
    cancel_token_.cancel();
    cancel_token_ = CancellationToken{};
    return announcing;
  }
  started_ = true;
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << fmt::format("Discovery runtime started for '{}' on port {}",
                     info.alias, bound.value());
  return monad::MyVoidResult::Ok();
}

void DiscoveryRuntime::shutdown() {
  CancellationToken token;
  {
    std::lock_guard lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    token = cancel_token_;
  }
  token.cancel();
  service_->shutdown();
  if (auto r = store_->save(); r.is_err()) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Failed to save final device state: " << r.error().what;
  }
}

} // namespace discovery
} // namespace lanlink
