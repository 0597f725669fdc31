#include "discovery/discovery_service.hpp"

#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/json.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <exception>
#include <vector>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

namespace lanlink {
namespace discovery {

namespace net = boost::asio;
namespace json = boost::json;
using udp = net::ip::udp;

namespace {

constexpr std::size_t kMaxDatagram = 64 * 1024;
constexpr auto kReceiveRetryDelay = std::chrono::seconds(1);
constexpr auto kShutdownWait = std::chrono::seconds(2);

monad::Error address_error(const std::string &what, const std::string &value,
                           const boost::system::error_code &ec) {
  return monad::make_error(
      my_errors::PROTOCOL::INVALID_ADDRESS,
      fmt::format("Invalid {} '{}': {}", what, value, ec.message()));
}

} // namespace

std::optional<data::DiscoveredDevice>
process_datagram(const char *data, std::size_t size,
                 const net::ip::address &sender,
                 const std::string &own_fingerprint,
                 std::chrono::system_clock::time_point now) {
  boost::system::error_code ec;
  auto jv = json::parse(json::string_view(data, size), ec);
  if (ec) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << fmt::format("Dropping non-JSON datagram from {} ({} bytes)",
                       sender.to_string(), size);
    return std::nullopt;
  }

  data::DeviceInfo info;
  try {
    info = json::value_to<data::DeviceInfo>(jv);
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << fmt::format("Dropping foreign datagram from {}: {}",
                       sender.to_string(), e.what());
    return std::nullopt;
  }

  if (info.fingerprint.empty()) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Dropping announcement without fingerprint from "
        << sender.to_string();
    return std::nullopt;
  }
  if (info.fingerprint == own_fingerprint) {
    return std::nullopt;
  }

  data::DiscoveredDevice device;
  device.alias = std::move(info.alias);
  device.device_model = std::move(info.device_model);
  device.device_type = info.device_type;
  device.fingerprint = std::move(info.fingerprint);
  device.last_seen = now;
  device.ips.push_back(sender.to_string());
  return device;
}

// Background loop owned by the service. All socket and timer work happens on
// the session's strand.
class DiscoveryService::Session
    : public std::enable_shared_from_this<DiscoveryService::Session> {
public:
  Session(DiscoveryService &owner, CancellationToken token, DoneCallback done)
      : owner_(owner), strand_(net::make_strand(owner.ioc_)),
        token_(std::move(token)), done_(std::move(done)) {}
  virtual ~Session() = default;

  void attach(SessionId id) {
    id_ = id;
    std::weak_ptr<Session> weak = shared_from_this();
    registration_ = token_.on_cancel([weak]() {
      if (auto self = weak.lock()) {
        self->stop();
      }
    });
  }

  void start() {
    net::post(strand_, [self = shared_from_this()]() { self->run(); });
  }

  void stop() {
    net::post(strand_, [self = shared_from_this()]() {
      self->stopping_ = true;
      self->close();
    });
  }

protected:
  virtual void run() = 0;
  virtual void close() = 0;

  bool should_stop() const { return stopping_ || token_.is_cancelled(); }

  void finish() {
    if (finished_.exchange(true)) {
      return;
    }
    auto self = shared_from_this();
    close();
    token_.remove_callback(registration_);
    if (done_) {
      done_();
    }
    owner_.on_session_finished(id_);
  }

  DiscoveryService &owner_;
  net::strand<net::io_context::executor_type> strand_;
  CancellationToken token_;

private:
  DoneCallback done_;
  SessionId id_{0};
  CancellationToken::CallbackId registration_{0};
  bool stopping_{false};
  std::atomic<bool> finished_{false};
};

class DiscoveryService::AnnounceSession : public DiscoveryService::Session {
public:
  AnnounceSession(DiscoveryService &owner, data::DeviceInfo info,
                  std::chrono::milliseconds interval,
                  std::optional<std::chrono::milliseconds> duration,
                  CancellationToken token, DoneCallback done)
      : Session(owner, std::move(token), std::move(done)),
        info_(std::move(info)), interval_(interval), duration_(duration),
        started_(std::chrono::steady_clock::now()), timer_(strand_) {}

protected:
  void run() override {
    if (should_stop()) {
      finish();
      return;
    }
    if (auto r = owner_.announce(info_); r.is_err()) {
      // Transient: the next tick is the retry.
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << "Broadcast error: " << r.error().what;
    }
    schedule_next();
  }

  void close() override { timer_.cancel(); }

private:
  void schedule_next() {
    auto wait = interval_;
    if (duration_) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started_);
      if (elapsed >= *duration_) {
        finish();
        return;
      }
      wait = std::min(wait, *duration_ - elapsed);
    }
    timer_.expires_after(wait);
    timer_.async_wait([self = std::static_pointer_cast<AnnounceSession>(
                           shared_from_this())](
                          const boost::system::error_code &ec) {
      if (ec || self->should_stop() || self->deadline_reached()) {
        self->finish();
        return;
      }
      self->run();
    });
  }

  bool deadline_reached() const {
    return duration_ &&
           std::chrono::steady_clock::now() - started_ >= *duration_;
  }

  data::DeviceInfo info_;
  std::chrono::milliseconds interval_;
  std::optional<std::chrono::milliseconds> duration_;
  std::chrono::steady_clock::time_point started_;
  net::steady_timer timer_;
};

class DiscoveryService::ListenSession : public DiscoveryService::Session {
public:
  ListenSession(DiscoveryService &owner, std::string own_fingerprint,
                CancellationToken token, DeviceCallback on_device,
                DoneCallback done)
      : Session(owner, std::move(token), std::move(done)),
        own_fingerprint_(std::move(own_fingerprint)),
        on_device_(std::move(on_device)), socket_(strand_),
        retry_timer_(strand_) {}

  monad::MyResult<std::uint16_t> bind(const DiscoveryConfig &config) {
    using R = monad::MyResult<std::uint16_t>;
    boost::system::error_code ec;
    auto local = net::ip::make_address(config.listen_interface, ec);
    if (ec) {
      return R::Err(address_error("listen interface", config.listen_interface,
                                  ec));
    }
    auto group = net::ip::make_address(config.multicast_group, ec);
    if (ec) {
      return R::Err(
          address_error("multicast group", config.multicast_group, ec));
    }

    // Multicast traffic is addressed to the group, so the socket binds the
    // wildcard address and joins on the configured interface.
    net::ip::address bind_address = local;
    if (group.is_multicast()) {
      bind_address = group.is_v6() ? net::ip::address(net::ip::address_v6::any())
                                   : net::ip::address(net::ip::address_v4::any());
    }
    udp::endpoint endpoint(bind_address, config.port);

    socket_.open(endpoint.protocol(), ec);
    if (!ec) {
      socket_.set_option(udp::socket::reuse_address(true), ec);
    }
    if (!ec) {
      socket_.bind(endpoint, ec);
    }
    if (ec) {
      boost::system::error_code ignored;
      socket_.close(ignored);
      return R::Err(monad::make_error(
          my_errors::PROTOCOL::BIND_FAILED,
          fmt::format("Failed to bind discovery listener on {}:{}: {}",
                      bind_address.to_string(), config.port, ec.message())));
    }

    if (group.is_multicast()) {
      if (group.is_v4()) {
        auto iface = local.is_v4() ? local.to_v4() : net::ip::address_v4::any();
        socket_.set_option(net::ip::multicast::join_group(group.to_v4(), iface),
                           ec);
      } else {
        socket_.set_option(net::ip::multicast::join_group(group.to_v6()), ec);
      }
      if (ec) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        return R::Err(monad::make_error(
            my_errors::PROTOCOL::MULTICAST_JOIN_FAILED,
            fmt::format("Failed to join {} on {}: {}", config.multicast_group,
                        config.listen_interface, ec.message())));
      }
    }

    auto bound = socket_.local_endpoint(ec);
    if (ec) {
      boost::system::error_code ignored;
      socket_.close(ignored);
      return R::Err(monad::make_error(my_errors::PROTOCOL::BIND_FAILED,
                                      ec.message()));
    }
    return R::Ok(bound.port());
  }

  // For a session that never started.
  void discard() {
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

protected:
  void run() override { do_receive(); }

  void close() override {
    retry_timer_.cancel();
    if (socket_.is_open()) {
      boost::system::error_code ec;
      socket_.close(ec);
      if (ec) {
        BOOST_LOG_SEV(app_logger(), trivial::debug)
            << "Closing discovery socket: " << ec.message();
      }
    }
  }

private:
  void do_receive() {
    if (should_stop() || !socket_.is_open()) {
      finish();
      return;
    }
    socket_.async_receive_from(
        net::buffer(buffer_), sender_,
        [self = std::static_pointer_cast<ListenSession>(shared_from_this())](
            const boost::system::error_code &ec, std::size_t bytes) {
          self->on_receive(ec, bytes);
        });
  }

  void on_receive(const boost::system::error_code &ec, std::size_t bytes) {
    if (should_stop() || ec == net::error::operation_aborted ||
        !socket_.is_open()) {
      finish();
      return;
    }
    if (ec) {
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << "Discovery receive failed: " << ec.message();
      retry_timer_.expires_after(kReceiveRetryDelay);
      retry_timer_.async_wait(
          [self = std::static_pointer_cast<ListenSession>(shared_from_this())](
              const boost::system::error_code &) { self->do_receive(); });
      return;
    }

    auto device =
        process_datagram(buffer_.data(), bytes, sender_.address(),
                         own_fingerprint_, std::chrono::system_clock::now());
    if (device && on_device_) {
      BOOST_LOG_SEV(app_logger(), trivial::trace)
          << fmt::format("Discovered {} ({}) at {}", device->alias,
                         device->fingerprint, sender_.address().to_string());
      on_device_(std::move(*device));
    }
    do_receive();
  }

  std::string own_fingerprint_;
  DeviceCallback on_device_;
  udp::socket socket_;
  net::steady_timer retry_timer_;
  udp::endpoint sender_;
  std::array<char, kMaxDatagram> buffer_{};
};

DiscoveryService::DiscoveryService(net::io_context &ioc, DiscoveryConfig config)
    : ioc_(ioc), config_(std::move(config)) {}

DiscoveryService::~DiscoveryService() {
  shutdown();
  // Sessions hold a reference to this service and to the callbacks' targets.
  std::unique_lock lock(sessions_mutex_);
  sessions_cv_.wait(lock, [this]() { return sessions_.empty(); });
}

monad::MyVoidResult DiscoveryService::announce(const data::DeviceInfo &info) {
  boost::system::error_code ec;
  auto group = net::ip::make_address(config_.multicast_group, ec);
  if (ec) {
    return monad::MyVoidResult::Err(
        address_error("multicast group", config_.multicast_group, ec));
  }

  std::string payload = json::serialize(json::value_from(info));
  if (payload.size() > kMaxDatagram) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::PROTOCOL::SEND_FAILED,
        fmt::format("Announcement of {} bytes exceeds a datagram",
                    payload.size())));
  }

  udp::socket socket(ioc_);
  socket.open(group.is_v6() ? udp::v6() : udp::v4(), ec);
  if (!ec && group.is_multicast()) {
    socket.set_option(net::ip::multicast::hops(config_.multicast_ttl), ec);
    if (!ec) {
      socket.set_option(
          net::ip::multicast::enable_loopback(config_.multicast_loopback), ec);
    }
    if (!ec && group.is_v4()) {
      boost::system::error_code iface_ec;
      auto iface = net::ip::make_address(config_.listen_interface, iface_ec);
      if (!iface_ec && iface.is_v4() && !iface.is_unspecified()) {
        socket.set_option(
            net::ip::multicast::outbound_interface(iface.to_v4()), ec);
      }
    }
  }
  if (!ec) {
    socket.send_to(net::buffer(payload), udp::endpoint(group, config_.port), 0,
                   ec);
  }
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::PROTOCOL::SEND_FAILED,
        fmt::format("Failed to announce to {}:{}: {}", config_.multicast_group,
                    config_.port, ec.message())));
  }
  BOOST_LOG_SEV(app_logger(), trivial::trace)
      << fmt::format("Announced {} to {}:{}", info.alias,
                     config_.multicast_group, config_.port);
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult DiscoveryService::start_announcing(
    const data::DeviceInfo &info, std::chrono::milliseconds interval,
    std::optional<std::chrono::milliseconds> duration, CancellationToken token,
    DoneCallback on_done) {
  if (interval <= std::chrono::milliseconds::zero()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        "Announce interval must be positive"));
  }
  auto session = std::make_shared<AnnounceSession>(
      *this, info, interval, duration, token, std::move(on_done));
  SessionId id = 0;
  if (auto r = register_session(session, id); r.is_err()) {
    return r;
  }
  session->attach(id);
  session->start();
  return monad::MyVoidResult::Ok();
}

monad::MyResult<std::uint16_t>
DiscoveryService::listen(const data::DeviceInfo &self, CancellationToken token,
                         DeviceCallback on_device, DoneCallback on_stopped) {
  using R = monad::MyResult<std::uint16_t>;
  auto session = std::make_shared<ListenSession>(
      *this, self.fingerprint, token, std::move(on_device),
      std::move(on_stopped));
  auto port = session->bind(config_);
  if (port.is_err()) {
    BOOST_LOG_SEV(app_logger(), trivial::error) << port.error().what;
    return port;
  }
  SessionId id = 0;
  if (auto r = register_session(session, id); r.is_err()) {
    session->discard();
    return R::Err(std::move(r).error());
  }
  session->attach(id);
  session->start();
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << fmt::format("Listening for announcements on port {} (group {})",
                     port.value(), config_.multicast_group);
  return port;
}

monad::MyVoidResult
DiscoveryService::register_session(const std::shared_ptr<Session> &s,
                                   SessionId &id) {
  std::lock_guard lock(sessions_mutex_);
  if (shut_down_) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::PROTOCOL::CANCELLED, "Discovery service is shut down"));
  }
  id = ++next_session_id_;
  sessions_.emplace(id, s);
  return monad::MyVoidResult::Ok();
}

void DiscoveryService::on_session_finished(SessionId id) {
  std::lock_guard lock(sessions_mutex_);
  sessions_.erase(id);
  sessions_cv_.notify_all();
}

void DiscoveryService::shutdown() {
  std::vector<std::shared_ptr<Session>> live;
  {
    std::lock_guard lock(sessions_mutex_);
    shut_down_ = true;
    for (auto &[id, session] : sessions_) {
      live.push_back(session);
    }
  }
  for (auto &session : live) {
    session->stop();
  }
  live.clear();

  std::unique_lock lock(sessions_mutex_);
  if (!sessions_cv_.wait_for(lock, kShutdownWait,
                             [this]() { return sessions_.empty(); })) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << fmt::format("{} discovery loops still running after shutdown",
                       sessions_.size());
  }
}

} // namespace discovery
} // namespace lanlink
