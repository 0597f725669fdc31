#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "discovery/discovery_service.hpp"
#include "my_error_codes.hpp"

namespace testinfra {

using lanlink::CancellationToken;
using lanlink::data::DeviceInfo;
using lanlink::data::DiscoveredDevice;
using lanlink::discovery::DeviceCallback;
using lanlink::discovery::DoneCallback;

// In-memory IDiscoveryService. Loops end synchronously, on the thread that
// cancels their token or calls complete_announcers(), and discovered devices
// are injected with deliver().
class FakeDiscoveryService : public lanlink::discovery::IDiscoveryService {
public:
  struct AnnounceCall {
    DeviceInfo info;
    std::chrono::milliseconds interval;
    std::optional<std::chrono::milliseconds> duration;
  };

  monad::MyVoidResult announce(const DeviceInfo &info) override {
    std::lock_guard lock(mutex_);
    announced.push_back(info);
    return monad::MyVoidResult::Ok();
  }

  monad::MyVoidResult
  start_announcing(const DeviceInfo &info, std::chrono::milliseconds interval,
                   std::optional<std::chrono::milliseconds> duration,
                   CancellationToken token, DoneCallback on_done) override {
    auto loop = std::make_shared<AnnounceLoop>();
    loop->token = token;
    loop->on_done = std::move(on_done);
    {
      std::lock_guard lock(mutex_);
      if (fail_announcing) {
        return monad::MyVoidResult::Err(monad::make_error(
            my_errors::PROTOCOL::SEND_FAILED, "announce refused"));
      }
      announce_calls.push_back(AnnounceCall{info, interval, duration});
      loops_.push_back(loop);
    }
    std::weak_ptr<AnnounceLoop> weak = loop;
    loop->callback_id = token.on_cancel([this, weak]() {
      auto l = weak.lock();
      if (!l) {
        return;
      }
      {
        std::lock_guard lock(mutex_);
        if (hold_cancelled_announcers) {
          held_.push_back(l);
          return;
        }
      }
      finish(l);
    });
    return monad::MyVoidResult::Ok();
  }

  monad::MyResult<std::uint16_t> listen(const DeviceInfo &,
                                        CancellationToken token,
                                        DeviceCallback on_device,
                                        DoneCallback on_stopped) override {
    using R = monad::MyResult<std::uint16_t>;
    {
      std::lock_guard lock(mutex_);
      if (fail_listen) {
        return R::Err(monad::make_error(my_errors::PROTOCOL::BIND_FAILED,
                                        "port in use"));
      }
      ++listen_calls;
      ++live_listeners;
      on_device_ = on_device;
    }
    token.on_cancel([this, on_stopped]() {
      {
        std::lock_guard lock(mutex_);
        --live_listeners;
        on_device_ = nullptr;
      }
      if (on_stopped) {
        on_stopped();
      }
    });
    return R::Ok(port);
  }

  void shutdown() override {
    std::lock_guard lock(mutex_);
    ++shutdown_calls;
  }

  // Hand a device to the current listener, if any.
  bool deliver(DiscoveredDevice device) {
    DeviceCallback cb;
    {
      std::lock_guard lock(mutex_);
      cb = on_device_;
    }
    if (!cb) {
      return false;
    }
    cb(std::move(device));
    return true;
  }

  // End every running announce loop as if its duration had elapsed.
  void complete_announcers() {
    std::vector<std::shared_ptr<AnnounceLoop>> running;
    {
      std::lock_guard lock(mutex_);
      running = loops_;
    }
    for (auto &l : running) {
      l->token.remove_callback(l->callback_id);
      finish(l);
    }
  }

  // Report completion of loops whose cancellation was held back.
  void release_held_announcers() {
    std::vector<std::shared_ptr<AnnounceLoop>> held;
    {
      std::lock_guard lock(mutex_);
      held.swap(held_);
    }
    for (auto &l : held) {
      finish(l);
    }
  }

  int held_announcer_count() {
    std::lock_guard lock(mutex_);
    return static_cast<int>(held_.size());
  }

  int live_announcer_count() {
    std::lock_guard lock(mutex_);
    return static_cast<int>(loops_.size());
  }
  int live_listener_count() {
    std::lock_guard lock(mutex_);
    return live_listeners;
  }

  bool fail_announcing{false};
  // When set, a cancelled announce loop does not report completion until
  // release_held_announcers().
  bool hold_cancelled_announcers{false};
  bool fail_listen{false};
  std::uint16_t port{40000};
  std::vector<DeviceInfo> announced;
  std::vector<AnnounceCall> announce_calls;
  int listen_calls{0};
  int shutdown_calls{0};

private:
  struct AnnounceLoop {
    CancellationToken token;
    CancellationToken::CallbackId callback_id{0};
    DoneCallback on_done;
  };

  void finish(const std::shared_ptr<AnnounceLoop> &loop) {
    {
      std::lock_guard lock(mutex_);
      auto it = std::find(loops_.begin(), loops_.end(), loop);
      if (it == loops_.end()) {
        return;
      }
      loops_.erase(it);
    }
    if (loop->on_done) {
      loop->on_done();
    }
  }

  std::mutex mutex_;
  DeviceCallback on_device_;
  std::vector<std::shared_ptr<AnnounceLoop>> loops_;
  std::vector<std::shared_ptr<AnnounceLoop>> held_;
  int live_listeners{0};
};

} // namespace testinfra
