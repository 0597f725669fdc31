#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace lanlink {

// Cooperative cancellation handle. Copies share state: cancelling any copy
// cancels them all. Callbacks run once, on the thread calling cancel(), outside
// the internal lock; a callback registered after cancellation runs immediately.
class CancellationToken {
public:
  using CallbackId = std::uint64_t;

  CancellationToken() : state_(std::make_shared<State>()) {}

  void cancel() {
    std::map<CallbackId, std::function<void()>> callbacks;
    {
      std::lock_guard lock(state_->mutex);
      if (state_->cancelled) {
        return;
      }
      state_->cancelled = true;
      callbacks.swap(state_->callbacks);
    }
    for (auto &[id, cb] : callbacks) {
      cb();
    }
  }

  bool is_cancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  CallbackId on_cancel(std::function<void()> cb) {
    {
      std::lock_guard lock(state_->mutex);
      if (!state_->cancelled) {
        CallbackId id = ++state_->next_id;
        state_->callbacks.emplace(id, std::move(cb));
        return id;
      }
    }
    cb();
    return 0;
  }

  void remove_callback(CallbackId id) {
    std::lock_guard lock(state_->mutex);
    state_->callbacks.erase(id);
  }

private:
  struct State {
    std::mutex mutex;
    bool cancelled{false};
    CallbackId next_id{0};
    std::map<CallbackId, std::function<void()>> callbacks;
  };

  std::shared_ptr<State> state_;
};

} // namespace lanlink
