// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace natforward {
namespace util {

/**
 * RAII handle for an event subscription.
 *
 * Unsubscribes on destruction. Movable, not copyable. The event source
 * must outlive every subscription handed out by it.
 */
class Subscription {
public:
  using UnsubscribeFn = std::function<void()>;

  Subscription() = default;
  explicit Subscription(UnsubscribeFn unsubscribe);
  ~Subscription();

  Subscription(Subscription &&other) noexcept;
  Subscription &operator=(Subscription &&other) noexcept;

  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  void Unsubscribe();
  bool IsActive() const { return static_cast<bool>(unsubscribe_); }

private:
  UnsubscribeFn unsubscribe_;
};

/**
 * Instance-scoped multicast event.
 *
 * Callbacks are invoked synchronously on the notifying thread, under the
 * source's lock: once Unsubscribe() returns the callback will not run
 * again. A callback must not subscribe to or unsubscribe from the same
 * source it is being invoked by.
 */
template <typename... Args>
class EventSource {
public:
  using Callback = std::function<void(Args...)>;

  EventSource() = default;
  EventSource(const EventSource &) = delete;
  EventSource &operator=(const EventSource &) = delete;

  Subscription Subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t id = next_id_++;
    callbacks_.push_back(CallbackEntry{id, std::move(callback)});
    return Subscription([this, id]() { Unsubscribe(id); });
  }

  void Notify(Args... args) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : callbacks_) {
      if (entry.callback) {
        entry.callback(args...);
      }
    }
  }

  size_t SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
  }

private:
  struct CallbackEntry {
    size_t id;
    Callback callback;
  };

  void Unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
      if (it->id == id) {
        callbacks_.erase(it);
        return;
      }
    }
  }

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{0};
};

} // namespace util
} // namespace natforward
