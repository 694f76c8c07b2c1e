// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "util/event_source.hpp"

namespace natforward {
namespace util {

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(UnsubscribeFn unsubscribe)
    : unsubscribe_(std::move(unsubscribe)) {}

Subscription::~Subscription() { Unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : unsubscribe_(std::move(other.unsubscribe_)) {
  other.unsubscribe_ = nullptr;
}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    unsubscribe_ = std::move(other.unsubscribe_);
    other.unsubscribe_ = nullptr;
  }
  return *this;
}

void Subscription::Unsubscribe() {
  if (unsubscribe_) {
    auto fn = std::move(unsubscribe_);
    unsubscribe_ = nullptr;
    fn();
  }
}

} // namespace util
} // namespace natforward
