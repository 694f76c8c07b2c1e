// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace natforward {
namespace forwarding {

// Raised when a disposed object is used (lifecycle misuse)
class ObjectDisposedError : public std::logic_error {
public:
  explicit ObjectDisposedError(const std::string &object_name)
      : std::logic_error("Cannot access a disposed object: " + object_name),
        object_name_(object_name) {}

  const std::string &object_name() const { return object_name_; }

private:
  std::string object_name_;
};

} // namespace forwarding
} // namespace natforward
