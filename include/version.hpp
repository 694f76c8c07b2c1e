// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#ifndef NATFORWARD_VERSION_HPP
#define NATFORWARD_VERSION_HPP

#include <string>

namespace natforward {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "The NatForward developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "natforwardd version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace natforward

#endif // NATFORWARD_VERSION_HPP
