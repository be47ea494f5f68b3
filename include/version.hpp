// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace svcnet {

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
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Label attached to every container this tool launches
// Format: svcnet/1.0.0
inline std::string GetContainerLabel() {
  return "svcnet/" + GetVersionString();
}

// Full version info for display
inline std::string GetFullVersionString() {
  return "svcnet version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[1;32m";
} // namespace colors

// Startup banner
inline std::string GetStartupBanner(size_t service_count) {
  std::string banner;
  banner += colors::GREEN;
  banner += "svcnet " + GetVersionString();
  banner += colors::RESET;
  banner += " - starting test network with " + std::to_string(service_count) +
            " service(s)\n";
  return banner;
}

} // namespace svcnet
