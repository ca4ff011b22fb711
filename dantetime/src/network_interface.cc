// Copyright (c) 2025 <Your Name>
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "dantetime/platform/network_interface.hpp"

namespace dantetime {
namespace platform {

namespace {
bool LooksWireless(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower.find("wlan") != std::string::npos ||
         lower.find("wifi") != std::string::npos ||
         lower.find("wireless") != std::string::npos;
}
}  // namespace

bool SelectInterface(const std::vector<NetworkInterface>& candidates,
                     const std::string& preferred, NetworkInterface* out) {
  if (!preferred.empty()) {
    for (const auto& c : candidates) {
      if (c.name == preferred && c.up && !c.address.empty()) {
        *out = c;
        return true;
      }
    }
    return false;
  }

  const NetworkInterface* fallback = nullptr;
  for (const auto& c : candidates) {
    if (!c.up || c.loopback || c.address.empty()) continue;
    if (!LooksWireless(c.name)) {
      *out = c;
      return true;
    }
    if (!fallback) fallback = &c;
  }
  if (!fallback) return false;
  *out = *fallback;
  return true;
}

}  // namespace platform
}  // namespace dantetime
