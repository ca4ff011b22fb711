// Copyright (c) 2025 <Your Name>
/**
 * @file network_interface.hpp
 * @brief IPv4 interface enumeration and PTP interface selection.
 */
#pragma once

#include <string>
#include <vector>

namespace dantetime {
namespace platform {

/** One IPv4 address bound to a network interface. */
struct NetworkInterface {
  std::string name;     ///< Kernel name, e.g. "eth0"
  std::string address;  ///< Dotted IPv4 address
  bool up = false;
  bool loopback = false;
};

/**
 * @brief List IPv4 addresses of all interfaces (getifaddrs).
 * @return false with *err set if the kernel query fails.
 */
bool ListInterfaces(std::vector<NetworkInterface>* out, std::string* err);

/**
 * @brief Pick the interface to listen for PTP on.
 *
 * With a non-empty preferred name only that interface qualifies (it must
 * be up and carry an IPv4 address). Otherwise the first up, non-loopback
 * entry whose name does not look wireless ("wlan", "wifi", "wireless") wins,
 * falling back to the first wireless one.
 *
 * @return false if nothing qualifies.
 */
bool SelectInterface(const std::vector<NetworkInterface>& candidates,
                     const std::string& preferred, NetworkInterface* out);

}  // namespace platform
}  // namespace dantetime
