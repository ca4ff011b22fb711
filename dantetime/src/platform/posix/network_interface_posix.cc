// Copyright (c) 2025 <Your Name>
/**
 * @file network_interface_posix.cc
 * @brief getifaddrs() based interface enumeration.
 */
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "dantetime/platform/network_interface.hpp"

namespace dantetime {
namespace platform {

bool ListInterfaces(std::vector<NetworkInterface>* out, std::string* err) {
  ifaddrs* list = nullptr;
  if (getifaddrs(&list) < 0) {
    if (err) {
      int e = errno;
      std::ostringstream oss;
      oss << "getifaddrs failed (errno " << e << ": " << std::strerror(e)
          << ")";
      *err = oss.str();
    }
    return false;
  }

  out->clear();
  for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    char ip[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip)) == nullptr) {
      continue;
    }
    NetworkInterface nic;
    nic.name = it->ifa_name ? it->ifa_name : "";
    nic.address = ip;
    nic.up = (it->ifa_flags & IFF_UP) != 0;
    nic.loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
    out->push_back(nic);
  }
  freeifaddrs(list);
  return true;
}

}  // namespace platform
}  // namespace dantetime
