// Copyright (c) 2025 <Your Name>
/**
 * @file socket_posix.cc
 * @brief POSIX (Linux) implementation of ISocket interface
 */
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "dantetime/platform/socket_interface.hpp"

namespace dantetime {
namespace platform {

namespace {

bool ParseIpv4(const std::string& dotted, in_addr* out) {
  return inet_pton(AF_INET, dotted.c_str(), out) == 1;
}

Endpoint ToEndpoint(const sockaddr_in& addr) {
  Endpoint ep;
  char ip[INET_ADDRSTRLEN];
  if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) != nullptr) {
    ep.address = ip;
  }
  ep.port = ntohs(addr.sin_port);
  return ep;
}

TimeSpec FromTimespec(const timespec& ts) {
  return TimeSpec(static_cast<int64_t>(ts.tv_sec),
                  static_cast<uint32_t>(ts.tv_nsec));
}

}  // namespace

class SocketPosix : public ISocket {
 public:
  SocketPosix() : sock_(-1) {}

  ~SocketPosix() override { Close(); }

  bool Initialize() override {
    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ < 0) {
      CaptureErrno("socket creation failed");
      return false;
    }
    return true;
  }

  bool SetReuseAddress(bool enable) override {
    if (!CheckOpen()) return false;
    int on = enable ? 1 : 0;
    if (setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
      CaptureErrno("setsockopt(SO_REUSEADDR) failed");
      return false;
    }
    return true;
  }

  bool Bind(uint16_t port) override {
    if (!CheckOpen()) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      CaptureErrno("bind failed");
      return false;
    }
    return true;
  }

  bool JoinMulticastGroup(const std::string& group,
                          const std::string& interface_address) override {
    if (!CheckOpen()) return false;

    ip_mreq mreq{};
    if (!ParseIpv4(group, &mreq.imr_multiaddr)) {
      last_error_ = "Invalid multicast group: " + group;
      return false;
    }
    if (interface_address.empty()) {
      mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    } else if (!ParseIpv4(interface_address, &mreq.imr_interface)) {
      last_error_ = "Invalid interface address: " + interface_address;
      return false;
    }

    if (setsockopt(sock_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq,
                   sizeof(mreq)) < 0) {
      CaptureErrno("IP_ADD_MEMBERSHIP failed");
      return false;
    }

    unsigned char loop = 0;
    if (setsockopt(sock_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop,
                   sizeof(loop)) < 0) {
      CaptureErrno("IP_MULTICAST_LOOP failed");
      return false;
    }
    return true;
  }

  bool EnableReceiveTimestamps() override {
    if (!CheckOpen()) return false;
    int on = 1;
    if (setsockopt(sock_, SOL_SOCKET, SO_TIMESTAMPNS, &on, sizeof(on)) < 0) {
      CaptureErrno("setsockopt(SO_TIMESTAMPNS) failed");
      return false;
    }
    return true;
  }

  bool WaitReadable(int64_t timeout_us) override {
    if (!CheckOpen()) return false;

    pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = POLLIN;

    int timeout_ms = static_cast<int>(timeout_us / 1000);
    int ready = poll(&pfd, 1, timeout_ms);

    if (ready < 0) {
      CaptureErrno("poll failed");
      return false;
    }
    return ready > 0 && (pfd.revents & POLLIN);
  }

  bool Receive(Endpoint* from, std::vector<uint8_t>* data,
               size_t max_size) override {
    if (!CheckOpen()) return false;

    data->resize(max_size);
    sockaddr_in addr{};
    socklen_t addrlen = sizeof(addr);

    ssize_t n = recvfrom(sock_, data->data(), max_size, 0,
                         reinterpret_cast<sockaddr*>(&addr), &addrlen);
    if (n < 0) {
      CaptureErrno("recvfrom failed");
      return false;
    }

    data->resize(static_cast<size_t>(n));
    *from = ToEndpoint(addr);
    return true;
  }

  bool ReceiveTimestamped(Endpoint* from, std::vector<uint8_t>* data,
                          size_t max_size, TimeSpec* rx_time,
                          bool* kernel_stamped) override {
    if (!CheckOpen()) return false;

    data->resize(max_size);
    sockaddr_in addr{};
    iovec iov{};
    iov.iov_base = data->data();
    iov.iov_len = max_size;

    alignas(cmsghdr) char control[CMSG_SPACE(sizeof(timespec))];
    msghdr msg{};
    msg.msg_name = &addr;
    msg.msg_namelen = sizeof(addr);
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);

    ssize_t n = recvmsg(sock_, &msg, 0);
    if (n < 0) {
      CaptureErrno("recvmsg failed");
      return false;
    }
    data->resize(static_cast<size_t>(n));
    *from = ToEndpoint(addr);

    bool stamped = false;
    for (cmsghdr* c = CMSG_FIRSTHDR(&msg); c != nullptr;
         c = CMSG_NXTHDR(&msg, c)) {
      if (c->cmsg_level == SOL_SOCKET && c->cmsg_type == SCM_TIMESTAMPNS) {
        timespec ts{};
        std::memcpy(&ts, CMSG_DATA(c), sizeof(ts));
        *rx_time = FromTimespec(ts);
        stamped = true;
        break;
      }
    }
    if (!stamped) {
      timespec ts{};
      clock_gettime(CLOCK_REALTIME, &ts);
      *rx_time = FromTimespec(ts);
    }
    if (kernel_stamped) *kernel_stamped = stamped;
    return true;
  }

  bool Send(const Endpoint& to, const std::vector<uint8_t>& data) override {
    if (!CheckOpen()) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(to.port);
    if (!ParseIpv4(to.address, &addr.sin_addr)) {
      last_error_ = "Invalid IP address: " + to.address;
      return false;
    }

    ssize_t sent =
        sendto(sock_, data.data(), data.size(), 0,
               reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
      CaptureErrno("sendto failed");
      return false;
    }

    if (sent != static_cast<ssize_t>(data.size())) {
      std::ostringstream oss;
      oss << "Partial send: sent " << sent << " of " << data.size() << " bytes";
      last_error_ = oss.str();
      return false;
    }
    return true;
  }

  void Close() override {
    if (sock_ >= 0) {
      close(sock_);
      sock_ = -1;
    }
  }

  std::string GetLastError() const override { return last_error_; }

  bool IsValid() const override { return sock_ >= 0; }

 private:
  bool CheckOpen() {
    if (sock_ < 0) {
      last_error_ = "Socket not initialized";
      return false;
    }
    return true;
  }

  void CaptureErrno(const std::string& context) {
    int err = errno;
    std::ostringstream oss;
    oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
    last_error_ = oss.str();
  }

  int sock_;
  std::string last_error_;
};

std::unique_ptr<ISocket> CreatePlatformSocket() {
  return std::unique_ptr<ISocket>(new SocketPosix());
}

}  // namespace platform
}  // namespace dantetime
