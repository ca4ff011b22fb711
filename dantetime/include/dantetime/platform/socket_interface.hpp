// Copyright (c) 2025 <Your Name>
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "dantetime/time_spec.hpp"

namespace dantetime {
namespace platform {

// IPv4 address string and port
struct Endpoint {
  std::string address;  // dotted quad, e.g. "192.168.1.1"
  uint16_t port;

  Endpoint() : port(0) {}
  Endpoint(const std::string& addr, uint16_t p) : address(addr), port(p) {}
};

// Platform independent UDP/IPv4 socket.
// Every call returns false on failure and leaves the reason in GetLastError().
class ISocket {
 public:
  virtual ~ISocket() = default;

  // Create the underlying descriptor.
  virtual bool Initialize() = 0;

  // Allow several sockets to bind the same port (multicast listeners).
  virtual bool SetReuseAddress(bool enable) = 0;

  // Bind to INADDR_ANY:port. Port 0 picks an ephemeral port.
  virtual bool Bind(uint16_t port) = 0;

  // Join an IPv4 multicast group on the interface owning interface_address
  // (empty = kernel default) and disable loopback of our own sends.
  virtual bool JoinMulticastGroup(const std::string& group,
                                  const std::string& interface_address) = 0;

  // Ask the kernel to attach a receive timestamp (SO_TIMESTAMPNS).
  virtual bool EnableReceiveTimestamps() = 0;

  // Wait up to timeout_us for a datagram.
  // Returns true if readable, false on timeout or error.
  virtual bool WaitReadable(int64_t timeout_us) = 0;

  // Receive one datagram of at most max_size bytes.
  virtual bool Receive(Endpoint* from, std::vector<uint8_t>* data,
                       size_t max_size) = 0;

  // Receive one datagram with its arrival time. Uses the kernel timestamp
  // when enabled and present, otherwise CLOCK_REALTIME after the read;
  // *kernel_stamped reports which one was used.
  virtual bool ReceiveTimestamped(Endpoint* from, std::vector<uint8_t>* data,
                                  size_t max_size, TimeSpec* rx_time,
                                  bool* kernel_stamped) = 0;

  // Send one datagram.
  virtual bool Send(const Endpoint& to, const std::vector<uint8_t>& data) = 0;

  virtual void Close() = 0;

  virtual std::string GetLastError() const = 0;

  virtual bool IsValid() const = 0;
};

// Factory for the platform implementation.
std::unique_ptr<ISocket> CreatePlatformSocket();

}  // namespace platform
}  // namespace dantetime
