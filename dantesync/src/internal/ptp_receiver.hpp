// Copyright (c) 2025 <Your Name>
/**
 * @file ptp_receiver.hpp
 * @brief PTPv1 multicast listener with background receive threads.
 *
 * Listens on the event (319) and general (320) ports, timestamps Sync
 * arrivals, pairs them with Follow_Ups and hands complete samples to a
 * callback. The callback runs on a receive thread and must only enqueue.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "dantesync/sync_types.hpp"
#include "dantetime/platform/socket_interface.hpp"
#include "internal/ptp_pairer.hpp"

namespace dantesync {
namespace internal {

class PtpReceiver {
 public:
  using SampleCallback = std::function<void(const PtpSample&)>;
  using LogCallback = std::function<void(const std::string&)>;

  PtpReceiver() = default;
  ~PtpReceiver() { Close(); }

  PtpReceiver(const PtpReceiver&) = delete;
  PtpReceiver& operator=(const PtpReceiver&) = delete;

  /**
   * @brief Open both ports, join the group and start receiving.
   *
   * @param interface_address IPv4 address of the interface to join on
   *                          (empty = kernel default).
   * @param on_sample Called for every paired Sync/Follow_Up.
   * @param log_callback Optional diagnostics sink.
   * @param err Failure reason.
   * @return true on success.
   */
  bool Open(const std::string& interface_address, SampleCallback on_sample,
            LogCallback log_callback, std::string* err);

  /** Stop threads and close sockets. Safe to call multiple times. */
  void Close();

  bool IsOpen() const { return running_.load(); }

  /** Whether kernel receive timestamps were seen on the event port. */
  bool KernelTimestamps() const { return kernel_stamped_.load(); }

 private:
  std::unique_ptr<dantetime::platform::ISocket> OpenPort(
      uint16_t port, const std::string& interface_address, bool timestamps,
      std::string* err);
  void ReceiveLoop(dantetime::platform::ISocket* socket, bool event_port);
  void LogError(const std::string& text);

  std::unique_ptr<dantetime::platform::ISocket> event_socket_;
  std::unique_ptr<dantetime::platform::ISocket> general_socket_;
  std::thread event_thread_;
  std::thread general_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> kernel_stamped_{false};

  std::mutex pairer_mtx_;  ///< Both threads feed one pairer
  PtpPairer pairer_;

  SampleCallback on_sample_;
  LogCallback log_callback_;
};

}  // namespace internal
}  // namespace dantesync
