// Copyright (c) 2025 <Your Name>
#include "internal/ptp_receiver.hpp"

#include <utility>
#include <vector>

#include "dantesync/ptp_types.hpp"

namespace dantesync {
namespace internal {

namespace {
constexpr size_t kMaxPtpDatagram = 1500;
}  // namespace

bool PtpReceiver::Open(const std::string& interface_address,
                       SampleCallback on_sample, LogCallback log_callback,
                       std::string* err) {
  if (IsOpen()) return false;

  on_sample_ = std::move(on_sample);
  log_callback_ = std::move(log_callback);
  pairer_.Clear();

  event_socket_ = OpenPort(kPtpEventPort, interface_address, true, err);
  if (!event_socket_) return false;
  general_socket_ = OpenPort(kPtpGeneralPort, interface_address, false, err);
  if (!general_socket_) {
    event_socket_->Close();
    event_socket_.reset();
    return false;
  }

  running_.store(true);
  event_thread_ = std::thread(&PtpReceiver::ReceiveLoop, this,
                              event_socket_.get(), true);
  general_thread_ = std::thread(&PtpReceiver::ReceiveLoop, this,
                                general_socket_.get(), false);
  return true;
}

std::unique_ptr<dantetime::platform::ISocket> PtpReceiver::OpenPort(
    uint16_t port, const std::string& interface_address, bool timestamps,
    std::string* err) {
  auto sock = dantetime::platform::CreatePlatformSocket();
  auto fail = [&](const std::string& what) {
    if (err) {
      *err = "[PtpReceiver] " + what + " (port " + std::to_string(port) +
             "): " + sock->GetLastError();
    }
    sock->Close();
    return std::unique_ptr<dantetime::platform::ISocket>();
  };

  if (!sock->Initialize()) return fail("Socket initialization failed");
  if (!sock->SetReuseAddress(true)) return fail("SO_REUSEADDR failed");
  if (!sock->Bind(port)) return fail("Socket bind failed");
  if (!sock->JoinMulticastGroup(kPtpV1MulticastGroup, interface_address)) {
    return fail("Multicast join failed");
  }
  if (timestamps && !sock->EnableReceiveTimestamps()) {
    // Falls back to the wall clock after the read.
    LogError("[PtpReceiver] Kernel timestamps unavailable: " +
             sock->GetLastError());
  }
  return sock;
}

void PtpReceiver::Close() {
  if (!running_.exchange(false)) return;

  if (event_thread_.joinable()) event_thread_.join();
  if (general_thread_.joinable()) general_thread_.join();

  if (event_socket_) {
    event_socket_->Close();
    event_socket_.reset();
  }
  if (general_socket_) {
    general_socket_->Close();
    general_socket_.reset();
  }
}

void PtpReceiver::ReceiveLoop(dantetime::platform::ISocket* socket,
                              bool event_port) {
  while (running_.load()) {
    if (!socket->WaitReadable(200000)) continue;  // 200ms timeout

    dantetime::platform::Endpoint from;
    std::vector<uint8_t> data;
    dantetime::TimeSpec rx_time;
    bool kernel = false;
    if (!socket->ReceiveTimestamped(&from, &data, kMaxPtpDatagram, &rx_time,
                                    &kernel)) {
      if (running_.load()) {
        LogError("[PtpReceiver] Receive failed: " + socket->GetLastError());
      }
      continue;
    }
    if (event_port && kernel) kernel_stamped_.store(true);

    PtpSample sample;
    bool paired = false;
    {
      std::lock_guard<std::mutex> lock(pairer_mtx_);
      paired = pairer_.Process(data, rx_time, &sample);
    }
    if (paired && on_sample_) on_sample_(sample);
  }
}

void PtpReceiver::LogError(const std::string& text) {
  if (log_callback_) log_callback_(text);
}

}  // namespace internal
}  // namespace dantesync
