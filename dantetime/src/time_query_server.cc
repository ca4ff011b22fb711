// Copyright (c) 2025 <Your Name>
/**
 * @file time_query_server.cc
 * @brief Time query responder (UDP/IPv4).
 */
#include "dantetime/time_query_server.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "dantetime/platform/socket_interface.hpp"
#include "dantetime/system_clock.hpp"

namespace dantetime {

namespace {

// Largest datagram read per request; anything past the header is ignored.
constexpr size_t kMaxDatagram = 512;

class StatsTracker {
 public:
  void IncRequestsReceived() {
    requests_received_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncResponsesSent() {
    responses_sent_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRecvErrors() { recv_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncShortPackets() {
    short_packets_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncBadMagic() { bad_magic_.fetch_add(1, std::memory_order_relaxed); }
  void IncSendErrors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }
  void SetLastError(const std::string& text) {
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_ = text;
  }

  ServerStats Snapshot() const {
    ServerStats stats;
    stats.requests_received =
        requests_received_.load(std::memory_order_relaxed);
    stats.responses_sent = responses_sent_.load(std::memory_order_relaxed);
    stats.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    stats.drop_short_packets = short_packets_.load(std::memory_order_relaxed);
    stats.drop_bad_magic = bad_magic_.load(std::memory_order_relaxed);
    stats.send_errors = send_errors_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    stats.last_error = last_error_;
    return stats;
  }

 private:
  std::atomic<uint64_t> requests_received_{0};
  std::atomic<uint64_t> responses_sent_{0};
  std::atomic<uint64_t> recv_errors_{0};
  std::atomic<uint64_t> short_packets_{0};
  std::atomic<uint64_t> bad_magic_{0};
  std::atomic<uint64_t> send_errors_{0};
  mutable std::mutex last_error_mtx_;
  std::string last_error_;
};

}  // namespace

class TimeQueryServer::Impl {
 public:
  Impl() = default;
  ~Impl() { Stop(); }

  bool Start(uint16_t port, TimeSource* time_source, const Options& options) {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (running_.load()) return true;

    time_source_ =
        time_source ? time_source : &platform::GetDefaultTimeSource();
    snapshot_provider_ = options.Snapshot();
    log_callback_ = options.LogSink();

    if (!CreateAndBindSocket(port)) {
      return false;
    }

    if (log_callback_) {
      std::ostringstream oss;
      oss << "[TimeQueryServer] Listening on UDP port " << port;
      log_callback_(oss.str());
    }

    running_.store(true);
    thread_ = std::thread([this]() { Loop(); });
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
      thread_.join();
    }
    if (socket_) {
      socket_->Close();
      socket_.reset();
    }
  }

  ServerStats GetStats() const { return stats_.Snapshot(); }

 private:
  bool CreateAndBindSocket(uint16_t port) {
    socket_ = platform::CreatePlatformSocket();
    if (!socket_->Initialize()) {
      RecordError("Socket initialization failed: " + socket_->GetLastError());
      socket_.reset();
      return false;
    }

    if (!socket_->Bind(port)) {
      RecordError("Socket bind failed: " + socket_->GetLastError());
      socket_->Close();
      socket_.reset();
      return false;
    }
    return true;
  }

  /** Main loop: wait for datagrams and respond. */
  void Loop() {
    while (running_.load()) {
      if (!socket_ || !socket_->WaitReadable(/*timeout_us=*/200000)) continue;
      HandleSingleDatagram();
    }
  }

  /**
   * @brief Receives one request and answers it.
   * @details receive -> validate -> snapshot -> encode -> send.
   */
  void HandleSingleDatagram() {
    platform::Endpoint from;
    TimeQuery::Request req;
    if (!ReceiveRequest(&from, &req)) return;

    std::vector<uint8_t> buf =
        TimeQuery::SerializeResponse(MakeResponse(req.request_id));
    SendBuffer(from, buf);
  }

  bool ReceiveRequest(platform::Endpoint* from, TimeQuery::Request* req) {
    std::vector<uint8_t> data;
    if (!socket_->Receive(from, &data, kMaxDatagram)) {
      stats_.IncRecvErrors();
      RecordError("Receive failed: " + socket_->GetLastError());
      return false;
    }

    if (data.size() < TimeQuery::kRequestSize) {
      stats_.IncShortPackets();
      return false;
    }

    if (!TimeQuery::ParseRequest(data, req)) {
      stats_.IncBadMagic();
      if (log_callback_) {
        std::ostringstream oss;
        oss << "[TimeQueryServer] Ignoring packet with invalid magic from "
            << from->address << ":" << from->port;
        log_callback_(oss.str());
      }
      return false;
    }

    stats_.IncRequestsReceived();
    return true;
  }

  TimeQuery::Response MakeResponse(uint32_t request_id) {
    TimeQuery::Response resp;
    resp.request_id = request_id;

    const TimeSpec now = time_source_->NowUnix();
    resp.system_time_ns = static_cast<uint64_t>(now.ToNanoseconds());
    resp.monotonic_counter = MonotonicRawNowNs();
    resp.monotonic_frequency_hz = kMonotonicCounterFrequencyHz;

    if (snapshot_provider_) {
      const TimeQuerySnapshot snap = snapshot_provider_();
      resp.ptp_offset_ns = snap.ptp_offset_ns;
      resp.drift_ppm_milli = TimeQuery::ToPpmMilli(snap.drift_ppm);
      resp.frequency_ppm_milli = TimeQuery::ToPpmMilli(snap.frequency_ppm);
      resp.mode = snap.mode;
      resp.locked = snap.locked;
      resp.grandmaster = snap.grandmaster;
    }
    return resp;
  }

  bool SendBuffer(const platform::Endpoint& to,
                  const std::vector<uint8_t>& buf) {
    if (!socket_->Send(to, buf)) {
      stats_.IncSendErrors();
      RecordError("Send failed: " + socket_->GetLastError());
      return false;
    }
    stats_.IncResponsesSent();
    return true;
  }

  void RecordError(const std::string& msg);

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::unique_ptr<platform::ISocket> socket_;
  std::mutex start_stop_mtx_;

  TimeSource* time_source_{nullptr};
  Options::SnapshotProvider snapshot_provider_;
  Options::LogCallback log_callback_;
  StatsTracker stats_;
};

void TimeQueryServer::Impl::RecordError(const std::string& msg) {
  const std::string text = "[TimeQueryServer] " + msg;
  if (log_callback_) {
    log_callback_(text);
  }
  stats_.SetLastError(text);
}

TimeQueryServer::TimeQueryServer() : impl_(new Impl) {}
TimeQueryServer::~TimeQueryServer() = default;

bool TimeQueryServer::Start(uint16_t port, TimeSource* time_source,
                            const Options& options) {
  return impl_->Start(port, time_source, options);
}
void TimeQueryServer::Stop() { impl_->Stop(); }
ServerStats TimeQueryServer::GetStats() const { return impl_->GetStats(); }

}  // namespace dantetime
