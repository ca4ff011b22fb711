// Copyright (c) 2025 <Your Name>
#include "internal/ntp_client.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "dantetime/platform/socket_interface.hpp"

namespace dantesync {
namespace internal {

namespace {

constexpr size_t kOriginTimestampOffset = 24;
constexpr size_t kRecvTimestampOffset = 32;
constexpr size_t kTxTimestampOffset = 40;

void WriteTimestamp(const dantetime::TimeSpec& ts, uint8_t* dst8) {
  const uint64_t v = ts.ToNtpTimestamp();
  for (int i = 0; i < 8; ++i) {
    dst8[i] = static_cast<uint8_t>((v >> (56 - 8 * i)) & 0xFFU);
  }
}

uint64_t ReadRaw(const uint8_t* src8) {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | src8[i];
  return v;
}

}  // namespace

constexpr size_t NtpClient::kPacketSize;

std::vector<uint8_t> NtpClient::BuildRequest(const dantetime::TimeSpec& t1) {
  std::vector<uint8_t> req(kPacketSize, 0);
  req[0] = static_cast<uint8_t>((0 << 6) | (4 << 3) | 3);  // v4, client
  WriteTimestamp(t1, req.data() + kTxTimestampOffset);
  return req;
}

bool NtpClient::ParseResponse(const std::vector<uint8_t>& reply,
                              const dantetime::TimeSpec& t1,
                              const dantetime::TimeSpec& t4, Result* out) {
  if (!out) return false;
  if (reply.size() < kPacketSize) {
    out->error = "response too small";
    return false;
  }
  const uint8_t mode = reply[0] & 0x07;
  if (mode != 4) {
    out->error = "not a server response (mode " + std::to_string(mode) + ")";
    return false;
  }
  const uint8_t leap = static_cast<uint8_t>(reply[0] >> 6);
  if (leap == 3) {
    out->error = "server clock not synchronized (LI=3)";
    return false;
  }
  const uint8_t stratum = reply[1];
  if (stratum == 0 || stratum > 15) {
    out->error = "unusable stratum " + std::to_string(stratum);
    return false;
  }

  const uint64_t origin_raw = ReadRaw(reply.data() + kOriginTimestampOffset);
  const uint64_t recv_raw = ReadRaw(reply.data() + kRecvTimestampOffset);
  const uint64_t tx_raw = ReadRaw(reply.data() + kTxTimestampOffset);
  if (recv_raw == 0 || tx_raw == 0) {
    out->error = "zero receive or transmit timestamp";
    return false;
  }
  if (origin_raw != t1.ToNtpTimestamp()) {
    out->error = "originate timestamp does not match request";
    return false;
  }

  const dantetime::TimeSpec t2 =
      dantetime::TimeSpec::FromNtpTimestamp(recv_raw);
  const dantetime::TimeSpec t3 =
      dantetime::TimeSpec::FromNtpTimestamp(tx_raw);

  const dantetime::TimeSpec delay = (t4 - t1) - (t3 - t2);
  const dantetime::TimeSpec offset_2x = (t2 - t1) + (t3 - t4);
  out->offset_s = offset_2x.ToDouble() / 2.0;
  out->delay_s = delay.ToDouble();
  out->success = true;
  return true;
}

NtpClient::Result NtpClient::Exchange(const std::string& ip, uint16_t port,
                                      dantetime::TimeSource* clock,
                                      int timeout_ms) {
  Result result;
  if (!clock) {
    result.error = "no time source";
    return result;
  }

  std::unique_ptr<dantetime::platform::ISocket> sock =
      dantetime::platform::CreatePlatformSocket();
  if (!sock->Initialize() || !sock->Bind(0)) {
    result.error = "socket setup failed: " + sock->GetLastError();
    sock->Close();
    return result;
  }

  const dantetime::platform::Endpoint server(ip, port);
  const dantetime::TimeSpec t1 = clock->NowUnix();
  if (!sock->Send(server, BuildRequest(t1))) {
    result.error = "send failed: " + sock->GetLastError();
    sock->Close();
    return result;
  }

  // Skip stray datagrams from other senders until the deadline.
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::microseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0 || !sock->WaitReadable(left.count())) {
      result.error = "recvfrom timeout/failure";
      break;
    }
    dantetime::platform::Endpoint from;
    std::vector<uint8_t> reply;
    if (!sock->Receive(&from, &reply, 1500)) {
      result.error = "receive failed: " + sock->GetLastError();
      break;
    }
    const dantetime::TimeSpec t4 = clock->NowUnix();
    if (from.address != ip || from.port != port) continue;
    ParseResponse(reply, t1, t4, &result);
    break;
  }
  sock->Close();
  return result;
}

}  // namespace internal
}  // namespace dantesync
