// Copyright (c) 2025 <Your Name>
/**
 * @file time_query_protocol.cc
 * @brief Big-endian codec for time query requests and responses.
 */
#include "dantetime/time_query_protocol.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace dantetime {

namespace {

void AppendBe32(std::vector<uint8_t>* out, uint32_t v) {
  out->push_back(static_cast<uint8_t>((v >> 24) & 0xffU));
  out->push_back(static_cast<uint8_t>((v >> 16) & 0xffU));
  out->push_back(static_cast<uint8_t>((v >> 8) & 0xffU));
  out->push_back(static_cast<uint8_t>(v & 0xffU));
}

void AppendBe64(std::vector<uint8_t>* out, uint64_t v) {
  AppendBe32(out, static_cast<uint32_t>(v >> 32));
  AppendBe32(out, static_cast<uint32_t>(v & 0xffffffffU));
}

uint32_t Rd32(const std::vector<uint8_t>& b, size_t at) {
  return (static_cast<uint32_t>(b[at]) << 24) |
         (static_cast<uint32_t>(b[at + 1]) << 16) |
         (static_cast<uint32_t>(b[at + 2]) << 8) |
         (static_cast<uint32_t>(b[at + 3]));
}

uint64_t Rd64(const std::vector<uint8_t>& b, size_t at) {
  return (static_cast<uint64_t>(Rd32(b, at)) << 32) | Rd32(b, at + 4);
}

}  // namespace

std::vector<uint8_t> TimeQuery::SerializeRequest(const Request& r) {
  std::vector<uint8_t> out;
  out.reserve(kRequestSize);
  AppendBe32(&out, r.magic);
  AppendBe32(&out, r.request_id);
  return out;
}

bool TimeQuery::ParseRequest(const std::vector<uint8_t>& bytes, Request* out) {
  if (out == nullptr) return false;
  if (bytes.size() < kRequestSize) return false;
  Request r;
  r.magic = Rd32(bytes, 0);
  if (r.magic != kRequestMagic) return false;
  r.request_id = Rd32(bytes, 4);
  *out = r;
  return true;
}

std::vector<uint8_t> TimeQuery::SerializeResponse(const Response& r) {
  std::vector<uint8_t> out;
  out.reserve(kResponseSize);
  AppendBe32(&out, r.magic);
  AppendBe32(&out, r.request_id);
  AppendBe64(&out, r.system_time_ns);
  AppendBe64(&out, r.monotonic_counter);
  AppendBe64(&out, static_cast<uint64_t>(r.ptp_offset_ns));
  AppendBe32(&out, static_cast<uint32_t>(r.drift_ppm_milli));
  AppendBe32(&out, static_cast<uint32_t>(r.frequency_ppm_milli));
  out.push_back(r.mode);
  out.push_back(r.locked ? 1U : 0U);
  out.insert(out.end(), r.grandmaster.begin(), r.grandmaster.end());
  AppendBe64(&out, r.monotonic_frequency_hz);
  out.resize(kResponseSize, 0U);  // reserved
  return out;
}

bool TimeQuery::ParseResponse(const std::vector<uint8_t>& bytes,
                              Response* out) {
  if (out == nullptr) return false;
  if (bytes.size() < kResponseSize) return false;
  Response r;
  r.magic = Rd32(bytes, 0);
  if (r.magic != kResponseMagic) return false;
  r.request_id = Rd32(bytes, 4);
  r.system_time_ns = Rd64(bytes, 8);
  r.monotonic_counter = Rd64(bytes, 16);
  r.ptp_offset_ns = static_cast<int64_t>(Rd64(bytes, 24));
  r.drift_ppm_milli = static_cast<int32_t>(Rd32(bytes, 32));
  r.frequency_ppm_milli = static_cast<int32_t>(Rd32(bytes, 36));
  r.mode = bytes[40];
  r.locked = bytes[41] != 0U;
  for (size_t i = 0; i < r.grandmaster.size(); ++i) {
    r.grandmaster[i] = bytes[42 + i];
  }
  r.monotonic_frequency_hz = Rd64(bytes, 48);
  *out = r;
  return true;
}

int32_t TimeQuery::ToPpmMilli(double ppm) {
  if (std::isnan(ppm)) return 0;
  const double scaled = std::trunc(ppm * 1000.0);
  if (scaled >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
    return std::numeric_limits<int32_t>::max();
  }
  if (scaled <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
    return std::numeric_limits<int32_t>::min();
  }
  return static_cast<int32_t>(scaled);
}

}  // namespace dantetime
