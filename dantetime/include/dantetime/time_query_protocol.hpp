// Copyright (c) 2025 <Your Name>
/**
 * @file time_query_protocol.hpp
 * @brief Datagram status/time query protocol (UDP, default port 31900).
 *
 * Request (8 bytes, big-endian):
 *   - [0-3]   magic "DSYN" (0x4453594E)
 *   - [4-7]   request id, echoed in the response
 *
 * Response (64 bytes, big-endian):
 *   - [0-3]   magic "DSYR" (0x44535952)
 *   - [4-7]   request id
 *   - [8-15]  system time, UTC nanoseconds since epoch (u64)
 *   - [16-23] monotonic counter (CLOCK_MONOTONIC_RAW ns, u64)
 *   - [24-31] PTP phase offset from the grandmaster, ns (i64)
 *   - [32-35] drift rate, ppm x 1000 (i32)
 *   - [36-39] frequency adjustment, ppm x 1000 (i32)
 *   - [40]    mode (0 Init, 1 Acquiring, 2 Producing, 3 Locked, 4 Nano,
 *             5 NtpOnly)
 *   - [41]    locked flag (0/1)
 *   - [42-47] grandmaster clock UUID
 *   - [48-55] monotonic counter frequency in ticks per second (u64)
 *   - [56-63] reserved, zero
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dantetime {

/** @brief Time query wire format. */
struct TimeQuery {
  static constexpr uint32_t kRequestMagic = 0x4453594Eu;   // 'D''S''Y''N'
  static constexpr uint32_t kResponseMagic = 0x44535952u;  // 'D''S''Y''R'
  static constexpr size_t kRequestSize = 8;
  static constexpr size_t kResponseSize = 64;
  static constexpr uint16_t kDefaultPort = 31900;

  struct Request {
    uint32_t magic = kRequestMagic;
    uint32_t request_id = 0;
  };

  struct Response {
    uint32_t magic = kResponseMagic;
    uint32_t request_id = 0;
    uint64_t system_time_ns = 0;
    uint64_t monotonic_counter = 0;
    int64_t ptp_offset_ns = 0;
    int32_t drift_ppm_milli = 0;
    int32_t frequency_ppm_milli = 0;
    uint8_t mode = 0;
    bool locked = false;
    std::array<uint8_t, 6> grandmaster{};
    uint64_t monotonic_frequency_hz = 0;
  };

  static std::vector<uint8_t> SerializeRequest(const Request& r);

  /**
   * @brief Parse a request datagram.
   * @return false if shorter than kRequestSize or the magic differs;
   *         *out is untouched then. Trailing bytes are ignored.
   */
  static bool ParseRequest(const std::vector<uint8_t>& bytes, Request* out);

  /** @return Exactly kResponseSize bytes; reserved bytes are zero. */
  static std::vector<uint8_t> SerializeResponse(const Response& r);

  static bool ParseResponse(const std::vector<uint8_t>& bytes, Response* out);

  /**
   * @brief Scale ppm to the wire's ppm x 1000 integer.
   *
   * Truncates toward zero, saturates at the int32 range, NaN maps to 0.
   */
  static int32_t ToPpmMilli(double ppm);
};

}  // namespace dantetime
