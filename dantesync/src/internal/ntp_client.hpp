// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_client.hpp
 * @brief Single SNTPv4 request/response exchange over UDP.
 *
 * Builds a client-mode request stamped with T1, waits for the reply and
 * computes offset and round-trip delay from T1..T4. The clock is not
 * touched; the result is handed to the controller as an NtpSample.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dantetime/time_source.hpp"
#include "dantetime/time_spec.hpp"

namespace dantesync {
namespace internal {

class NtpClient {
 public:
  static constexpr size_t kPacketSize = 48;

  struct Result {
    bool success = false;
    double offset_s = 0.0;  ///< ((T2 - T1) + (T3 - T4)) / 2
    double delay_s = 0.0;   ///< (T4 - T1) - (T3 - T2)
    std::string error;
  };

  /**
   * @brief Perform one exchange.
   *
   * @param ip Server IPv4 address (numeric, no DNS).
   * @param port Server UDP port.
   * @param clock Source of T1 and T4.
   * @param timeout_ms Receive timeout.
   */
  static Result Exchange(const std::string& ip, uint16_t port,
                         dantetime::TimeSource* clock, int timeout_ms = 1000);

  /** Client request: LI=0, VN=4, Mode=3, transmit timestamp = t1. */
  static std::vector<uint8_t> BuildRequest(const dantetime::TimeSpec& t1);

  /**
   * @brief Compute offset/delay from a server reply.
   *
   * Rejects short packets, non-server modes, an unsynchronized server
   * (LI=3), stratum 0 (kiss-o'-death) or above 15, zero receive/transmit
   * timestamps and an originate field that does not echo t1.
   * @return false with out->error set when the reply is unusable.
   */
  static bool ParseResponse(const std::vector<uint8_t>& reply,
                            const dantetime::TimeSpec& t1,
                            const dantetime::TimeSpec& t4, Result* out);
};

}  // namespace internal
}  // namespace dantesync
