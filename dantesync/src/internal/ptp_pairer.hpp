// Copyright (c) 2025 <Your Name>
/**
 * @file ptp_pairer.hpp
 * @brief Matches PTPv1 Sync receipts with their Follow_Up origin times.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "dantesync/ptp_types.hpp"
#include "dantesync/sync_types.hpp"
#include "dantetime/time_spec.hpp"

namespace dantesync {
namespace internal {

/**
 * @brief Two-step PTPv1 pairing.
 *
 * A Sync's local receipt time is held by sequence id. A Follow_Up with the
 * same associated sequence id from the same source completes it. When more
 * than kMaxPending Syncs are held, those older than kPendingMaxAgeNs are
 * dropped. Not thread-safe.
 */
class PtpPairer {
 public:
  static constexpr size_t kMaxPending = 100;
  static constexpr int64_t kPendingMaxAgeNs = 5000000000LL;

  struct Counters {
    uint64_t syncs = 0;
    uint64_t follow_ups = 0;
    uint64_t paired = 0;
    uint64_t unmatched = 0;  ///< Follow_Up without a pending Sync
    uint64_t foreign = 0;    ///< Follow_Up from another source
    uint64_t malformed = 0;
  };

  /**
   * @brief Feed one datagram from either PTP port.
   * @param data Raw datagram.
   * @param rx_time Local receipt time of the datagram.
   * @param out Filled when this datagram completes a pair.
   * @return true when out holds a new sample.
   */
  bool Process(const std::vector<uint8_t>& data,
               const dantetime::TimeSpec& rx_time, PtpSample* out);

  size_t PendingCount() const { return pending_.size(); }
  const Counters& GetCounters() const { return counters_; }
  void Clear() { pending_.clear(); }

 private:
  struct PendingSync {
    dantetime::TimeSpec rx_time;
    GrandmasterId source_uuid;
    GrandmasterId grandmaster;
  };

  void PruneStale(const dantetime::TimeSpec& now);

  std::map<uint16_t, PendingSync> pending_;
  Counters counters_;
};

}  // namespace internal
}  // namespace dantesync
