// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Sample, mode and identity types shared by the sync components.
 */
#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

#include "dantetime/time_spec.hpp"

namespace dantesync {

/** 6-byte PTPv1 clock UUID. */
using GrandmasterId = std::array<uint8_t, 6>;

/** "00:1d:c1:aa:bb:cc" */
std::string FormatGrandmaster(const GrandmasterId& id);

/**
 * @brief Operating regime of the controller.
 *
 * Numeric values are carried on the wire by the time query protocol.
 */
enum class Mode : uint8_t {
  Init = 0,
  Acquiring = 1,
  Producing = 2,
  Locked = 3,
  Nano = 4,
  NtpOnly = 5,
};

const char* ModeName(Mode m);
std::ostream& operator<<(std::ostream& os, Mode m);

/** Locked and Nano report is_locked. */
inline bool IsLockedMode(Mode m) {
  return m == Mode::Locked || m == Mode::Nano;
}

enum class SampleSource { Ptp, Ntp };

/**
 * @brief One offset observation on a local tick axis.
 *
 * Offsets are source relative; only differences between consecutive
 * samples of one source carry meaning.
 */
struct RateSample {
  int64_t timestamp_ns = 0;  ///< Local receipt time
  int64_t offset_ns = 0;     ///< local - source
  SampleSource source = SampleSource::Ptp;
};

/** Paired Sync/Follow_Up observation. */
struct PtpSample {
  dantetime::TimeSpec local_receipt_time;  ///< t2, local clock at Sync receipt
  dantetime::TimeSpec master_send_time;    ///< t1, precise origin timestamp
  uint16_t sequence = 0;
  GrandmasterId grandmaster{};
};

/** Result of one NTP exchange. */
struct NtpSample {
  double offset_s = 0.0;            ///< server - local
  double round_trip_delay_s = 0.0;
};

/** Every inbound sample yields exactly one outcome. */
enum class SampleOutcome {
  Accepted,
  Substituted,  ///< Accepted with the spike filter median as the rate
  Rejected,
};

const char* OutcomeName(SampleOutcome o);

}  // namespace dantesync
