// Copyright (c) 2025 <Your Name>
/**
 * @file ptp_types.hpp
 * @brief PTP version 1 message parsing (IEEE 1588-2002).
 *
 * Only the fields needed for frequency tracking are decoded.
 *
 * Common header (36 bytes, big-endian):
 *   - 0      versionPTP in the high nibble
 *   - 1      versionNetwork
 *   - 2..3   messageLength
 *   - 4..19  subdomain
 *   - 20     messageType
 *   - 21     sourceCommunicationTechnology
 *   - 22..27 sourceUuid
 *   - 28..29 sourcePortId
 *   - 30..31 sequenceId
 *   - 32     control
 *
 * Sync body (after the header): originTimestamp (8), epochNumber (2),
 * currentUtcOffset (2), grandmasterCommunicationTechnology (1),
 * grandmasterClockUuid (6) at 13..18.
 *
 * Follow_Up body: 6 reserved bytes, associatedSequenceId at 6..7,
 * preciseOriginTimestamp seconds at 8..11 and nanoseconds at 12..15.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "dantesync/sync_types.hpp"
#include "dantetime/time_spec.hpp"

namespace dantesync {

constexpr uint16_t kPtpEventPort = 319;
constexpr uint16_t kPtpGeneralPort = 320;
constexpr const char* kPtpV1MulticastGroup = "224.0.1.129";

enum class PtpV1Control : uint8_t {
  Sync = 0,
  DelayReq = 1,
  FollowUp = 2,
  DelayResp = 3,
  Management = 4,
  Other = 5,
};

PtpV1Control PtpV1ControlFromByte(uint8_t v);

struct PtpV1Header {
  static constexpr size_t kSize = 36;

  uint8_t version_ptp = 0;
  uint16_t message_length = 0;
  GrandmasterId source_uuid{};
  uint16_t sequence_id = 0;
  uint8_t control = 0;
  PtpV1Control message_type = PtpV1Control::Other;

  /**
   * @brief Decode the common header.
   * @return false if fewer than kSize bytes; out is untouched then.
   */
  static bool Parse(const std::vector<uint8_t>& data, PtpV1Header* out);
};

struct PtpV1SyncBody {
  static constexpr size_t kMinSize = 19;

  GrandmasterId grandmaster_uuid{};

  /** @param body Bytes after the common header. */
  static bool Parse(const uint8_t* body, size_t len, PtpV1SyncBody* out);
};

struct PtpV1FollowUpBody {
  static constexpr size_t kSize = 16;

  uint16_t associated_sequence_id = 0;
  uint32_t origin_seconds = 0;
  uint32_t origin_nanoseconds = 0;

  /** Precise origin timestamp as a TimeSpec. */
  dantetime::TimeSpec OriginTime() const;

  /** @param body Bytes after the common header. */
  static bool Parse(const uint8_t* body, size_t len, PtpV1FollowUpBody* out);
};

}  // namespace dantesync
