// Copyright (c) 2025 <Your Name>
/**
 * @file ptp_types.cc
 * @brief PTPv1 header and body decoding.
 */
#include "dantesync/ptp_types.hpp"

#include <algorithm>

namespace dantesync {

namespace {
uint16_t ReadBe16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t ReadBe32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}
}  // namespace

constexpr size_t PtpV1Header::kSize;
constexpr size_t PtpV1SyncBody::kMinSize;
constexpr size_t PtpV1FollowUpBody::kSize;

PtpV1Control PtpV1ControlFromByte(uint8_t v) {
  switch (v) {
    case 0:
      return PtpV1Control::Sync;
    case 1:
      return PtpV1Control::DelayReq;
    case 2:
      return PtpV1Control::FollowUp;
    case 3:
      return PtpV1Control::DelayResp;
    case 4:
      return PtpV1Control::Management;
    default:
      return PtpV1Control::Other;
  }
}

bool PtpV1Header::Parse(const std::vector<uint8_t>& data, PtpV1Header* out) {
  if (!out || data.size() < kSize) return false;
  const uint8_t* p = data.data();

  PtpV1Header h;
  h.version_ptp = static_cast<uint8_t>((p[0] >> 4) & 0x0F);
  h.message_length = ReadBe16(p + 2);
  std::copy(p + 22, p + 28, h.source_uuid.begin());
  h.sequence_id = ReadBe16(p + 30);
  h.control = p[32];
  h.message_type = PtpV1ControlFromByte(h.control);
  *out = h;
  return true;
}

bool PtpV1SyncBody::Parse(const uint8_t* body, size_t len,
                          PtpV1SyncBody* out) {
  if (!body || !out || len < kMinSize) return false;
  std::copy(body + 13, body + 19, out->grandmaster_uuid.begin());
  return true;
}

dantetime::TimeSpec PtpV1FollowUpBody::OriginTime() const {
  dantetime::TimeSpec t(static_cast<int64_t>(origin_seconds),
                        origin_nanoseconds);
  t.Normalize();
  return t;
}

bool PtpV1FollowUpBody::Parse(const uint8_t* body, size_t len,
                              PtpV1FollowUpBody* out) {
  if (!body || !out || len < kSize) return false;
  out->associated_sequence_id = ReadBe16(body + 6);
  out->origin_seconds = ReadBe32(body + 8);
  out->origin_nanoseconds = ReadBe32(body + 12);
  return true;
}

}  // namespace dantesync
