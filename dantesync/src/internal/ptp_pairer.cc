// Copyright (c) 2025 <Your Name>
#include "internal/ptp_pairer.hpp"

namespace dantesync {
namespace internal {

constexpr size_t PtpPairer::kMaxPending;
constexpr int64_t PtpPairer::kPendingMaxAgeNs;

bool PtpPairer::Process(const std::vector<uint8_t>& data,
                        const dantetime::TimeSpec& rx_time, PtpSample* out) {
  PtpV1Header header;
  if (!PtpV1Header::Parse(data, &header) || header.version_ptp != 1) {
    counters_.malformed++;
    return false;
  }
  const uint8_t* body = data.data() + PtpV1Header::kSize;
  const size_t body_len = data.size() - PtpV1Header::kSize;

  bool paired = false;
  switch (header.message_type) {
    case PtpV1Control::Sync: {
      counters_.syncs++;
      PendingSync p;
      p.rx_time = rx_time;
      p.source_uuid = header.source_uuid;
      // Older masters send a short Sync; the sender is then the grandmaster.
      PtpV1SyncBody sync_body;
      p.grandmaster = PtpV1SyncBody::Parse(body, body_len, &sync_body)
                          ? sync_body.grandmaster_uuid
                          : header.source_uuid;
      pending_[header.sequence_id] = p;
      break;
    }
    case PtpV1Control::FollowUp: {
      counters_.follow_ups++;
      PtpV1FollowUpBody fu;
      if (!PtpV1FollowUpBody::Parse(body, body_len, &fu)) {
        counters_.malformed++;
        break;
      }
      auto it = pending_.find(fu.associated_sequence_id);
      if (it == pending_.end()) {
        counters_.unmatched++;
        break;
      }
      const PendingSync p = it->second;
      pending_.erase(it);
      if (p.source_uuid != header.source_uuid) {
        counters_.foreign++;
        break;
      }
      if (out) {
        out->local_receipt_time = p.rx_time;
        out->master_send_time = fu.OriginTime();
        out->sequence = fu.associated_sequence_id;
        out->grandmaster = p.grandmaster;
      }
      counters_.paired++;
      paired = true;
      break;
    }
    default:
      break;
  }

  if (pending_.size() > kMaxPending) PruneStale(rx_time);
  return paired;
}

void PtpPairer::PruneStale(const dantetime::TimeSpec& now) {
  const int64_t now_ns = now.ToNanoseconds();
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (now_ns - it->second.rx_time.ToNanoseconds() >= kPendingMaxAgeNs) {
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace internal
}  // namespace dantesync
