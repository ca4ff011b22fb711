// Copyright (c) 2025 <Your Name>
#include "dantesync/sync_types.hpp"

#include <cstdio>

namespace dantesync {

std::string FormatGrandmaster(const GrandmasterId& id) {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", id[0],
                id[1], id[2], id[3], id[4], id[5]);
  return std::string(buf);
}

const char* ModeName(Mode m) {
  switch (m) {
    case Mode::Init:
      return "INIT";
    case Mode::Acquiring:
      return "ACQ";
    case Mode::Producing:
      return "PROD";
    case Mode::Locked:
      return "LOCK";
    case Mode::Nano:
      return "NANO";
    case Mode::NtpOnly:
      return "NTP-ONLY";
  }
  return "?";
}

std::ostream& operator<<(std::ostream& os, Mode m) { return os << ModeName(m); }

const char* OutcomeName(SampleOutcome o) {
  switch (o) {
    case SampleOutcome::Accepted:
      return "accepted";
    case SampleOutcome::Substituted:
      return "substituted";
    case SampleOutcome::Rejected:
      return "rejected";
  }
  return "?";
}

}  // namespace dantesync
