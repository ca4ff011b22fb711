// Copyright (c) 2025 <Your Name>
#include "internal/mode_state_machine.hpp"

#include <algorithm>
#include <cmath>

namespace dantesync {
namespace internal {

constexpr double ModeStateMachine::kLockThresholdPpm;
constexpr double ModeStateMachine::kNanoThresholdPpm;

ModeStateMachine::ModeStateMachine(int lock_sustain, int nano_sustain)
    : lock_sustain_(std::max(1, lock_sustain)),
      nano_sustain_(std::max(1, nano_sustain)) {}

Mode ModeStateMachine::Evaluate(const Input& in) {
  if (!in.ptp_live) {
    ResetCounters();
    mode_ = (mode_ == Mode::Init && in.startup_grace) ? Mode::Init
                                                      : Mode::NtpOnly;
    return mode_;
  }

  if (mode_ == Mode::Init || mode_ == Mode::NtpOnly) {
    ResetCounters();
    mode_ = Mode::Acquiring;
    return mode_;
  }

  if (!in.has_sample) return mode_;

  const double mag = std::abs(in.smoothed_ppm);
  if (!(mag < kLockThresholdPpm)) {
    ResetCounters();
    mode_ = Mode::Acquiring;
    return mode_;
  }

  ++below_lock_;
  if (mag < kNanoThresholdPpm) {
    ++below_nano_;
  } else {
    below_nano_ = 0;
  }

  if (below_nano_ >= nano_sustain_) {
    mode_ = Mode::Nano;
  } else if (below_lock_ >= lock_sustain_) {
    mode_ = Mode::Locked;
  } else {
    mode_ = Mode::Producing;
  }
  return mode_;
}

void ModeStateMachine::ForceAcquiring() {
  ResetCounters();
  mode_ = Mode::Acquiring;
}

double ModeStateMachine::GainFor(Mode m) {
  switch (m) {
    case Mode::Acquiring:
      return 1.0;
    case Mode::Producing:
    case Mode::Locked:
      return 0.3;
    case Mode::Nano:
      return 0.1;
    case Mode::Init:
    case Mode::NtpOnly:
      return 0.0;
  }
  return 0.0;
}

}  // namespace internal
}  // namespace dantesync
