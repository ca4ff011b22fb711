// Copyright (c) 2025 <Your Name>
/**
 * @file mode_state_machine.hpp
 * @brief Operating mode transitions and the gain each mode applies.
 */
#pragma once

#include "dantesync/sync_types.hpp"

namespace dantesync {
namespace internal {

/**
 * @brief Single transition function over the controller modes.
 *
 * Thresholds are bare, without a hysteresis band:
 * - |rate| >= 5 ppm: Acquiring
 * - |rate| < 5 ppm: Producing, Locked after lock_sustain consecutive samples
 * - |rate| < 0.5 ppm for nano_sustain consecutive samples: Nano
 */
class ModeStateMachine {
 public:
  static constexpr double kLockThresholdPpm = 5.0;
  static constexpr double kNanoThresholdPpm = 0.5;

  struct Input {
    bool ptp_live = false;       ///< PTP seen within the timeout
    bool startup_grace = false;  ///< Still within the timeout since start
    bool has_sample = false;     ///< smoothed_ppm is fresh this cycle
    double smoothed_ppm = 0.0;
  };

  ModeStateMachine(int lock_sustain, int nano_sustain);

  /** Evaluate once per cycle and return the new mode. */
  Mode Evaluate(const Input& in);

  /** Soft reset entry: Acquiring with cleared counters. */
  void ForceAcquiring();

  Mode Current() const { return mode_; }
  int BelowLockCount() const { return below_lock_; }
  int BelowNanoCount() const { return below_nano_; }

  /** Servo gain for a mode; zero disables the frequency path. */
  static double GainFor(Mode m);

 private:
  void ResetCounters() {
    below_lock_ = 0;
    below_nano_ = 0;
  }

  int lock_sustain_;
  int nano_sustain_;
  Mode mode_ = Mode::Init;
  int below_lock_ = 0;
  int below_nano_ = 0;
};

}  // namespace internal
}  // namespace dantesync
