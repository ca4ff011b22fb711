// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Clock synchronization controller.
 *
 * Turns PTP drift observations into a frequency correction and NTP offsets
 * into clock steps. The two corrective paths never touch each other: a step
 * leaves the learned frequency alone and a frequency change never moves the
 * wall clock.
 *
 * The controller is single threaded. SyncService serializes every call on
 * its control thread; only Snapshot()/GetStatus() may be called from other
 * threads.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "dantesync/options.hpp"
#include "dantesync/sync_types.hpp"
#include "dantetime/clock_control.hpp"

namespace dantesync {

/**
 * @brief Immutable snapshot published after every processed event.
 */
struct Status {
  Mode mode = Mode::Init;
  bool is_locked = false;

  double raw_rate_ppm = 0.0;       ///< Latest drift rate before filtering
  double smoothed_rate_ppm = 0.0;  ///< EMA state
  double alpha = 0.0;              ///< Last smoothing coefficient
  double jitter_stddev_ppm = 0.0;
  double frequency_ppm = 0.0;      ///< Last frequency correction issued
  double integral_ppm = 0.0;
  double accumulated_phase_us = 0.0;
  int ntp_poll_interval_s = 30;
  int64_t ptp_offset_ns = 0;       ///< Sub-second phase vs grandmaster

  bool have_grandmaster = false;
  GrandmasterId grandmaster{};

  double last_ntp_offset_s = 0.0;
  double last_ntp_delay_s = 0.0;

  uint64_t ptp_samples = 0;
  uint64_t samples_accepted = 0;
  uint64_t samples_substituted = 0;
  uint64_t samples_rejected = 0;
  uint64_t ntp_samples = 0;
  uint64_t ntp_steps = 0;
  uint64_t soft_resets = 0;
  uint64_t frequency_updates = 0;  ///< Frequency changes the clock accepted
  uint64_t step_failures = 0;
  uint64_t frequency_failures = 0;

  size_t spike_window_fill = 0;
  size_t jitter_window_fill = 0;

  bool clock_control_fault = false;
  std::string last_error;      ///< Last clock-control error text
  std::string last_rejection;  ///< Why the last sample was rejected
  int64_t last_update_ns = 0;  ///< Monotonic time of the last event

  friend std::ostream& operator<<(std::ostream& os, const Status& s);
};

/**
 * @brief How the clock capabilities report back.
 *
 * Direct: a true return means the action was applied.
 * Queued: a true return only means the action was accepted for later
 * execution; the real outcome arrives through OnStepResult() and
 * OnFrequencyResult().
 */
enum class ClockActionMode { Direct, Queued };

/**
 * @brief Owns the filter, estimator, servo, mode machine and phase
 *        accountant and issues the two clock actions.
 *
 * Times passed in as now_ns are monotonic nanoseconds; the controller
 * records the first one it sees as its start time.
 */
class SyncController {
 public:
  /**
   * @param stepper Wall clock step capability (may be null: no steps).
   * @param adjuster Frequency capability (may be null: no adjustments).
   * @param opt Immutable options snapshot.
   * @param action_mode Whether the capabilities apply or only queue.
   */
  SyncController(dantetime::TimeStepper* stepper,
                 dantetime::FrequencyAdjuster* adjuster, const Options& opt,
                 ClockActionMode action_mode = ClockActionMode::Direct);
  ~SyncController();

  SyncController(const SyncController&) = delete;
  SyncController& operator=(const SyncController&) = delete;

  /** Process one paired PTP observation. */
  SampleOutcome OnPtpSample(const PtpSample& sample, int64_t now_ns);

  /** Process one NTP exchange result. */
  SampleOutcome OnNtpSample(const NtpSample& sample, int64_t now_ns);

  /**
   * @brief Outcome of a queued step.
   *
   * Phase error, the PTP baseline and the step count change only here when
   * the stepper is queued.
   */
  void OnStepResult(bool ok, const std::string& err, int64_t now_ns);

  /** Outcome of a queued frequency change of ppm. */
  void OnFrequencyResult(double ppm, bool ok, const std::string& err,
                         int64_t now_ns);

  /** Liveness tick; drives NtpOnly fallback and phase growth without PTP. */
  void Tick(int64_t now_ns);

  /**
   * @brief Latest published status (thread-safe, never null).
   */
  std::shared_ptr<const Status> Snapshot() const;
  Status GetStatus() const;

  /** Seconds until the next NTP poll, from the accumulated phase error. */
  int NtpPollIntervalS() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace dantesync
