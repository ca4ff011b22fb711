// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Phase error bookkeeping between NTP steps.
 *
 * Frequency correction leaves a residual drift that walks the wall clock
 * away from true time; the accumulated estimate decides how soon NTP is
 * asked again.
 */

#ifndef DANTESYNC_INTERNAL_PHASE_ACCOUNTANT_HPP_
#define DANTESYNC_INTERNAL_PHASE_ACCOUNTANT_HPP_

#include <cmath>

namespace dantesync {
namespace internal {

class PhaseAccountant {
 public:
  static constexpr double kFastThresholdUs = 50.0;
  static constexpr double kMediumThresholdUs = 20.0;
  static constexpr int kFastPollS = 10;
  static constexpr int kMediumPollS = 15;
  static constexpr int kSlowPollS = 30;

  /** error += |rate| * dt. Non-finite or negative dt is ignored. */
  void Tick(double drift_rate_ppm, double dt_s) {
    if (!std::isfinite(drift_rate_ppm) || !std::isfinite(dt_s) || dt_s <= 0.0)
      return;
    error_us_ += std::abs(drift_rate_ppm) * dt_s;
  }

  /** Called together with an applied NTP step. */
  void Reset() { error_us_ = 0.0; }

  double ErrorUs() const { return error_us_; }

  /** 10 s above 50 us, 15 s above 20 us, otherwise 30 s. */
  int PollIntervalS() const {
    if (error_us_ > kFastThresholdUs) return kFastPollS;
    if (error_us_ > kMediumThresholdUs) return kMediumPollS;
    return kSlowPollS;
  }

 private:
  double error_us_ = 0.0;
};

}  // namespace internal
}  // namespace dantesync

#endif  // DANTESYNC_INTERNAL_PHASE_ACCOUNTANT_HPP_
