// Copyright (c) 2025 <Your Name>
/**
 * @file jitter_estimator.hpp
 * @brief Oscillation-driven smoothing coefficient.
 *
 * Keeps the most recent accepted drift rates and maps their spread to the
 * EMA coefficient. The spread is the sample standard deviation of the
 * residuals around the window's least-squares trend line: bidirectional
 * oscillation raises it, a steady unidirectional drift change does not.
 */
#pragma once

#include <cstddef>
#include <deque>

namespace dantesync {
namespace internal {

class JitterEstimator {
 public:
  static constexpr double kAlphaDefault = 0.3;
  static constexpr double kAlphaMin = 0.1;
  static constexpr double kJitterLowPpm = 2.0;
  static constexpr double kJitterHighPpm = 8.0;

  JitterEstimator(int capacity, int warmup);

  /**
   * @brief Insert one accepted drift rate and return the new alpha.
   *
   * Returns kAlphaDefault until warmup samples are held.
   */
  double Observe(double drift_rate_ppm);

  /** Clamped linear map from spread to alpha. */
  static double AlphaForStdDev(double sigma_ppm);

  /** Detrended sample standard deviation of the current window. */
  double StdDev() const;

  size_t Count() const { return window_.size(); }
  bool Warm() const { return window_.size() >= warmup_; }
  void Clear() { window_.clear(); }

 private:
  size_t capacity_;
  size_t warmup_;
  std::deque<double> window_;
};

}  // namespace internal
}  // namespace dantesync
