// Copyright (c) 2025 <Your Name>
#include "internal/jitter_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace dantesync {
namespace internal {

constexpr double JitterEstimator::kAlphaDefault;
constexpr double JitterEstimator::kAlphaMin;
constexpr double JitterEstimator::kJitterLowPpm;
constexpr double JitterEstimator::kJitterHighPpm;

JitterEstimator::JitterEstimator(int capacity, int warmup)
    : capacity_(static_cast<size_t>(std::max(2, capacity))),
      warmup_(static_cast<size_t>(std::max(2, warmup))) {
  warmup_ = std::min(warmup_, capacity_);
}

double JitterEstimator::Observe(double drift_rate_ppm) {
  window_.push_back(drift_rate_ppm);
  while (window_.size() > capacity_) window_.pop_front();

  if (!Warm()) return kAlphaDefault;
  return AlphaForStdDev(StdDev());
}

double JitterEstimator::AlphaForStdDev(double sigma_ppm) {
  if (!(sigma_ppm > kJitterLowPpm)) return kAlphaDefault;
  if (sigma_ppm >= kJitterHighPpm) return kAlphaMin;
  double frac = (sigma_ppm - kJitterLowPpm) / (kJitterHighPpm - kJitterLowPpm);
  frac = std::clamp(frac, 0.0, 1.0);
  return kAlphaDefault - (kAlphaDefault - kAlphaMin) * frac;
}

double JitterEstimator::StdDev() const {
  const size_t n = window_.size();
  if (n < 2) return 0.0;

  // Least-squares line over sample index
  double mean_x = static_cast<double>(n - 1) / 2.0;
  double mean_y = 0.0;
  for (double v : window_) mean_y += v;
  mean_y /= static_cast<double>(n);

  double sxy = 0.0, sxx = 0.0;
  for (size_t i = 0; i < n; ++i) {
    double dx = static_cast<double>(i) - mean_x;
    sxy += dx * (window_[i] - mean_y);
    sxx += dx * dx;
  }
  double slope = (sxx > 0.0) ? sxy / sxx : 0.0;

  double ss = 0.0;
  for (size_t i = 0; i < n; ++i) {
    double fit = mean_y + slope * (static_cast<double>(i) - mean_x);
    double r = window_[i] - fit;
    ss += r * r;
  }
  return std::sqrt(ss / static_cast<double>(n - 1));
}

}  // namespace internal
}  // namespace dantesync
