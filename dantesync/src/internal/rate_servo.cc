// Copyright (c) 2025 <Your Name>
#include "internal/rate_servo.hpp"

#include <algorithm>
#include <cmath>

namespace dantesync {
namespace internal {

double RateServo::Smooth(double raw_ppm, double alpha) {
  if (!has_sample_) {
    smoothed_ = raw_ppm;
    has_sample_ = true;
  } else {
    smoothed_ = (1.0 - alpha) * smoothed_ + alpha * raw_ppm;
  }
  return smoothed_;
}

bool RateServo::Correct(double gain, double* out) {
  if (!has_sample_ || !(gain > 0.0)) return false;

  // Positive drift means the local clock runs fast: slow it down.
  integral_ += -params_.ki * gain * smoothed_;
  integral_ = std::clamp(integral_, -params_.max_integral_ppm,
                         params_.max_integral_ppm);

  double corr = integral_ - params_.kp * gain * smoothed_;
  corr = std::clamp(corr, -params_.max_output_ppm, params_.max_output_ppm);
  last_correction_ = corr;
  if (out) *out = corr;
  return true;
}

double RateServo::Update(double raw_ppm, double alpha, double gain) {
  Smooth(raw_ppm, alpha);
  double corr = last_correction_;
  Correct(gain, &corr);
  return corr;
}

}  // namespace internal
}  // namespace dantesync
