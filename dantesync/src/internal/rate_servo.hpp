// Copyright (c) 2025 <Your Name>
/**
 * @file rate_servo.hpp
 * @brief EMA smoothing and PI frequency correction.
 */

#ifndef DANTESYNC_INTERNAL_RATE_SERVO_HPP_
#define DANTESYNC_INTERNAL_RATE_SERVO_HPP_

namespace dantesync {
namespace internal {

/**
 * @brief PI servo on the smoothed drift rate.
 *
 * The EMA is the only place alpha is applied; the mode gain scales the PI
 * terms afterwards. Smoothed rate and integral are the learned state kept
 * across a soft reset.
 */
class RateServo {
 public:
  struct Params {
    double kp = 0.1;
    double ki = 0.3;
    double max_integral_ppm = 200.0;
    double max_output_ppm = 500.0;
  };

  explicit RateServo(const Params& p) : params_(p) {}

  /**
   * @brief Fold one drift rate into the EMA.
   *
   * The first sample seeds the average directly.
   * @return New smoothed rate (ppm).
   */
  double Smooth(double raw_ppm, double alpha);

  /**
   * @brief Advance the PI terms with the current smoothed rate.
   *
   * @param gain Mode gain; zero holds the previous correction.
   * @param out Correction to apply (ppm), written only on true.
   * @return false when no action should be issued.
   */
  bool Correct(double gain, double* out);

  /**
   * @brief Smooth then correct in one call.
   * @return Correction (ppm); the previous one when nothing was issued.
   */
  double Update(double raw_ppm, double alpha, double gain);

  bool HasSample() const { return has_sample_; }
  double Smoothed() const { return smoothed_; }
  double Integral() const { return integral_; }
  double LastCorrection() const { return last_correction_; }

 private:
  Params params_;
  bool has_sample_ = false;
  double smoothed_ = 0.0;
  double integral_ = 0.0;
  double last_correction_ = 0.0;
};

}  // namespace internal
}  // namespace dantesync

#endif  // DANTESYNC_INTERNAL_RATE_SERVO_HPP_
