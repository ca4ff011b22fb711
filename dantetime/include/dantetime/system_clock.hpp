// Copyright (c) 2025 <Your Name>
/**
 * @file system_clock.hpp
 * @brief Host system clock control (Linux adjtimex / clock_settime).
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "dantetime/clock_control.hpp"
#include "dantetime/export.hpp"

namespace dantetime {

/**
 * @brief Kernel clock implementing both stepping and frequency adjustment.
 *
 * Open() records the kernel frequency in effect before the first
 * adjustment; the destructor writes it back. Both operations require
 * CAP_SYS_TIME.
 *
 * Thread-safe: calls are serialized by an internal mutex.
 */
class DANTETIME_API SystemClock : public TimeStepper, public FrequencyAdjuster {
 public:
  SystemClock();
  ~SystemClock() override;

  SystemClock(const SystemClock&) = delete;
  SystemClock& operator=(const SystemClock&) = delete;

  /**
   * @brief Query and remember the current kernel frequency.
   * @return false if adjtimex() cannot be queried.
   */
  bool Open(std::string* err);

  TimeSpec NowUnix() override;
  bool StepClock(const TimeSpec& new_absolute_time, std::string* err) override;
  bool AdjustFrequency(double ppm, std::string* err) override;

  /** Frequency offset found at Open(), in ppm. */
  double OriginalFrequencyPpm() const;

  /** Largest |ppm| the kernel accepts. */
  static constexpr double kMaxKernelFrequencyPpm = 500.0;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Read CLOCK_MONOTONIC_RAW in nanoseconds.
 *
 * Not slewed by adjtimex, so it exposes the raw oscillator to telemetry
 * clients.
 */
DANTETIME_API uint64_t MonotonicRawNowNs();

/** @brief Read CLOCK_MONOTONIC in nanoseconds (controller timebase). */
DANTETIME_API int64_t MonotonicNowNs();

/** @brief Nominal tick frequency of MonotonicRawNowNs(). */
constexpr uint64_t kMonotonicCounterFrequencyHz = 1000000000ULL;

}  // namespace dantetime
