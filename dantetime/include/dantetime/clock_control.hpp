// Copyright (c) 2025 <Your Name>
/**
 * @file clock_control.hpp
 * @brief The two independent system clock capabilities.
 *
 * Stepping moves wall time and never touches the tick rate. Adjusting
 * frequency changes the tick rate and never moves wall time. Callers hold
 * them as separate interfaces; there is no combined "set clock" call.
 */
#pragma once

#include <string>

#include "dantetime/time_source.hpp"

namespace dantetime {

/**
 * @brief Sets absolute wall time.
 */
class TimeStepper : public TimeSource {
 public:
  ~TimeStepper() override = default;

  /**
   * @brief Jump the wall clock to the given instant.
   * @param new_absolute_time Target UNIX time.
   * @param err Optional error text on failure.
   * @return true when the clock was set.
   */
  virtual bool StepClock(const TimeSpec& new_absolute_time,
                         std::string* err) = 0;
};

/**
 * @brief Sets the tick rate relative to nominal.
 */
class FrequencyAdjuster {
 public:
  virtual ~FrequencyAdjuster() = default;

  /**
   * @brief Apply a frequency offset.
   * @param ppm Offset from nominal in parts per million (positive = faster).
   * @param err Optional error text on failure.
   * @return true when the kernel accepted the value.
   */
  virtual bool AdjustFrequency(double ppm, std::string* err) = 0;
};

}  // namespace dantetime
