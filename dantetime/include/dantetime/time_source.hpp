// Copyright (c) 2025 <Your Name>
/**
 * @file time_source.hpp
 * @brief Minimal time source interface (UNIX time provider).
 */
#pragma once

#include "dantetime/time_spec.hpp"

namespace dantetime {

/**
 * Interface for wall-clock readers.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current time since the UNIX epoch. */
  virtual TimeSpec NowUnix() = 0;
};

namespace platform {

/** Process-wide reader of CLOCK_REALTIME. */
TimeSource& GetDefaultTimeSource();

}  // namespace platform

}  // namespace dantetime
