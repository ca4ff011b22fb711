// Copyright (c) 2025 <Your Name>
/**
 * @file default_time_source.cc (POSIX)
 * @brief CLOCK_REALTIME reader shared by servers that only read time.
 */
#include <time.h>

#include "dantetime/time_source.hpp"

namespace dantetime {
namespace platform {

namespace {
class RealtimeSource : public TimeSource {
 public:
  TimeSpec NowUnix() override {
    timespec ts{};
    clock_gettime(CLOCK_REALTIME, &ts);
    return TimeSpec(static_cast<int64_t>(ts.tv_sec),
                    static_cast<uint32_t>(ts.tv_nsec));
  }
};
}  // namespace

TimeSource& GetDefaultTimeSource() {
  static RealtimeSource source;
  return source;
}

}  // namespace platform
}  // namespace dantetime
