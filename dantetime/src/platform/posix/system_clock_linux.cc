// Copyright (c) 2025 <Your Name>
/**
 * @file system_clock_linux.cc
 * @brief Linux implementation using adjtimex() and clock_settime().
 */
#include "dantetime/system_clock.hpp"

#include <sys/timex.h>
#include <time.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <mutex>
#include <sstream>

namespace dantetime {

namespace {

// timex.freq is ppm with a 16-bit binary fraction.
constexpr double kTimexFreqScale = 65536.0;

std::string ErrnoText(const char* context) {
  int err = errno;
  std::ostringstream oss;
  oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
  return oss.str();
}

int64_t ReadClockNs(clockid_t id) {
  timespec ts{};
  clock_gettime(id, &ts);
  return static_cast<int64_t>(ts.tv_sec) * 1'000'000'000LL +
         static_cast<int64_t>(ts.tv_nsec);
}

}  // namespace

struct SystemClock::Impl {
  mutable std::mutex mtx_;
  bool opened_{false};
  bool adjusted_{false};
  long original_freq_{0};  // timex units
};

SystemClock::SystemClock() : impl_(std::make_unique<Impl>()) {}

SystemClock::~SystemClock() {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  if (!impl_->adjusted_) return;
  timex tx{};
  tx.modes = ADJ_FREQUENCY;
  tx.freq = impl_->original_freq_;
  // Nothing left to report to at teardown; the kernel keeps the last value
  // if this fails.
  (void)adjtimex(&tx);
}

bool SystemClock::Open(std::string* err) {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  timex tx{};
  tx.modes = 0;  // query only
  if (adjtimex(&tx) < 0) {
    if (err) *err = ErrnoText("adjtimex query failed");
    return false;
  }
  impl_->original_freq_ = tx.freq;
  impl_->opened_ = true;
  return true;
}

TimeSpec SystemClock::NowUnix() {
  timespec ts{};
  clock_gettime(CLOCK_REALTIME, &ts);
  return TimeSpec(static_cast<int64_t>(ts.tv_sec),
                  static_cast<uint32_t>(ts.tv_nsec));
}

bool SystemClock::StepClock(const TimeSpec& new_absolute_time,
                            std::string* err) {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(new_absolute_time.sec);
  ts.tv_nsec = static_cast<long>(new_absolute_time.nsec);
  if (clock_settime(CLOCK_REALTIME, &ts) < 0) {
    if (err) *err = ErrnoText("clock_settime failed");
    return false;
  }
  return true;
}

bool SystemClock::AdjustFrequency(double ppm, std::string* err) {
  if (!std::isfinite(ppm)) {
    if (err) *err = "non-finite frequency";
    return false;
  }
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  if (!impl_->opened_) {
    if (err) *err = "clock not opened";
    return false;
  }
  const double clamped =
      std::clamp(ppm, -kMaxKernelFrequencyPpm, kMaxKernelFrequencyPpm);
  timex tx{};
  tx.modes = ADJ_FREQUENCY;
  tx.freq = static_cast<long>(std::llround(clamped * kTimexFreqScale));
  if (adjtimex(&tx) < 0) {
    if (err) *err = ErrnoText("adjtimex ADJ_FREQUENCY failed");
    return false;
  }
  impl_->adjusted_ = true;
  return true;
}

double SystemClock::OriginalFrequencyPpm() const {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  return static_cast<double>(impl_->original_freq_) / kTimexFreqScale;
}

uint64_t MonotonicRawNowNs() {
  return static_cast<uint64_t>(ReadClockNs(CLOCK_MONOTONIC_RAW));
}

int64_t MonotonicNowNs() { return ReadClockNs(CLOCK_MONOTONIC); }

}  // namespace dantetime
