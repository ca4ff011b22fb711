// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Recording clock capabilities shared by the dantesync tests.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "dantesync/sync_types.hpp"
#include "dantetime/clock_control.hpp"

namespace dantesync {
namespace test {

/** Wall clock frozen at a settable instant; records every step. */
class FakeStepper : public dantetime::TimeStepper {
 public:
  explicit FakeStepper(dantetime::TimeSpec now = dantetime::TimeSpec(
                           1700000000, 0))
      : now_(now) {}

  dantetime::TimeSpec NowUnix() override {
    std::lock_guard<std::mutex> lk(mtx_);
    return now_;
  }

  bool StepClock(const dantetime::TimeSpec& t, std::string* err) override {
    if (delay_ms_ > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (fail_) {
      if (err) *err = "EPERM";
      return false;
    }
    steps_.push_back(t);
    now_ = t;
    return true;
  }

  void SetFail(bool f) {
    std::lock_guard<std::mutex> lk(mtx_);
    fail_ = f;
  }
  void SetDelayMs(int ms) { delay_ms_ = ms; }

  std::vector<dantetime::TimeSpec> Steps() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return steps_;
  }

 private:
  mutable std::mutex mtx_;
  dantetime::TimeSpec now_;
  bool fail_ = false;
  std::atomic<int> delay_ms_{0};
  std::vector<dantetime::TimeSpec> steps_;
};

/** Records every frequency set; can be told to fail or stall. */
class FakeAdjuster : public dantetime::FrequencyAdjuster {
 public:
  bool AdjustFrequency(double ppm, std::string* err) override {
    if (delay_ms_ > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (fail_) {
      if (err) *err = "adjtimex: Operation not permitted";
      return false;
    }
    values_.push_back(ppm);
    return true;
  }

  void SetFail(bool f) {
    std::lock_guard<std::mutex> lk(mtx_);
    fail_ = f;
  }
  void SetDelayMs(int ms) { delay_ms_ = ms; }

  std::vector<double> Values() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return values_;
  }

 private:
  mutable std::mutex mtx_;
  bool fail_ = false;
  std::atomic<int> delay_ms_{0};
  std::vector<double> values_;
};

/**
 * @brief Generates paired PTP observations for a local clock running at a
 *        fixed rate error against the grandmaster.
 */
class PtpFeed {
 public:
  static constexpr int64_t kIntervalNs = 125000000;  // 8 Sync/s

  explicit PtpFeed(double drift_ppm = 0.0) : drift_ppm_(drift_ppm) {
    gm_ = GrandmasterId{{0x00, 0x1d, 0xc1, 0x0a, 0x0b, 0x0c}};
  }

  void SetDriftPpm(double ppm) { drift_ppm_ = ppm; }
  void SetGrandmaster(const GrandmasterId& gm) { gm_ = gm; }

  /** Add a one-off offset (ns) to the next sample only. */
  void InjectOffsetNs(int64_t ns) { extra_ns_ = ns; }

  /** Next sample, interval_ns after the previous one. */
  PtpSample Next(int64_t interval_ns = kIntervalNs) {
    master_ns_ += interval_ns;
    local_offset_ns_ += static_cast<int64_t>(
        static_cast<double>(interval_ns) * drift_ppm_ / 1e6);
    PtpSample s;
    s.master_send_time = dantetime::TimeSpec::FromNanoseconds(master_ns_);
    s.local_receipt_time = dantetime::TimeSpec::FromNanoseconds(
        master_ns_ + local_offset_ns_ + extra_ns_);
    s.sequence = seq_++;
    s.grandmaster = gm_;
    extra_ns_ = 0;
    return s;
  }

 private:
  double drift_ppm_;
  GrandmasterId gm_;
  int64_t master_ns_ = 1000000000000LL;
  int64_t local_offset_ns_ = 0;
  int64_t extra_ns_ = 0;
  uint16_t seq_ = 0;
};

}  // namespace test
}  // namespace dantesync
