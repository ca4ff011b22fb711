// Copyright (c) 2025 <Your Name>
#include "internal/action_dispatcher.hpp"

#include <sstream>
#include <utility>

#include "dantetime/system_clock.hpp"

namespace dantesync {
namespace internal {

class ActionDispatcher::QueuedStepper : public dantetime::TimeStepper {
 public:
  explicit QueuedStepper(ActionDispatcher* owner) : owner_(owner) {}

  dantetime::TimeSpec NowUnix() override {
    return owner_->stepper_ ? owner_->stepper_->NowUnix()
                            : dantetime::platform::GetDefaultTimeSource()
                                  .NowUnix();
  }

  bool StepClock(const dantetime::TimeSpec& new_absolute_time,
                 std::string* err) override {
    if (owner_->PostStep(new_absolute_time)) return true;
    if (err) *err = "action dispatcher not running";
    return false;
  }

 private:
  ActionDispatcher* owner_;
};

class ActionDispatcher::QueuedAdjuster : public dantetime::FrequencyAdjuster {
 public:
  explicit QueuedAdjuster(ActionDispatcher* owner) : owner_(owner) {}

  bool AdjustFrequency(double ppm, std::string* err) override {
    if (owner_->PostFrequency(ppm)) return true;
    if (err) *err = "action dispatcher not running";
    return false;
  }

 private:
  ActionDispatcher* owner_;
};

ActionDispatcher::ActionDispatcher(dantetime::TimeStepper* stepper,
                                   dantetime::FrequencyAdjuster* adjuster,
                                   int timeout_ms, int failure_threshold,
                                   LogCallback log_callback,
                                   OutcomeCallback outcome_callback)
    : stepper_(stepper),
      adjuster_(adjuster),
      timeout_ms_(timeout_ms),
      log_callback_(std::move(log_callback)),
      outcome_callback_(std::move(outcome_callback)),
      async_stepper_(new QueuedStepper(this)),
      async_adjuster_(new QueuedAdjuster(this)),
      step_failures_(failure_threshold),
      freq_failures_(failure_threshold) {}

ActionDispatcher::~ActionDispatcher() { Stop(); }

void ActionDispatcher::Start() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (running_) return;
  running_ = true;
  worker_ = std::thread([this]() { Loop(); });
}

void ActionDispatcher::Stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool ActionDispatcher::PostStep(const dantetime::TimeSpec& target) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!running_) return false;
    if (step_pending_) stats_.superseded++;
    step_pending_ = true;
    step_target_ = target;
    step_queued_ns_ = dantetime::MonotonicNowNs();
  }
  cv_.notify_all();
  return true;
}

bool ActionDispatcher::PostFrequency(double ppm) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!running_) return false;
    if (freq_pending_) stats_.superseded++;
    freq_pending_ = true;
    freq_ppm_ = ppm;
  }
  cv_.notify_all();
  return true;
}

ActionDispatcher::Stats ActionDispatcher::GetStats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  Stats s = stats_;
  s.fault = step_failures_.Fault() || freq_failures_.Fault();
  return s;
}

void ActionDispatcher::WaitIdle() {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [this]() {
    return (!step_pending_ && !freq_pending_ && !busy_) || !running_;
  });
}

void ActionDispatcher::Loop() {
  std::unique_lock<std::mutex> lk(mtx_);
  while (true) {
    cv_.wait(lk, [this]() {
      return step_pending_ || freq_pending_ || !running_;
    });
    if (!step_pending_ && !freq_pending_) break;  // stopped and drained

    const bool do_step = step_pending_;
    const dantetime::TimeSpec target = step_target_;
    const int64_t queued_ns = step_queued_ns_;
    const bool do_freq = freq_pending_;
    const double ppm = freq_ppm_;
    step_pending_ = false;
    freq_pending_ = false;
    busy_ = true;

    lk.unlock();
    if (do_step) ExecuteStep(target, queued_ns);
    if (do_freq) ExecuteFrequency(ppm);
    lk.lock();

    busy_ = false;
    cv_.notify_all();
  }
  cv_.notify_all();
}

void ActionDispatcher::ExecuteStep(const dantetime::TimeSpec& target,
                                   int64_t queued_ns) {
  Outcome outcome;
  outcome.kind = Outcome::Kind::Step;
  if (!stepper_) {
    outcome.error = "no step capability";
    Report(outcome);
    return;
  }
  const int64_t start = dantetime::MonotonicNowNs();
  const dantetime::TimeSpec adjusted =
      dantetime::TimeSpec::FromNanoseconds(target.ToNanoseconds() +
                                           (start - queued_ns));
  std::string err;
  const bool ok = stepper_->StepClock(adjusted, &err);
  ReportTiming("Step", dantetime::MonotonicNowNs() - start);

  bool raised = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ok) {
      step_failures_.RecordSuccess();
      stats_.steps_applied++;
    } else {
      raised = step_failures_.RecordFailure(err);
      stats_.failures++;
      stats_.last_error = "Clock step failed: " + err;
    }
  }
  if (!ok) Log("Clock step failed: " + err);
  if (raised) Log("Clock step failing persistently, fault raised");

  outcome.ok = ok;
  outcome.error = err;
  outcome.target = adjusted;
  Report(outcome);
}

void ActionDispatcher::ExecuteFrequency(double ppm) {
  Outcome outcome;
  outcome.kind = Outcome::Kind::Frequency;
  outcome.ppm = ppm;
  if (!adjuster_) {
    outcome.error = "no frequency capability";
    Report(outcome);
    return;
  }
  const int64_t start = dantetime::MonotonicNowNs();
  std::string err;
  const bool ok = adjuster_->AdjustFrequency(ppm, &err);
  ReportTiming("Frequency adjustment", dantetime::MonotonicNowNs() - start);

  bool raised = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ok) {
      freq_failures_.RecordSuccess();
      stats_.frequency_applied++;
    } else {
      raised = freq_failures_.RecordFailure(err);
      stats_.failures++;
      stats_.last_error = "Frequency adjustment failed: " + err;
    }
  }
  if (!ok) Log("Frequency adjustment failed: " + err);
  if (raised) Log("Frequency adjustment failing persistently, fault raised");

  outcome.ok = ok;
  outcome.error = err;
  Report(outcome);
}

void ActionDispatcher::Report(const Outcome& outcome) {
  if (outcome_callback_) outcome_callback_(outcome);
}

void ActionDispatcher::ReportTiming(const char* what, int64_t elapsed_ns) {
  const int64_t limit_ns = static_cast<int64_t>(timeout_ms_) * 1000000LL;
  if (elapsed_ns <= limit_ns) return;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stats_.slow_actions++;
  }
  std::ostringstream oss;
  oss << what << " took " << elapsed_ns / 1000000 << "ms (limit "
      << timeout_ms_ << "ms)";
  Log(oss.str());
}

void ActionDispatcher::Log(const std::string& msg) {
  if (log_callback_) log_callback_("[ActionDispatcher] " + msg);
}

}  // namespace internal
}  // namespace dantesync
