// Copyright (c) 2025 <Your Name>
/**
 * @file action_dispatcher.hpp
 * @brief Runs clock actions off the control thread.
 *
 * The control loop posts "step to time" and "set frequency" actions and
 * never waits for them. One worker executes them in order, step first. A
 * newer action of one kind replaces a pending one of the same kind. Each
 * execution is timed against the action timeout; slow or failed actions
 * are logged and counted, never retried. The outcome of every executed
 * action is handed to the outcome callback on the worker thread; a
 * superseded action has no outcome.
 */
#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "dantetime/clock_control.hpp"
#include "internal/failure_tracker.hpp"

namespace dantesync {
namespace internal {

class ActionDispatcher {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  struct Stats {
    uint64_t steps_applied = 0;
    uint64_t frequency_applied = 0;
    uint64_t superseded = 0;    ///< Pending actions replaced by newer ones
    uint64_t failures = 0;
    uint64_t slow_actions = 0;  ///< Exceeded the action timeout
    bool fault = false;         ///< Repeated failures of one capability
    std::string last_error;
  };

  /** Result of one executed action. */
  struct Outcome {
    enum class Kind { Step, Frequency };
    Kind kind = Kind::Step;
    bool ok = false;
    std::string error;              ///< Platform error text when !ok
    dantetime::TimeSpec target;     ///< Step: the time actually applied
    double ppm = 0.0;               ///< Frequency: the value applied
  };
  using OutcomeCallback = std::function<void(const Outcome&)>;

  ActionDispatcher(dantetime::TimeStepper* stepper,
                   dantetime::FrequencyAdjuster* adjuster, int timeout_ms,
                   int failure_threshold, LogCallback log_callback,
                   OutcomeCallback outcome_callback = OutcomeCallback());
  ~ActionDispatcher();

  ActionDispatcher(const ActionDispatcher&) = delete;
  ActionDispatcher& operator=(const ActionDispatcher&) = delete;

  void Start();

  /** Run what is pending, then join the worker. */
  void Stop();

  /**
   * @brief Queue a step to target.
   *
   * The target is advanced by the time the action spends queued.
   * @return false when the dispatcher is not running.
   */
  bool PostStep(const dantetime::TimeSpec& target);

  /** @return false when the dispatcher is not running. */
  bool PostFrequency(double ppm);

  Stats GetStats() const;

  /** Blocks until nothing is pending or executing (tests, shutdown). */
  void WaitIdle();

  /** Decorators that post instead of executing; owned by the dispatcher. */
  dantetime::TimeStepper* AsyncStepper() { return async_stepper_.get(); }
  dantetime::FrequencyAdjuster* AsyncAdjuster() {
    return async_adjuster_.get();
  }

 private:
  class QueuedStepper;
  class QueuedAdjuster;

  void Loop();
  void ExecuteStep(const dantetime::TimeSpec& target, int64_t queued_ns);
  void ExecuteFrequency(double ppm);
  void ReportTiming(const char* what, int64_t elapsed_ns);
  void Report(const Outcome& outcome);
  void Log(const std::string& msg);

  dantetime::TimeStepper* stepper_;
  dantetime::FrequencyAdjuster* adjuster_;
  int timeout_ms_;
  LogCallback log_callback_;
  OutcomeCallback outcome_callback_;

  std::unique_ptr<dantetime::TimeStepper> async_stepper_;
  std::unique_ptr<dantetime::FrequencyAdjuster> async_adjuster_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool running_ = false;
  bool busy_ = false;
  bool step_pending_ = false;
  dantetime::TimeSpec step_target_;
  int64_t step_queued_ns_ = 0;
  bool freq_pending_ = false;
  double freq_ppm_ = 0.0;

  FailureTracker step_failures_;
  FailureTracker freq_failures_;
  Stats stats_;

  std::thread worker_;
};

}  // namespace internal
}  // namespace dantesync
