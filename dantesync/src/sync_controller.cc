// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Implementation of the synchronization controller.
 *
 * PTP path: paired Sync/Follow_Up -> drift rate against the previous pair
 * -> spike filter -> jitter estimator (alpha) -> EMA -> mode -> PI servo ->
 * frequency action.
 * NTP path: offset -> step decision -> step action, resetting the phase
 * accountant and the PTP rate baseline once the step is applied.
 */
#include "dantesync/sync_controller.hpp"

#include <cmath>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#include "internal/failure_tracker.hpp"
#include "internal/jitter_estimator.hpp"
#include "internal/mode_state_machine.hpp"
#include "internal/phase_accountant.hpp"
#include "internal/rate_servo.hpp"
#include "internal/spike_filter.hpp"

namespace {

constexpr int64_t kMinIntervalNs = 1000000LL;     // 1 ms
constexpr int64_t kMaxIntervalNs = 2000000000LL;  // 2 s
constexpr double kMaxPlausibleRatePpm = 100000.0;
// Samples that only re-baseline after a step; the first may pair a Sync
// stamped before the step.
constexpr int kPostStepHoldoffSamples = 2;

/** Sub-second phase of t2 against t1, wrapped into +/-0.5 s. */
int64_t PhaseOffsetNs(const dantetime::TimeSpec& local,
                      const dantetime::TimeSpec& master) {
  int64_t d =
      static_cast<int64_t>(local.nsec) - static_cast<int64_t>(master.nsec);
  if (d > dantetime::kNanosPerSecond / 2) d -= dantetime::kNanosPerSecond;
  if (d < -dantetime::kNanosPerSecond / 2) d += dantetime::kNanosPerSecond;
  return d;
}

dantesync::internal::RateServo::Params ServoParams(
    const dantesync::Options& o) {
  dantesync::internal::RateServo::Params p;
  p.kp = o.Kp();
  p.ki = o.Ki();
  p.max_integral_ppm = o.MaxIntegralPpm();
  p.max_output_ppm = o.MaxFrequencyAdjustPpm();
  return p;
}

}  // namespace

namespace dantesync {
std::ostream& operator<<(std::ostream& os, const Status& s) {
  os << "mode=" << s.mode << (s.is_locked ? " (locked)" : "")
     << ", drift=" << s.smoothed_rate_ppm << "ppm"
     << ", raw=" << s.raw_rate_ppm << "ppm"
     << ", alpha=" << s.alpha << ", freq=" << s.frequency_ppm << "ppm"
     << ", integral=" << s.integral_ppm << "ppm"
     << ", phase_err=" << s.accumulated_phase_us << "us"
     << ", ntp_poll=" << s.ntp_poll_interval_s << "s"
     << ", ptp_offset=" << s.ptp_offset_ns << "ns";
  if (s.have_grandmaster) os << ", gm=" << FormatGrandmaster(s.grandmaster);
  os << ", samples=" << s.samples_accepted << "/" << s.samples_substituted
     << "/" << s.samples_rejected << ", steps=" << s.ntp_steps
     << ", resets=" << s.soft_resets;
  if (s.clock_control_fault) os << ", FAULT";
  if (!s.last_error.empty()) os << ", err='" << s.last_error << "'";
  return os;
}
}  // namespace dantesync

// ---------------- Impl ----------------
struct dantesync::SyncController::Impl {
  Impl(dantetime::TimeStepper* st, dantetime::FrequencyAdjuster* adj,
       const Options& o, ClockActionMode am)
      : stepper(st),
        adjuster(adj),
        action_mode(am),
        opts(o),
        log_callback_(o.LogSink()),
        spike(o.SpikeWindow(), o.SpikeMinFill(), o.SpikeThresholdPpm()),
        jitter(o.JitterWindow(), o.JitterWarmup()),
        servo(ServoParams(o)),
        mode(o.LockSustainSamples(), o.NanoSustainSamples()),
        step_failures(o.FailureThreshold()),
        freq_failures(o.FailureThreshold()) {}

  dantetime::TimeStepper* stepper;
  dantetime::FrequencyAdjuster* adjuster;
  ClockActionMode action_mode;
  Options opts;
  Options::LogCallback log_callback_;

  internal::SpikeFilter spike;
  internal::JitterEstimator jitter;
  internal::RateServo servo;
  internal::ModeStateMachine mode;
  internal::PhaseAccountant phase;
  internal::FailureTracker step_failures;
  internal::FailureTracker freq_failures;

  // Time bookkeeping (monotonic ns)
  bool started = false;
  int64_t start_ns = 0;
  bool have_ptp = false;
  int64_t last_ptp_ns = 0;
  bool have_tick = false;
  int64_t last_tick_ns = 0;

  // Offset of the step waiting for its outcome
  double pending_step_offset_s = 0.0;

  // PTP rate baseline
  bool have_baseline = false;
  int baseline_holdoff = 0;
  RateSample baseline;
  int64_t baseline_master_ns = 0;

  // Working copy of the published status
  Status work;

  mutable std::mutex snap_mtx;
  std::shared_ptr<const Status> snapshot{std::make_shared<const Status>()};

  void Touch(int64_t now_ns) {
    if (!started) {
      started = true;
      start_ns = now_ns;
    }
    work.last_update_ns = now_ns;
  }

  bool PtpLive(int64_t now_ns) const {
    return have_ptp &&
           (now_ns - last_ptp_ns) < static_cast<int64_t>(opts.PtpTimeoutMs()) *
                                        1000000LL;
  }

  bool InStartupGrace(int64_t now_ns) const {
    return (now_ns - start_ns) <
           static_cast<int64_t>(opts.PtpTimeoutMs()) * 1000000LL;
  }

  Mode EvaluateMode(int64_t now_ns, bool has_sample, double smoothed);
  void AdoptGrandmaster(const GrandmasterId& gm);
  void SoftReset(const GrandmasterId& gm);
  bool ComputeDriftRate(const RateSample& cur, int64_t master_ns,
                        double* rate_ppm, std::string* why) const;
  void Rebase(const RateSample& cur, int64_t master_ns);
  void IssueFrequency(double ppm);
  void FrequencyApplied(double ppm);
  void FrequencyFailed(const std::string& err);
  void ApplyNtpStep(double offset_s);
  void StepApplied(double offset_s);
  void StepFailed(const std::string& err);
  void RecordError(const std::string& msg);
  void RecordRejection(const std::string& msg);
  void Log(const std::string& msg) const;
  void Publish();
};

void dantesync::SyncController::Impl::Log(const std::string& msg) const {
  if (log_callback_) log_callback_("[SyncController] " + msg);
}

void dantesync::SyncController::Impl::RecordError(const std::string& msg) {
  work.last_error = msg;
  Log(msg);
}

void dantesync::SyncController::Impl::RecordRejection(const std::string& msg) {
  work.last_rejection = msg;
  Log(msg);
}

dantesync::Mode dantesync::SyncController::Impl::EvaluateMode(
    int64_t now_ns, bool has_sample, double smoothed) {
  internal::ModeStateMachine::Input in;
  in.ptp_live = PtpLive(now_ns);
  in.startup_grace = InStartupGrace(now_ns);
  in.has_sample = has_sample;
  in.smoothed_ppm = smoothed;

  const Mode before = mode.Current();
  const Mode after = mode.Evaluate(in);
  if (after != before) {
    std::ostringstream oss;
    oss << "Mode " << before << " -> " << after
        << " (drift=" << servo.Smoothed() << "ppm)";
    Log(oss.str());
  }
  return after;
}

void dantesync::SyncController::Impl::AdoptGrandmaster(
    const GrandmasterId& gm) {
  work.grandmaster = gm;
  work.have_grandmaster = true;
  Log("Tracking grandmaster " + FormatGrandmaster(gm));
}

void dantesync::SyncController::Impl::SoftReset(const GrandmasterId& gm) {
  std::ostringstream oss;
  oss << "Grandmaster changed " << FormatGrandmaster(work.grandmaster)
      << " -> " << FormatGrandmaster(gm) << ", soft reset (keeping drift="
      << servo.Smoothed() << "ppm, integral=" << servo.Integral() << "ppm)";
  Log(oss.str());

  spike.Clear();
  jitter.Clear();
  phase.Reset();
  have_baseline = false;
  mode.ForceAcquiring();

  work.grandmaster = gm;
  work.soft_resets++;
}

bool dantesync::SyncController::Impl::ComputeDriftRate(
    const RateSample& cur, int64_t master_ns, double* rate_ppm,
    std::string* why) const {
  const int64_t d_local = cur.timestamp_ns - baseline.timestamp_ns;
  const int64_t d_master = master_ns - baseline_master_ns;

  if (d_local < kMinIntervalNs || d_local > kMaxIntervalNs ||
      d_master < kMinIntervalNs || d_master > kMaxIntervalNs) {
    std::ostringstream oss;
    oss << "interval out of range (local=" << d_local / 1000
        << "us, master=" << d_master / 1000 << "us)";
    *why = oss.str();
    return false;
  }

  const double d_offset =
      static_cast<double>(cur.offset_ns - baseline.offset_ns);
  const double rate = d_offset / static_cast<double>(d_master) * 1e6;
  if (!std::isfinite(rate) || std::abs(rate) > kMaxPlausibleRatePpm) {
    std::ostringstream oss;
    oss << "implausible drift rate " << rate << "ppm";
    *why = oss.str();
    return false;
  }
  *rate_ppm = rate;
  return true;
}

void dantesync::SyncController::Impl::Rebase(const RateSample& cur,
                                              int64_t master_ns) {
  baseline = cur;
  baseline_master_ns = master_ns;
  have_baseline = true;
}

void dantesync::SyncController::Impl::IssueFrequency(double ppm) {
  if (!adjuster) return;
  std::string err;
  if (!adjuster->AdjustFrequency(ppm, &err)) {
    FrequencyFailed(err);
    return;
  }
  if (action_mode == ClockActionMode::Direct) FrequencyApplied(ppm);
}

void dantesync::SyncController::Impl::FrequencyApplied(double ppm) {
  freq_failures.RecordSuccess();
  work.frequency_ppm = ppm;
  work.frequency_updates++;
}

void dantesync::SyncController::Impl::FrequencyFailed(const std::string& err) {
  work.frequency_failures++;
  const bool raised = freq_failures.RecordFailure(err);
  RecordError("Frequency adjustment failed: " + err);
  if (raised) {
    std::ostringstream oss;
    oss << "Frequency adjustment failed " << freq_failures.Consecutive()
        << " times in a row, clock control fault raised";
    Log(oss.str());
  }
}

void dantesync::SyncController::Impl::ApplyNtpStep(double offset_s) {
  if (!stepper) {
    Log("No step capability, NTP offset left uncorrected");
    return;
  }
  const dantetime::TimeSpec target =
      dantetime::AddSeconds(stepper->NowUnix(), offset_s);
  std::string err;
  if (!stepper->StepClock(target, &err)) {
    StepFailed(err);
    return;
  }
  if (action_mode == ClockActionMode::Direct) {
    StepApplied(offset_s);
    return;
  }
  pending_step_offset_s = offset_s;
  std::ostringstream oss;
  oss << "Queued clock step of " << offset_s * 1000.0 << "ms";
  Log(oss.str());
}

void dantesync::SyncController::Impl::StepApplied(double offset_s) {
  step_failures.RecordSuccess();
  phase.Reset();
  have_baseline = false;  // local timestamps jumped
  baseline_holdoff = kPostStepHoldoffSamples;
  work.ntp_steps++;

  std::ostringstream oss;
  oss << "Stepped clock by " << offset_s * 1000.0 << "ms";
  Log(oss.str());
}

void dantesync::SyncController::Impl::StepFailed(const std::string& err) {
  work.step_failures++;
  const bool raised = step_failures.RecordFailure(err);
  RecordError("Clock step failed: " + err);
  if (raised) {
    std::ostringstream oss;
    oss << "Clock step failed " << step_failures.Consecutive()
        << " times in a row, clock control fault raised";
    Log(oss.str());
  }
}

void dantesync::SyncController::Impl::Publish() {
  work.mode = mode.Current();
  work.is_locked = IsLockedMode(work.mode);
  work.smoothed_rate_ppm = servo.Smoothed();
  work.integral_ppm = servo.Integral();
  work.jitter_stddev_ppm = jitter.StdDev();
  work.accumulated_phase_us = phase.ErrorUs();
  work.ntp_poll_interval_s = phase.PollIntervalS();
  work.clock_control_fault = step_failures.Fault() || freq_failures.Fault();
  work.spike_window_fill = spike.Size();
  work.jitter_window_fill = jitter.Count();

  auto next = std::make_shared<const Status>(work);
  std::lock_guard<std::mutex> lk(snap_mtx);
  snapshot = std::move(next);
}

// ---------------- SyncController ----------------
dantesync::SyncController::SyncController(
    dantetime::TimeStepper* stepper, dantetime::FrequencyAdjuster* adjuster,
    const Options& opt, ClockActionMode action_mode)
    : p_(new Impl(stepper, adjuster, opt, action_mode)) {
  p_->Publish();
}

dantesync::SyncController::~SyncController() = default;

dantesync::SampleOutcome dantesync::SyncController::OnPtpSample(
    const PtpSample& sample, int64_t now_ns) {
  Impl& s = *p_;
  s.Touch(now_ns);
  s.work.ptp_samples++;
  s.have_ptp = true;
  s.last_ptp_ns = now_ns;

  if (!s.work.have_grandmaster) {
    s.AdoptGrandmaster(sample.grandmaster);
  } else if (sample.grandmaster != s.work.grandmaster) {
    s.SoftReset(sample.grandmaster);
  }

  s.work.ptp_offset_ns =
      PhaseOffsetNs(sample.local_receipt_time, sample.master_send_time);

  RateSample cur;
  cur.timestamp_ns = sample.local_receipt_time.ToNanoseconds();
  const int64_t master_ns = sample.master_send_time.ToNanoseconds();
  cur.offset_ns = cur.timestamp_ns - master_ns;
  cur.source = SampleSource::Ptp;

  if (!s.have_baseline || s.baseline_holdoff > 0) {
    if (s.baseline_holdoff > 0) --s.baseline_holdoff;
    s.Rebase(cur, master_ns);
    s.EvaluateMode(now_ns, false, 0.0);
    s.work.samples_accepted++;
    s.Publish();
    return SampleOutcome::Accepted;
  }

  double rate = 0.0;
  std::string why;
  if (!s.ComputeDriftRate(cur, master_ns, &rate, &why)) {
    s.Rebase(cur, master_ns);
    s.work.samples_rejected++;
    std::ostringstream oss;
    oss << "Rejected PTP sample seq=" << sample.sequence << ": " << why;
    s.RecordRejection(oss.str());
    s.EvaluateMode(now_ns, false, 0.0);
    s.Publish();
    return SampleOutcome::Rejected;
  }

  const double dt_s =
      static_cast<double>(cur.timestamp_ns - s.baseline.timestamp_ns) / 1e9;
  s.Rebase(cur, master_ns);
  s.work.raw_rate_ppm = rate;

  const internal::SpikeFilter::Result filtered = s.spike.Filter(rate);
  if (filtered.substituted) {
    std::ostringstream oss;
    oss << "Spike " << rate << "ppm replaced by median " << filtered.median
        << "ppm";
    s.Log(oss.str());
  }

  const double alpha = s.jitter.Observe(filtered.value);
  s.work.alpha = alpha;
  const double smoothed = s.servo.Smooth(filtered.value, alpha);

  const Mode m = s.EvaluateMode(now_ns, true, smoothed);
  double corr = 0.0;
  if (s.servo.Correct(internal::ModeStateMachine::GainFor(m), &corr)) {
    s.IssueFrequency(corr);
  }
  s.phase.Tick(smoothed, dt_s);

  SampleOutcome outcome = SampleOutcome::Accepted;
  if (filtered.substituted) {
    s.work.samples_substituted++;
    outcome = SampleOutcome::Substituted;
  } else {
    s.work.samples_accepted++;
  }
  s.Publish();
  return outcome;
}

dantesync::SampleOutcome dantesync::SyncController::OnNtpSample(
    const NtpSample& sample, int64_t now_ns) {
  Impl& s = *p_;
  s.Touch(now_ns);
  s.work.ntp_samples++;

  const double max_rtt_s = s.opts.MaxNtpRttMs() / 1000.0;
  if (!std::isfinite(sample.offset_s) ||
      !std::isfinite(sample.round_trip_delay_s) ||
      sample.round_trip_delay_s < 0.0 ||
      sample.round_trip_delay_s > max_rtt_s) {
    s.work.samples_rejected++;
    std::ostringstream oss;
    oss << "Rejected NTP sample: offset=" << sample.offset_s
        << "s, delay=" << sample.round_trip_delay_s << "s";
    s.RecordRejection(oss.str());
    s.Publish();
    return SampleOutcome::Rejected;
  }

  s.work.last_ntp_offset_s = sample.offset_s;
  s.work.last_ntp_delay_s = sample.round_trip_delay_s;
  s.work.samples_accepted++;

  const double threshold_s = s.opts.NtpStepThresholdMs() / 1000.0;
  if (std::abs(sample.offset_s) > threshold_s) {
    s.ApplyNtpStep(sample.offset_s);
  } else {
    std::ostringstream oss;
    oss << "NTP offset " << sample.offset_s * 1000.0 << "ms within "
        << s.opts.NtpStepThresholdMs() << "ms, no step";
    s.Log(oss.str());
  }
  s.Publish();
  return SampleOutcome::Accepted;
}

void dantesync::SyncController::OnStepResult(bool ok, const std::string& err,
                                             int64_t now_ns) {
  Impl& s = *p_;
  s.Touch(now_ns);
  if (ok) {
    s.StepApplied(s.pending_step_offset_s);
  } else {
    s.StepFailed(err);
  }
  s.Publish();
}

void dantesync::SyncController::OnFrequencyResult(double ppm, bool ok,
                                                  const std::string& err,
                                                  int64_t now_ns) {
  Impl& s = *p_;
  s.Touch(now_ns);
  if (ok) {
    s.FrequencyApplied(ppm);
  } else {
    s.FrequencyFailed(err);
  }
  s.Publish();
}

void dantesync::SyncController::Tick(int64_t now_ns) {
  Impl& s = *p_;
  s.Touch(now_ns);
  if (s.have_tick && s.mode.Current() == Mode::NtpOnly) {
    // No PTP cadence to tick on: advance by the last known drift.
    const double dt_s = static_cast<double>(now_ns - s.last_tick_ns) / 1e9;
    s.phase.Tick(s.servo.Smoothed(), dt_s);
  }
  s.have_tick = true;
  s.last_tick_ns = now_ns;

  s.EvaluateMode(now_ns, false, 0.0);
  s.Publish();
}

std::shared_ptr<const dantesync::Status> dantesync::SyncController::Snapshot()
    const {
  std::lock_guard<std::mutex> lk(p_->snap_mtx);
  return p_->snapshot;
}

dantesync::Status dantesync::SyncController::GetStatus() const {
  return *Snapshot();
}

int dantesync::SyncController::NtpPollIntervalS() const {
  return Snapshot()->ntp_poll_interval_s;
}
