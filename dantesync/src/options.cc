// Copyright (c) 2025 <Your Name>
/**
 * @file options.cc
 * @brief Options builder and formatting.
 */
#include "dantesync/options.hpp"

#include <algorithm>
#include <utility>

dantesync::Options::Builder::Builder()
    : jitter_window_(30),
      jitter_warmup_(15),
      spike_window_(5),
      spike_min_fill_(3),
      spike_threshold_ppm_(10.0),
      kp_(0.1),
      ki_(0.3),
      max_integral_ppm_(200.0),
      max_freq_adjust_ppm_(500.0),
      lock_sustain_(10),
      nano_sustain_(20),
      ptp_timeout_ms_(10000),
      ntp_step_threshold_ms_(50),
      max_ntp_rtt_ms_(500),
      action_timeout_ms_(500),
      failure_threshold_(5),
      ntp_port_(123),
      skip_ntp_(false),
      listen_ptp_(true) {}

dantesync::Options::Builder::Builder(const Options& base) : Builder(base.b_) {}

dantesync::Options::Builder& dantesync::Options::Builder::JitterWindow(int v) {
  jitter_window_ = std::max(2, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::JitterWarmup(int v) {
  jitter_warmup_ = std::max(2, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::SpikeWindow(int v) {
  spike_window_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::SpikeMinFill(int v) {
  spike_min_fill_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::SpikeThresholdPpm(
    double v) {
  spike_threshold_ppm_ = std::max(0.0, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::Kp(double v) {
  kp_ = std::max(0.0, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::Ki(double v) {
  ki_ = std::max(0.0, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::MaxIntegralPpm(
    double v) {
  max_integral_ppm_ = std::max(0.0, v);
  return *this;
}

dantesync::Options::Builder&
dantesync::Options::Builder::MaxFrequencyAdjustPpm(double v) {
  max_freq_adjust_ppm_ = std::max(0.0, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::LockSustainSamples(
    int v) {
  lock_sustain_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::NanoSustainSamples(
    int v) {
  nano_sustain_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::PtpTimeoutMs(int v) {
  ptp_timeout_ms_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::NtpStepThresholdMs(
    int v) {
  ntp_step_threshold_ms_ = std::max(0, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::MaxNtpRttMs(int v) {
  max_ntp_rtt_ms_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::ActionTimeoutMs(
    int v) {
  action_timeout_ms_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::FailureThreshold(
    int v) {
  failure_threshold_ = std::max(1, v);
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::NtpServer(
    const std::string& v) {
  ntp_server_ = v;
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::NtpPort(uint16_t v) {
  ntp_port_ = v == 0 ? 123 : v;
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::Interface(
    const std::string& v) {
  interface_ = v;
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::SkipNtp(bool v) {
  skip_ntp_ = v;
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::ListenPtp(bool v) {
  listen_ptp_ = v;
  return *this;
}

dantesync::Options::Builder& dantesync::Options::Builder::LogSink(
    LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

dantesync::Options dantesync::Options::Builder::Build() const {
  Builder b(*this);
  b.jitter_warmup_ = std::min(b.jitter_warmup_, b.jitter_window_);
  b.spike_min_fill_ = std::min(b.spike_min_fill_, b.spike_window_);
  return Options(b);
}

dantesync::Options::Options() : b_() {}

namespace dantesync {
std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "jitter=" << o.JitterWindow() << "/" << o.JitterWarmup()
     << ", spike=" << o.SpikeWindow() << "@" << o.SpikeThresholdPpm() << "ppm"
     << ", kp=" << o.Kp() << ", ki=" << o.Ki()
     << ", max_i=" << o.MaxIntegralPpm() << "ppm"
     << ", max_adj=" << o.MaxFrequencyAdjustPpm() << "ppm"
     << ", lock=" << o.LockSustainSamples()
     << ", nano=" << o.NanoSustainSamples()
     << ", ptp_timeout=" << o.PtpTimeoutMs() << "ms"
     << ", ntp_step>" << o.NtpStepThresholdMs() << "ms"
     << ", ntp=" << (o.SkipNtp() ? "off" : (o.NtpServer().empty()
                                                ? "unset"
                                                : o.NtpServer()))
     << ", iface=" << (o.Interface().empty() ? "auto" : o.Interface());
  return os;
}
}  // namespace dantesync
