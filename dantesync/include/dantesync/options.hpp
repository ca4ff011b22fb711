// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Immutable configuration for SyncController and SyncService.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace dantesync {

/**
 * @brief Immutable options.
 *
 * Use the Builder to construct instances. Setters clamp out-of-range
 * values instead of failing.
 */
class Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  class Builder {
   public:
    Builder();
    explicit Builder(const Options& base);

    /** Drift-rate samples kept for jitter measurement (default: 30). */
    Builder& JitterWindow(int v);
    /** Samples before the jitter estimate is trusted (default: 15). */
    Builder& JitterWarmup(int v);
    /** Median window of the spike filter (default: 5). */
    Builder& SpikeWindow(int v);
    /** Minimum spike window fill before filtering starts (default: 3). */
    Builder& SpikeMinFill(int v);
    /** Deviation from the median treated as a spike, ppm (default: 10). */
    Builder& SpikeThresholdPpm(double v);
    /** Proportional gain (default: 0.1). */
    Builder& Kp(double v);
    /** Integral gain (default: 0.3). */
    Builder& Ki(double v);
    /** Integral clamp, ppm (default: 200). */
    Builder& MaxIntegralPpm(double v);
    /** Output clamp, ppm (default: 500). */
    Builder& MaxFrequencyAdjustPpm(double v);
    /** Consecutive samples below 5 ppm to enter Locked (default: 10). */
    Builder& LockSustainSamples(int v);
    /** Consecutive samples below 0.5 ppm to enter Nano (default: 20). */
    Builder& NanoSustainSamples(int v);
    /** PTP silence before falling back to NtpOnly (default: 10000). */
    Builder& PtpTimeoutMs(int v);
    /** NTP offsets above this step the clock (default: 50). */
    Builder& NtpStepThresholdMs(int v);
    /** NTP samples with a longer round trip are rejected (default: 500). */
    Builder& MaxNtpRttMs(int v);
    /** Clock actions slower than this are reported (default: 500). */
    Builder& ActionTimeoutMs(int v);
    /** Consecutive failures that raise the clock fault (default: 5). */
    Builder& FailureThreshold(int v);
    /** NTP server, numeric IPv4; empty disables NTP (default: empty). */
    Builder& NtpServer(const std::string& v);
    /** NTP server UDP port (default: 123). */
    Builder& NtpPort(uint16_t v);
    /** Network interface name for PTP, empty picks one (default: empty). */
    Builder& Interface(const std::string& v);
    /** Disable the NTP path (default: false). */
    Builder& SkipNtp(bool v);
    /** Open the PTP multicast listeners (default: true). */
    Builder& ListenPtp(bool v);
    Builder& LogSink(LogCallback cb);

    Options Build() const;

   private:
    friend class Options;
    int jitter_window_;
    int jitter_warmup_;
    int spike_window_;
    int spike_min_fill_;
    double spike_threshold_ppm_;
    double kp_;
    double ki_;
    double max_integral_ppm_;
    double max_freq_adjust_ppm_;
    int lock_sustain_;
    int nano_sustain_;
    int ptp_timeout_ms_;
    int ntp_step_threshold_ms_;
    int max_ntp_rtt_ms_;
    int action_timeout_ms_;
    int failure_threshold_;
    std::string ntp_server_;
    uint16_t ntp_port_;
    std::string interface_;
    bool skip_ntp_;
    bool listen_ptp_;
    LogCallback log_sink_cb_;
  };

  Options();

  /** @name Getters (immutable) */
  ///@{
  int JitterWindow() const { return b_.jitter_window_; }
  int JitterWarmup() const { return b_.jitter_warmup_; }
  int SpikeWindow() const { return b_.spike_window_; }
  int SpikeMinFill() const { return b_.spike_min_fill_; }
  double SpikeThresholdPpm() const { return b_.spike_threshold_ppm_; }
  double Kp() const { return b_.kp_; }
  double Ki() const { return b_.ki_; }
  double MaxIntegralPpm() const { return b_.max_integral_ppm_; }
  double MaxFrequencyAdjustPpm() const { return b_.max_freq_adjust_ppm_; }
  int LockSustainSamples() const { return b_.lock_sustain_; }
  int NanoSustainSamples() const { return b_.nano_sustain_; }
  int PtpTimeoutMs() const { return b_.ptp_timeout_ms_; }
  int NtpStepThresholdMs() const { return b_.ntp_step_threshold_ms_; }
  int MaxNtpRttMs() const { return b_.max_ntp_rtt_ms_; }
  int ActionTimeoutMs() const { return b_.action_timeout_ms_; }
  int FailureThreshold() const { return b_.failure_threshold_; }
  const std::string& NtpServer() const { return b_.ntp_server_; }
  uint16_t NtpPort() const { return b_.ntp_port_; }
  const std::string& Interface() const { return b_.interface_; }
  bool SkipNtp() const { return b_.skip_ntp_; }
  bool ListenPtp() const { return b_.listen_ptp_; }
  const LogCallback& LogSink() const { return b_.log_sink_cb_; }
  ///@}

  friend std::ostream& operator<<(std::ostream& os, const Options& o);

 private:
  explicit Options(const Builder& b) : b_(b) {}

  Builder b_;
};

}  // namespace dantesync
