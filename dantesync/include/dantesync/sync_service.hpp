// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Threaded host for SyncController.
 *
 * Threads:
 * - control: drains the event queue in order and ticks once per second;
 *   the only thread that touches the controller.
 * - PTP receive (two, one per port): pair Sync/Follow_Up and enqueue.
 * - NTP poll: one exchange per interval chosen by the controller, enqueue.
 * - action dispatcher: executes steps and frequency changes.
 */
#pragma once

#include <memory>

#include "dantesync/options.hpp"
#include "dantesync/sync_controller.hpp"
#include "dantesync/sync_types.hpp"
#include "dantetime/clock_control.hpp"
#include "dantetime/time_query_server.hpp"

namespace dantesync {

class SyncService {
 public:
  SyncService();
  ~SyncService();

  SyncService(const SyncService&) = delete;
  SyncService& operator=(const SyncService&) = delete;

  /**
   * @brief Start all threads.
   * @param stepper Clock step capability (must outlive Stop()).
   * @param adjuster Clock frequency capability (must outlive Stop()).
   * @param opt Immutable options snapshot.
   * @return false if a capability is null or the PTP sockets cannot be
   *         opened (see GetStatus().last_error).
   */
  bool Start(dantetime::TimeStepper* stepper,
             dantetime::FrequencyAdjuster* adjuster, const Options& opt);

  /**
   * @brief Stop producers, let the current event finish, then drain and
   *        join the action dispatcher. Safe to call multiple times.
   */
  void Stop();

  /** Enqueue a PTP sample as if received from the network. */
  void SubmitPtpSample(const PtpSample& sample);
  /** Enqueue an NTP result as if polled. */
  void SubmitNtpSample(const NtpSample& sample);

  /** Controller status merged with the dispatcher fault state. */
  Status GetStatus() const;
  Options GetOptions() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

/** Map a status onto the fields carried by a time query response. */
dantetime::TimeQuerySnapshot ToQuerySnapshot(const Status& s);

}  // namespace dantesync
