// Copyright (c) 2025 <Your Name>
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "dantetime/export.hpp"
#include "dantetime/time_query_protocol.hpp"
#include "dantetime/time_source.hpp"

namespace dantetime {

/**
 * Synchronization state reported to query clients.
 *
 * Filled by the owner of the controller from its published snapshot; the
 * server never touches controller state itself.
 */
struct TimeQuerySnapshot {
  int64_t ptp_offset_ns = 0;
  double drift_ppm = 0.0;
  double frequency_ppm = 0.0;
  uint8_t mode = 0;
  bool locked = false;
  std::array<uint8_t, 6> grandmaster{};
};

/**
 * Immutable configuration options for TimeQueryServer.
 */
class Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;
  using SnapshotProvider = std::function<TimeQuerySnapshot()>;

  class Builder {
   public:
    Builder();
    Builder& Snapshot(SnapshotProvider provider);
    Builder& LogSink(LogCallback cb);
    Options Build() const;

   private:
    SnapshotProvider snapshot_provider_;
    LogCallback log_sink_cb_;
  };

  Options();

  const SnapshotProvider& Snapshot() const;
  const LogCallback& LogSink() const;

 private:
  Options(SnapshotProvider provider, LogCallback log_cb);

  SnapshotProvider snapshot_provider_;
  LogCallback log_callback_;
};

struct ServerStats {
  uint64_t requests_received = 0;   ///< Valid query datagrams processed
  uint64_t responses_sent = 0;      ///< Responses sent successfully
  uint64_t recv_errors = 0;         ///< recvfrom() failures
  uint64_t drop_short_packets = 0;  ///< Datagrams shorter than a request
  uint64_t drop_bad_magic = 0;      ///< Datagrams with a foreign magic
  uint64_t send_errors = 0;         ///< sendto() failures or partial sends
  std::string last_error;           ///< Latest error message
};

/**
 * UDP/IPv4 time query responder.
 *
 * Answers every valid request with a 64-byte record built from the wall
 * clock, CLOCK_MONOTONIC_RAW and the latest synchronization snapshot.
 * Any number of clients may query concurrently.
 */
class DANTETIME_API TimeQueryServer {
 public:
  TimeQueryServer();
  ~TimeQueryServer();

  TimeQueryServer(const TimeQueryServer&) = delete;
  TimeQueryServer& operator=(const TimeQueryServer&) = delete;

  /**
   * @brief Starts serving on the given UDP port.
   * @param port UDP port to bind.
   * @param time_source Wall clock for the response (default: CLOCK_REALTIME).
   * @param options Immutable configuration snapshot.
   * @return true on success, false on failure (see GetStats().last_error).
   */
  bool Start(uint16_t port = TimeQuery::kDefaultPort,
             TimeSource* time_source = nullptr,
             const Options& options = Options());

  /** Stops the server. Safe to call multiple times. */
  void Stop();

  /** Returns latest statistics snapshot (thread-safe). */
  ServerStats GetStats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace dantetime
