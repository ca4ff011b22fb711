// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief dantesyncd: disciplines the system clock from PTPv1 and NTP.
 *
 * Usage:
 *   dantesyncd [--config /etc/dantesync.conf] [--ntp-server A.B.C.D] \
 *     [--interface eth0] [--skip-ntp] [--query-port 31900] [--debug]
 *
 * Flags override the config file. Needs CAP_SYS_TIME and permission to
 * bind UDP ports 319/320.
 */

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "dantesync/config_file.hpp"
#include "dantesync/sync_service.hpp"
#include "dantetime/system_clock.hpp"
#include "dantetime/time_query_server.hpp"

namespace {

/**
 * @brief Thread-safe stderr logger with wall-clock timestamps.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) {
    if (!enabled_) return;
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s %s\n", ts, msg.c_str());
  }

 private:
  bool enabled_;
  std::mutex mutex_;
};

volatile std::sig_atomic_t g_stop = 0;

void SignalHandler(int sig) {
  (void)sig;
  g_stop = 1;
}

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: dantesyncd [options]\n"
               "Options:\n"
               "  --config PATH          key = value file read at startup\n"
               "  --ntp-server A.B.C.D   NTP server for absolute time\n"
               "  --ntp-port N           (default 123)\n"
               "  --interface NAME       interface for PTP (default: auto)\n"
               "  --skip-ntp             frequency only, never step\n"
               "  --no-ptp               do not listen for PTP\n"
               "  --query-port N         time query port (default 31900)\n"
               "  --step-threshold ms    NTP step threshold (default 50)\n"
               "  --ptp-timeout ms       NTP-only fallback (default 10000)\n"
               "  --kp X                 proportional gain (default 0.1)\n"
               "  --ki X                 integral gain (default 0.3)\n"
               "  --status-interval s    status line period (default 10)\n"
               "  --debug                log to stderr\n");
}

std::string StatusLine(const dantesync::Status& st) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
                "mode=%-8s rate=%+9.3fppm freq=%+9.3fppm jitter=%6.3f "
                "alpha=%.3f phase=%8.1fus gm=%s",
                dantesync::ModeName(st.mode), st.smoothed_rate_ppm,
                st.frequency_ppm, st.jitter_stddev_ppm, st.alpha,
                st.accumulated_phase_us,
                st.have_grandmaster
                    ? dantesync::FormatGrandmaster(st.grandmaster).c_str()
                    : "-");
  std::string line(buf);
  if (st.clock_control_fault) line += " FAULT";
  if (!st.last_error.empty()) line += " err='" + st.last_error + "'";
  return line;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") config_path = argv[i + 1];
  }

  auto builder = dantesync::Options::Builder();
  uint16_t query_port = dantetime::TimeQuery::kDefaultPort;
  if (!config_path.empty()) {
    dantesync::ConfigFile cfg;
    std::string err;
    if (!dantesync::LoadConfigFile(config_path, &cfg, &err)) {
      std::fprintf(stderr, "Config error: %s\n", err.c_str());
      return 2;
    }
    dantesync::ApplyConfig(cfg, &builder);
    if (cfg.has_query_port) query_port = cfg.query_port;
  }

  bool debug = false;
  int status_interval_s = 10;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int more) { return i + more < argc; };
    if (a == "--config" && need(1)) {
      ++i;
    } else if (a == "--ntp-server" && need(1)) {
      builder.NtpServer(argv[++i]);
    } else if (a == "--ntp-port" && need(1)) {
      builder.NtpPort(static_cast<uint16_t>(std::atoi(argv[++i])));
    } else if (a == "--interface" && need(1)) {
      builder.Interface(argv[++i]);
    } else if (a == "--skip-ntp") {
      builder.SkipNtp(true);
    } else if (a == "--no-ptp") {
      builder.ListenPtp(false);
    } else if (a == "--query-port" && need(1)) {
      query_port = static_cast<uint16_t>(std::atoi(argv[++i]));
    } else if (a == "--step-threshold" && need(1)) {
      builder.NtpStepThresholdMs(std::atoi(argv[++i]));
    } else if (a == "--ptp-timeout" && need(1)) {
      builder.PtpTimeoutMs(std::atoi(argv[++i]));
    } else if (a == "--kp" && need(1)) {
      builder.Kp(std::atof(argv[++i]));
    } else if (a == "--ki" && need(1)) {
      builder.Ki(std::atof(argv[++i]));
    } else if (a == "--status-interval" && need(1)) {
      status_interval_s = std::max(1, std::atoi(argv[++i]));
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown or incomplete option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }

  Logger logger(debug);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };
  builder.LogSink(log_callback);
  const dantesync::Options opt = builder.Build();

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  dantetime::SystemClock clock;
  std::string err;
  if (!clock.Open(&err)) {
    std::fprintf(stderr, "Cannot access the system clock: %s\n", err.c_str());
    return 1;
  }

  dantesync::SyncService svc;
  if (!svc.Start(&clock, &clock, opt)) {
    std::fprintf(stderr, "Failed to start SyncService: %s\n",
                 svc.GetStatus().last_error.c_str());
    return 1;
  }

  dantetime::TimeQueryServer query_server;
  auto query_opt =
      dantetime::Options::Builder()
          .Snapshot([&svc]() {
            return dantesync::ToQuerySnapshot(svc.GetStatus());
          })
          .LogSink(log_callback)
          .Build();
  if (!query_server.Start(query_port, &clock, query_opt)) {
    std::fprintf(stderr, "Failed to start time query server on %u: %s\n",
                 query_port, query_server.GetStats().last_error.c_str());
    svc.Stop();
    return 1;
  }

  std::printf("dantesyncd running (query port %u)\n", query_port);
  std::fflush(stdout);

  auto next_status = std::chrono::steady_clock::now();
  while (!g_stop) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= next_status) {
      std::printf("%s\n", StatusLine(svc.GetStatus()).c_str());
      std::fflush(stdout);
      next_status = now + std::chrono::seconds(status_interval_s);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::printf("Shutting down\n");
  query_server.Stop();
  svc.Stop();
  return 0;
}
