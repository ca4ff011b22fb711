// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Query a running dantesyncd for time and synchronization state.
 *
 * Usage:
 *   dantetime_query [--ip 127.0.0.1] [--port 31900] [--count N]
 *                   [--interval ms]
 */

#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "dantetime/platform/socket_interface.hpp"
#include "dantetime/time_query_protocol.hpp"

namespace {

const char* ModeLabel(uint8_t mode) {
  switch (mode) {
    case 0:
      return "INIT";
    case 1:
      return "ACQ";
    case 2:
      return "PROD";
    case 3:
      return "LOCK";
    case 4:
      return "NANO";
    case 5:
      return "NTP-ONLY";
    default:
      return "?";
  }
}

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: dantetime_query [options]\n"
               "Options:\n"
               "  --ip A.B.C.D    (default 127.0.0.1)\n"
               "  --port N        (default 31900)\n"
               "  --count N       queries to send (default 1)\n"
               "  --interval ms   delay between queries (default 1000)\n");
}

void PrintResponse(const dantetime::TimeQuery::Response& r, double rtt_ms) {
  const auto& g = r.grandmaster;
  std::printf(
      "id=%u time=%" PRIu64 ".%09" PRIu64 " mono=%" PRIu64 " offset=%" PRId64
      "ns drift=%.3fppm freq=%.3fppm mode=%s locked=%s "
      "gm=%02x:%02x:%02x:%02x:%02x:%02x rtt=%.3fms\n",
      r.request_id, r.system_time_ns / 1000000000ULL,
      r.system_time_ns % 1000000000ULL, r.monotonic_counter, r.ptp_offset_ns,
      r.drift_ppm_milli / 1000.0, r.frequency_ppm_milli / 1000.0,
      ModeLabel(r.mode), r.locked ? "yes" : "no", g[0], g[1], g[2], g[3], g[4],
      g[5], rtt_ms);
}

}  // namespace

int main(int argc, char** argv) {
  std::string ip = "127.0.0.1";
  uint16_t port = dantetime::TimeQuery::kDefaultPort;
  int count = 1;
  int interval_ms = 1000;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    if (a == "--ip" && need(1)) {
      ip = argv[++i];
    } else if (a == "--port" && need(1)) {
      port = static_cast<uint16_t>(std::atoi(argv[++i]));
    } else if (a == "--count" && need(1)) {
      count = std::atoi(argv[++i]);
    } else if (a == "--interval" && need(1)) {
      interval_ms = std::atoi(argv[++i]);
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }

  std::unique_ptr<dantetime::platform::ISocket> sock =
      dantetime::platform::CreatePlatformSocket();
  if (!sock->Initialize() || !sock->Bind(0)) {
    std::fprintf(stderr, "Socket setup failed: %s\n",
                 sock->GetLastError().c_str());
    return 1;
  }

  const dantetime::platform::Endpoint server(ip, port);
  int failures = 0;
  for (int n = 0; n < count; ++n) {
    if (n > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }
    dantetime::TimeQuery::Request req;
    req.request_id = static_cast<uint32_t>(n + 1);
    const auto sent = std::chrono::steady_clock::now();
    if (!sock->Send(server, dantetime::TimeQuery::SerializeRequest(req))) {
      std::fprintf(stderr, "Send failed: %s\n", sock->GetLastError().c_str());
      ++failures;
      continue;
    }

    dantetime::TimeQuery::Response resp;
    bool got = false;
    while (sock->WaitReadable(1000000)) {
      dantetime::platform::Endpoint from;
      std::vector<uint8_t> data;
      if (!sock->Receive(&from, &data, 1500)) break;
      if (dantetime::TimeQuery::ParseResponse(data, &resp) &&
          resp.request_id == req.request_id) {
        got = true;
        break;
      }
    }
    if (!got) {
      std::fprintf(stderr, "No response from %s:%u\n", ip.c_str(), port);
      ++failures;
      continue;
    }
    const double rtt_ms =
        std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - sent)
            .count();
    PrintResponse(resp, rtt_ms);
  }
  sock->Close();
  return failures == 0 ? 0 : 1;
}
