// Copyright (c) 2025 <Your Name>
#include "dantetime/time_query_server.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

#include "dantetime/system_clock.hpp"

namespace dantetime {

namespace {

class FakeTimeSource : public TimeSource {
 public:
  explicit FakeTimeSource(TimeSpec t) : value_(t) {}
  TimeSpec NowUnix() override { return value_; }

 private:
  TimeSpec value_;
};

/** Plain UDP client used to talk to the server over loopback. */
class LoopbackClient {
 public:
  LoopbackClient() { fd_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP); }
  ~LoopbackClient() {
    if (fd_ >= 0) close(fd_);
  }

  bool Send(uint16_t port, const std::vector<uint8_t>& bytes) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    addr.sin_port = htons(port);
    ssize_t n = sendto(fd_, bytes.data(), bytes.size(), 0,
                       reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == static_cast<ssize_t>(bytes.size());
  }

  bool Receive(int timeout_ms, std::vector<uint8_t>* out) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    if (poll(&pfd, 1, timeout_ms) <= 0) return false;
    out->resize(1500);
    ssize_t n = recv(fd_, out->data(), out->size(), 0);
    if (n < 0) return false;
    out->resize(static_cast<size_t>(n));
    return true;
  }

  int fd() const { return fd_; }

 private:
  int fd_ = -1;
};

}  // namespace

/**
 * @test TimeQueryServerTest.AnswersRequestWithSnapshot
 * @brief A valid request yields a 64-byte record with the snapshot values.
 *
 * @steps
 * 1. Start the server with a fixed wall clock and a snapshot provider.
 * 2. Send a "DSYN" request with id 0x1234 from loopback.
 * 3. Parse the reply.
 *
 * @expected Id echoed, wall time equals the fake clock, snapshot fields
 *           scaled to ppm x 1000, counter frequency is 1 GHz.
 */
TEST(TimeQueryServerTest, AnswersRequestWithSnapshot) {
  FakeTimeSource ts(TimeSpec(1700000000, 250000000u));
  auto opts = Options::Builder()
                  .Snapshot([]() {
                    TimeQuerySnapshot s;
                    s.ptp_offset_ns = -1200;
                    s.drift_ppm = 0.42;
                    s.frequency_ppm = -12.5;
                    s.mode = 4;
                    s.locked = true;
                    s.grandmaster = {1, 2, 3, 4, 5, 6};
                    return s;
                  })
                  .Build();

  TimeQueryServer server;
  ASSERT_TRUE(server.Start(29190, &ts, opts));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  LoopbackClient client;
  ASSERT_GE(client.fd(), 0);
  TimeQuery::Request req;
  req.request_id = 0x1234u;
  ASSERT_TRUE(client.Send(29190, TimeQuery::SerializeRequest(req)));

  std::vector<uint8_t> rx;
  ASSERT_TRUE(client.Receive(1000, &rx)) << "timeout waiting for response";
  ASSERT_EQ(rx.size(), TimeQuery::kResponseSize);

  TimeQuery::Response resp;
  ASSERT_TRUE(TimeQuery::ParseResponse(rx, &resp));
  EXPECT_EQ(resp.request_id, 0x1234u);
  EXPECT_EQ(resp.system_time_ns, 1700000000250000000ULL);
  EXPECT_GT(resp.monotonic_counter, 0u);
  EXPECT_EQ(resp.ptp_offset_ns, -1200);
  EXPECT_EQ(resp.drift_ppm_milli, 420);
  EXPECT_EQ(resp.frequency_ppm_milli, -12500);
  EXPECT_EQ(resp.mode, 4);
  EXPECT_TRUE(resp.locked);
  EXPECT_EQ(resp.grandmaster[5], 6);
  EXPECT_EQ(resp.monotonic_frequency_hz, kMonotonicCounterFrequencyHz);

  server.Stop();
  EXPECT_EQ(server.GetStats().responses_sent, 1u);
}

/**
 * @test TimeQueryServerTest.DropsInvalidDatagrams
 * @brief Short packets and foreign magic get no reply and are counted.
 *
 * @steps
 * 1. Send a 4-byte packet and an 8-byte packet with the wrong magic.
 * 2. Wait briefly for any reply.
 *
 * @expected No reply; drop_short_packets and drop_bad_magic are 1 each.
 */
TEST(TimeQueryServerTest, DropsInvalidDatagrams) {
  TimeQueryServer server;
  ASSERT_TRUE(server.Start(29191));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  LoopbackClient client;
  ASSERT_TRUE(client.Send(29191, {0x44, 0x53, 0x59, 0x4E}));
  ASSERT_TRUE(client.Send(29191, {0x44, 0x53, 0x59, 0x52, 0, 0, 0, 9}));

  std::vector<uint8_t> rx;
  EXPECT_FALSE(client.Receive(300, &rx));

  ServerStats stats = server.GetStats();
  EXPECT_EQ(stats.drop_short_packets, 1u);
  EXPECT_EQ(stats.drop_bad_magic, 1u);
  EXPECT_EQ(stats.requests_received, 0u);
  server.Stop();
}

TEST(TimeQueryServerTest, StopIsIdempotent) {
  TimeQueryServer server;
  server.Stop();
  ASSERT_TRUE(server.Start(29192));
  server.Stop();
  server.Stop();
}

}  // namespace dantetime
