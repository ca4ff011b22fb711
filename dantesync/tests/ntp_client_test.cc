// Copyright (c) 2025 <Your Name>
#include "internal/ntp_client.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using dantesync::internal::NtpClient;
using dantetime::TimeSpec;

namespace {

class FrozenTimeSource : public dantetime::TimeSource {
 public:
  explicit FrozenTimeSource(TimeSpec t) : t_(t) {}
  TimeSpec NowUnix() override { return t_; }

 private:
  TimeSpec t_;
};

void PutTimestamp(const TimeSpec& t, uint8_t* dst) {
  const uint64_t v = t.ToNtpTimestamp();
  for (int i = 0; i < 8; ++i) {
    dst[i] = static_cast<uint8_t>((v >> (56 - 8 * i)) & 0xFF);
  }
}

/** Stratum 1 server reply echoing t1 as the originate timestamp. */
std::vector<uint8_t> ServerReply(const TimeSpec& t1, const TimeSpec& t2,
                                 const TimeSpec& t3, uint8_t leap = 0,
                                 uint8_t stratum = 1) {
  std::vector<uint8_t> r(NtpClient::kPacketSize, 0);
  r[0] = static_cast<uint8_t>((leap << 6) | (4 << 3) | 4);
  r[1] = stratum;
  PutTimestamp(t1, r.data() + 24);
  PutTimestamp(t2, r.data() + 32);
  PutTimestamp(t3, r.data() + 40);
  return r;
}

/** One-shot SNTP responder answering with fixed T2/T3. */
class OneShotServer {
 public:
  OneShotServer(uint16_t port, TimeSpec t2, TimeSpec t3) {
    fd_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    bound_ = bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    thread_ = std::thread([this, t2, t3]() {
      pollfd pfd{};
      pfd.fd = fd_;
      pfd.events = POLLIN;
      if (poll(&pfd, 1, 2000) <= 0) return;
      uint8_t buf[128];
      sockaddr_in from{};
      socklen_t len = sizeof(from);
      ssize_t n = recvfrom(fd_, buf, sizeof(buf), 0,
                           reinterpret_cast<sockaddr*>(&from), &len);
      if (n < static_cast<ssize_t>(NtpClient::kPacketSize)) return;
      request_mode_ = buf[0] & 0x07;
      std::vector<uint8_t> reply = ServerReply(TimeSpec(), t2, t3);
      std::memcpy(reply.data() + 24, buf + 40, 8);  // originate = request T1
      sendto(fd_, reply.data(), reply.size(), 0,
             reinterpret_cast<sockaddr*>(&from), len);
    });
  }
  ~OneShotServer() {
    if (thread_.joinable()) thread_.join();
    if (fd_ >= 0) close(fd_);
  }

  bool Bound() const { return bound_; }
  int RequestMode() const { return request_mode_.load(); }

 private:
  int fd_ = -1;
  bool bound_ = false;
  std::atomic<int> request_mode_{-1};
  std::thread thread_;
};

}  // namespace

TEST(NtpClientTest, BuildRequestIsClientMode) {
  const TimeSpec t1(1700000000, 500000000);
  std::vector<uint8_t> req = NtpClient::BuildRequest(t1);
  ASSERT_EQ(req.size(), NtpClient::kPacketSize);
  EXPECT_EQ(req[0], 0x23);  // LI 0, VN 4, mode 3
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | req[40 + i];
  EXPECT_EQ(v, t1.ToNtpTimestamp());
}

/**
 * @test NtpClientTest.OffsetAndDelay
 * @brief Offset and delay follow the four-timestamp formulas.
 *
 * @steps
 * 1. T1=100, T2=101.1, T3=101.2, T4=100.5.
 *
 * @expected offset = ((1.1) + (0.7)) / 2 = 0.9 s, delay = 0.5 - 0.1 = 0.4 s.
 */
TEST(NtpClientTest, OffsetAndDelay) {
  NtpClient::Result r;
  ASSERT_TRUE(NtpClient::ParseResponse(
      ServerReply(TimeSpec(100, 0), TimeSpec(101, 100000000),
                  TimeSpec(101, 200000000)),
      TimeSpec(100, 0), TimeSpec(100, 500000000), &r));
  EXPECT_TRUE(r.success);
  EXPECT_NEAR(r.offset_s, 0.9, 1e-6);
  EXPECT_NEAR(r.delay_s, 0.4, 1e-6);
}

TEST(NtpClientTest, RejectsShortOrWrongMode) {
  NtpClient::Result r;
  std::vector<uint8_t> short_reply(20, 0);
  EXPECT_FALSE(NtpClient::ParseResponse(short_reply, TimeSpec(), TimeSpec(),
                                        &r));
  EXPECT_FALSE(r.success);

  std::vector<uint8_t> client = NtpClient::BuildRequest(TimeSpec(1, 0));
  EXPECT_FALSE(NtpClient::ParseResponse(client, TimeSpec(), TimeSpec(), &r));
  EXPECT_NE(r.error.find("mode 3"), std::string::npos);
}

/**
 * @test NtpClientTest.RejectsUnsynchronizedServer
 * @brief An alarm-state reply must never reach the step decision.
 *
 * @steps
 * 1. Parse a reply with LI=3, stratum 0 and zero timestamps.
 *
 * @expected Rejected without an offset (it would be about -124 years).
 */
TEST(NtpClientTest, RejectsUnsynchronizedServer) {
  const TimeSpec t1(1700000000, 0);
  NtpClient::Result r;
  std::vector<uint8_t> reply(NtpClient::kPacketSize, 0);
  reply[0] = static_cast<uint8_t>((3 << 6) | (4 << 3) | 4);
  EXPECT_FALSE(NtpClient::ParseResponse(reply, t1, t1, &r));
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("LI=3"), std::string::npos);

  const TimeSpec t2(1700000001, 0);
  reply = ServerReply(t1, t2, t2, 3, 2);
  EXPECT_FALSE(NtpClient::ParseResponse(reply, t1, t1, &r));
}

TEST(NtpClientTest, RejectsUnusableStratum) {
  const TimeSpec t1(1700000000, 0);
  const TimeSpec t2(1700000001, 0);
  NtpClient::Result r;
  EXPECT_FALSE(
      NtpClient::ParseResponse(ServerReply(t1, t2, t2, 0, 0), t1, t1, &r));
  EXPECT_NE(r.error.find("stratum 0"), std::string::npos);
  EXPECT_FALSE(
      NtpClient::ParseResponse(ServerReply(t1, t2, t2, 0, 16), t1, t1, &r));
  EXPECT_TRUE(
      NtpClient::ParseResponse(ServerReply(t1, t2, t2, 0, 15), t1, t1, &r));
}

TEST(NtpClientTest, RejectsZeroTimestamps) {
  const TimeSpec t1(1700000000, 0);
  const TimeSpec t2(1700000001, 0);
  NtpClient::Result r;
  std::vector<uint8_t> reply = ServerReply(t1, t2, t2);
  std::memset(reply.data() + 40, 0, 8);
  EXPECT_FALSE(NtpClient::ParseResponse(reply, t1, t1, &r));

  reply = ServerReply(t1, t2, t2);
  std::memset(reply.data() + 32, 0, 8);
  EXPECT_FALSE(NtpClient::ParseResponse(reply, t1, t1, &r));
  EXPECT_FALSE(r.success);
}

TEST(NtpClientTest, RejectsOriginateMismatch) {
  const TimeSpec t1(1700000000, 0);
  const TimeSpec t2(1700000001, 0);
  NtpClient::Result r;
  std::vector<uint8_t> reply = ServerReply(TimeSpec(1699999990, 0), t2, t2);
  EXPECT_FALSE(NtpClient::ParseResponse(reply, t1, t1, &r));
  EXPECT_NE(r.error.find("originate"), std::string::npos);
}

TEST(NtpClientTest, ExchangeOverLoopback) {
  const TimeSpec now(1700000000, 0);
  OneShotServer server(29123, TimeSpec(1700000001, 0),
                       TimeSpec(1700000001, 0));
  ASSERT_TRUE(server.Bound());

  FrozenTimeSource clock(now);
  NtpClient::Result r = NtpClient::Exchange("127.0.0.1", 29123, &clock, 1000);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_NEAR(r.offset_s, 1.0, 1e-6);
  EXPECT_NEAR(r.delay_s, 0.0, 1e-6);
  EXPECT_EQ(server.RequestMode(), 3);
}

TEST(NtpClientTest, ExchangeTimesOut) {
  FrozenTimeSource clock(TimeSpec(1700000000, 0));
  NtpClient::Result r = NtpClient::Exchange("127.0.0.1", 29124, &clock, 200);
  EXPECT_FALSE(r.success);
  EXPECT_FALSE(r.error.empty());
}
