// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @test OptionsTest.Defaults
 * @brief Verify default values of a freshly built Options.
 *
 * @steps
 * 1. Build Options without calling any setter.
 *
 * @expected Every getter returns its documented default.
 */
#include "dantesync/options.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "dantesync/config_file.hpp"

using dantesync::ConfigFile;
using dantesync::Options;

TEST(OptionsTest, Defaults) {
  Options o = Options::Builder().Build();
  EXPECT_EQ(o.JitterWindow(), 30);
  EXPECT_EQ(o.JitterWarmup(), 15);
  EXPECT_EQ(o.SpikeWindow(), 5);
  EXPECT_DOUBLE_EQ(o.SpikeThresholdPpm(), 10.0);
  EXPECT_DOUBLE_EQ(o.Kp(), 0.1);
  EXPECT_DOUBLE_EQ(o.Ki(), 0.3);
  EXPECT_DOUBLE_EQ(o.MaxIntegralPpm(), 200.0);
  EXPECT_DOUBLE_EQ(o.MaxFrequencyAdjustPpm(), 500.0);
  EXPECT_EQ(o.LockSustainSamples(), 10);
  EXPECT_EQ(o.NanoSustainSamples(), 20);
  EXPECT_EQ(o.PtpTimeoutMs(), 10000);
  EXPECT_EQ(o.NtpStepThresholdMs(), 50);
  EXPECT_EQ(o.MaxNtpRttMs(), 500);
  EXPECT_EQ(o.ActionTimeoutMs(), 500);
  EXPECT_EQ(o.FailureThreshold(), 5);
  EXPECT_EQ(o.NtpPort(), 123);
  EXPECT_TRUE(o.NtpServer().empty());
  EXPECT_FALSE(o.SkipNtp());
  EXPECT_TRUE(o.ListenPtp());
}

TEST(OptionsTest, SettersClamp) {
  Options o = Options::Builder()
                  .JitterWindow(0)
                  .Kp(-1.0)
                  .PtpTimeoutMs(-5)
                  .FailureThreshold(0)
                  .NtpPort(0)
                  .Build();
  EXPECT_EQ(o.JitterWindow(), 2);
  EXPECT_EQ(o.JitterWarmup(), 2);  // capped at the window
  EXPECT_DOUBLE_EQ(o.Kp(), 0.0);
  EXPECT_EQ(o.PtpTimeoutMs(), 1);
  EXPECT_EQ(o.FailureThreshold(), 1);
  EXPECT_EQ(o.NtpPort(), 123);
}

TEST(OptionsTest, BuilderFromExisting) {
  Options base = Options::Builder().NtpServer("192.0.2.1").Kp(0.5).Build();
  Options o = Options::Builder(base).Ki(0.7).Build();
  EXPECT_EQ(o.NtpServer(), "192.0.2.1");
  EXPECT_DOUBLE_EQ(o.Kp(), 0.5);
  EXPECT_DOUBLE_EQ(o.Ki(), 0.7);
}

TEST(OptionsTest, Stream) {
  std::ostringstream oss;
  oss << Options::Builder().Interface("eth0").SkipNtp(true).Build();
  EXPECT_NE(oss.str().find("iface=eth0"), std::string::npos);
  EXPECT_NE(oss.str().find("ntp=off"), std::string::npos);
}

/**
 * @test ConfigFileTest.ParsesKnownKeys
 * @brief key = value lines with comments and blanks.
 *
 * @steps
 * 1. Parse a config naming every supported key plus an unknown one.
 *
 * @expected Known keys are set and flagged present; the unknown key is
 *           ignored.
 */
TEST(ConfigFileTest, ParsesKnownKeys) {
  const std::string text =
      "# dantesync\n"
      "\n"
      "ntp_server = 10.0.0.1\n"
      "  interface=enp3s0  \n"
      "SKIP_NTP = yes\n"
      "query_port = 31901\n"
      "color = blue\n";
  ConfigFile cfg;
  std::string err;
  ASSERT_TRUE(dantesync::ParseConfig(text, &cfg, &err)) << err;
  EXPECT_TRUE(cfg.has_ntp_server);
  EXPECT_EQ(cfg.ntp_server, "10.0.0.1");
  EXPECT_EQ(cfg.interface_name, "enp3s0");
  EXPECT_TRUE(cfg.has_skip_ntp);
  EXPECT_TRUE(cfg.skip_ntp);
  EXPECT_EQ(cfg.query_port, 31901);
}

TEST(ConfigFileTest, RejectsMalformedLines) {
  ConfigFile cfg;
  std::string err;
  EXPECT_FALSE(dantesync::ParseConfig("ntp_server\n", &cfg, &err));
  EXPECT_NE(err.find("line 1"), std::string::npos);
  EXPECT_FALSE(dantesync::ParseConfig("skip_ntp = maybe\n", &cfg, &err));
  EXPECT_FALSE(dantesync::ParseConfig("\nquery_port = 70000\n", &cfg, &err));
  EXPECT_NE(err.find("line 2"), std::string::npos);
}

TEST(ConfigFileTest, MissingFile) {
  ConfigFile cfg;
  std::string err;
  EXPECT_FALSE(dantesync::LoadConfigFile("/nonexistent/dantesync.conf", &cfg,
                                         &err));
  EXPECT_FALSE(err.empty());
}

TEST(ConfigFileTest, AppliedValuesCanBeOverridden) {
  ConfigFile cfg;
  ASSERT_TRUE(dantesync::ParseConfig("ntp_server = 10.0.0.1\nskip_ntp = 1\n",
                                     &cfg, nullptr));
  Options::Builder b;
  dantesync::ApplyConfig(cfg, &b);
  b.NtpServer("10.0.0.2");
  Options o = b.Build();
  EXPECT_EQ(o.NtpServer(), "10.0.0.2");
  EXPECT_TRUE(o.SkipNtp());
  EXPECT_TRUE(o.Interface().empty());
}
