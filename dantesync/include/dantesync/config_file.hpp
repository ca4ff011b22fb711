// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Startup configuration file.
 *
 * Plain text, one `key = value` per line. Blank lines and lines starting
 * with '#' are ignored. Recognized keys:
 *
 * | key        | value                       |
 * |------------|-----------------------------|
 * | ntp_server | IPv4 address of NTP server  |
 * | interface  | interface name for PTP      |
 * | skip_ntp   | true/false/yes/no/1/0       |
 * | query_port | UDP port of the time query  |
 *
 * The file is read once; command-line flags override what it sets.
 */
#pragma once

#include <cstdint>
#include <string>

#include "dantesync/options.hpp"

namespace dantesync {

struct ConfigFile {
  bool has_ntp_server = false;
  std::string ntp_server;
  bool has_interface = false;
  std::string interface_name;
  bool has_skip_ntp = false;
  bool skip_ntp = false;
  bool has_query_port = false;
  uint16_t query_port = 0;
};

/**
 * @brief Parse configuration text.
 * @return false with *err naming the offending line on a malformed entry.
 *         Unknown keys are not an error.
 */
bool ParseConfig(const std::string& text, ConfigFile* out, std::string* err);

/**
 * @brief Read and parse a configuration file.
 * @return false if the file cannot be read or fails to parse.
 */
bool LoadConfigFile(const std::string& path, ConfigFile* out,
                    std::string* err);

/** Copy the entries present in cfg into the builder. */
void ApplyConfig(const ConfigFile& cfg, Options::Builder* b);

}  // namespace dantesync
