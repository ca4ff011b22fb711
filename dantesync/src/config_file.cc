// Copyright (c) 2025 <Your Name>
#include "dantesync/config_file.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace dantesync {

namespace {

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool ParseBool(const std::string& v, bool* out) {
  const std::string l = Lower(v);
  if (l == "true" || l == "yes" || l == "on" || l == "1") {
    *out = true;
    return true;
  }
  if (l == "false" || l == "no" || l == "off" || l == "0") {
    *out = false;
    return true;
  }
  return false;
}

bool ParsePort(const std::string& v, uint16_t* out) {
  if (v.empty() || v.size() > 5) return false;
  unsigned long n = 0;
  for (char c : v) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    n = n * 10 + static_cast<unsigned long>(c - '0');
  }
  if (n == 0 || n > 65535) return false;
  *out = static_cast<uint16_t>(n);
  return true;
}

}  // namespace

bool ParseConfig(const std::string& text, ConfigFile* out, std::string* err) {
  if (!out) return false;
  std::istringstream in(text);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string t = Trim(line);
    if (t.empty() || t[0] == '#') continue;

    const size_t eq = t.find('=');
    if (eq == std::string::npos) {
      if (err) *err = "line " + std::to_string(line_no) + ": missing '='";
      return false;
    }
    const std::string key = Lower(Trim(t.substr(0, eq)));
    const std::string value = Trim(t.substr(eq + 1));

    if (key == "ntp_server") {
      out->has_ntp_server = true;
      out->ntp_server = value;
    } else if (key == "interface") {
      out->has_interface = true;
      out->interface_name = value;
    } else if (key == "skip_ntp") {
      if (!ParseBool(value, &out->skip_ntp)) {
        if (err) {
          *err = "line " + std::to_string(line_no) + ": bad boolean '" +
                 value + "'";
        }
        return false;
      }
      out->has_skip_ntp = true;
    } else if (key == "query_port") {
      if (!ParsePort(value, &out->query_port)) {
        if (err) {
          *err = "line " + std::to_string(line_no) + ": bad port '" + value +
                 "'";
        }
        return false;
      }
      out->has_query_port = true;
    }
  }
  return true;
}

bool LoadConfigFile(const std::string& path, ConfigFile* out,
                    std::string* err) {
  std::ifstream f(path);
  if (!f) {
    if (err) *err = "cannot open " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  std::string parse_err;
  if (!ParseConfig(ss.str(), out, &parse_err)) {
    if (err) *err = path + ": " + parse_err;
    return false;
  }
  return true;
}

void ApplyConfig(const ConfigFile& cfg, Options::Builder* b) {
  if (!b) return;
  if (cfg.has_ntp_server) b->NtpServer(cfg.ntp_server);
  if (cfg.has_interface) b->Interface(cfg.interface_name);
  if (cfg.has_skip_ntp) b->SkipNtp(cfg.skip_ntp);
}

}  // namespace dantesync
