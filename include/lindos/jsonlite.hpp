#pragma once

// lindos/jsonlite.hpp - Minimal flat-object JSON helpers.
//
// Enough JSON for configuration objects and diagnostic lines: top-level scalar
// lookups by key and string escaping. Not a general parser; nested objects and
// arrays are out of scope.

#include <cstdio>
#include <regex>
#include <string>

namespace lindos::jsonlite {

inline std::string unescape(const std::string& in) {
  std::string o;
  for (size_t i=0;i<in.size();++i) {
    if (in[i]=='\\' && i+1<in.size()) {
      char n=in[++i];
      if (n=='n') o += '\n';
      else if (n=='t') o += '\t';
      else if (n=='r') o += '\r';
      else o += n;
    } else o += in[i];
  }
  return o;
}

inline bool has_key(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:");
  return std::regex_search(s, re);
}

inline std::string get_string(const std::string& s, const std::string& key, const std::string& def = "") {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  std::smatch m;
  if (std::regex_search(s, m, re)) return unescape(m[1].str());
  return def;
}

inline bool get_bool(const std::string& s, const std::string& key, bool def = false) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return m[1].str() == "true";
  return def;
}

inline bool is_bool(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(true|false)");
  return std::regex_search(s, re);
}

inline unsigned long long get_u64(const std::string& s, const std::string& key, unsigned long long def = 0) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]{1,18})\\b");
  std::smatch m;
  if (std::regex_search(s, m, re)) return std::stoull(m[1].str());
  return def;
}

inline bool is_u64(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*[0-9]{1,18}\\b");
  return std::regex_search(s, re);
}

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size());
  for (char c : s) {
    if (c == '"') o += "\\\"";
    else if (c == '\\') o += "\\\\";
    else if (c == '\n') o += "\\n";
    else if (c == '\r') o += "\\r";
    else if (c == '\t') o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else o += c;
  }
  return o;
}

}  // namespace lindos::jsonlite
