#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace seasafe::core {

// Small argument parser for the headless tools.
//
// Supports:
//  - Flags:         --quiet   -h
//  - KV args:       --key value   --key=value
//  - Multi-value:   --ship 0,0 3,3   (after setArity("ship", 2))
//  - Positional:    everything else, and everything after "--"
//
// Repeated keys keep every value in order; last() returns the final one.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void setArity(std::string_view key, int valueCount) {
    if (valueCount <= 0) return;
    arity_[std::string(key)] = valueCount;
  }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a == "--") {
        for (int j = i + 1; j < argc; ++j) {
          if (argv[j]) positional_.push_back(std::string(argv[j]));
        }
        break;
      }

      if (a.rfind("--", 0) == 0) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        const auto ar = arity_.find(key);
        const int need = (ar != arity_.end()) ? ar->second : 1;

        int took = 0;
        while (took < need && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          kv_[key].push_back(std::string(argv[++i]));
          ++took;
        }
        if (took == 0) flags_.push_back(key);
        continue;
      }

      // Grouped short flags (-hq). Negative numbers stay positional.
      if (a.size() >= 2 && a[0] == '-' && !looksLikeNumber(a.c_str())) {
        for (std::size_t j = 1; j < a.size(); ++j) {
          if (std::isalnum((unsigned char)a[j])) flags_.push_back(std::string(1, a[j]));
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& positional() const { return positional_; }

  bool getInt(std::string_view key, int& out) const {
    const auto v = last(key);
    if (!v) return false;
    char* end = nullptr;
    const long long val = std::strtoll(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') return false;
    out = static_cast<int>(val);
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v) return false;
    char* end = nullptr;
    const double val = std::strtod(v->c_str(), &end);
    if (end == v->c_str() || *end != '\0') return false;
    out = val;
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

private:
  // Accepts -1, -0.25, -.5, 1e-3. Coordinate pairs such as "-1,2" count too so
  // that "--ship -1,0 3,3" keeps both values.
  static bool looksLikeNumber(const char* s) {
    if (!s || !*s) return false;
    int i = 0;
    if (s[i] == '+' || s[i] == '-') ++i;
    if (!s[i]) return false;

    bool anyDigit = false;
    for (; s[i]; ++i) {
      const unsigned char c = (unsigned char)s[i];
      if (std::isdigit(c)) { anyDigit = true; continue; }
      if (c == '.' || c == ',' || c == 'e' || c == 'E' || c == '+' || c == '-') continue;
      return false;
    }
    return anyDigit;
  }

  static bool isSwitch(const char* s) {
    if (!s || s[0] != '-') return false;
    if (s[1] == '\0') return false;
    return !looksLikeNumber(s);
  }

  std::string program_;
  std::unordered_map<std::string, int> arity_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace seasafe::core
