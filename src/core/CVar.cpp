#include "seasafe/core/CVar.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace seasafe::core {

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = (char)std::tolower((unsigned char)c);
  return out;
}

static bool parseFloat(std::string_view s, double& out) {
  s = trimView(s);
  if (s.empty()) return false;

  // strtod needs a terminated buffer.
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (!end || (std::size_t)(end - tmp.c_str()) != tmp.size()) return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

static bool parseInt(std::string_view s, std::int64_t& out) {
  s = trimView(s);
  if (s.empty()) return false;

  std::int64_t v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec == std::errc{} && res.ptr == end) {
    out = v;
    return true;
  }

  // "5.0" style input for an integer variable.
  double d = 0.0;
  if (!parseFloat(s, d)) return false;
  if (std::floor(d) != d) return false;
  out = (std::int64_t)d;
  return true;
}

static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2) {
    const char q0 = s.front();
    const char q1 = s.back();
    if ((q0 == '"' && q1 == '"') || (q0 == '\'' && q1 == '\'')) {
      s = s.substr(1, s.size() - 2);
    }
  }
  return std::string(s);
}

static bool matchesType(CVarType type, const CVarValue& v) {
  switch (type) {
    case CVarType::Int:    return std::holds_alternative<std::int64_t>(v);
    case CVarType::Float:  return std::holds_alternative<double>(v);
    case CVarType::String: return std::holds_alternative<std::string>(v);
  }
  return false;
}

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

const CVar* CVarRegistry::defineImpl(std::string_view name, CVarType type, CVarValue def,
                                     std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it != vars_.end()) {
    if (it->second.type != type) return nullptr;
    if (!help.empty()) it->second.help = std::string(help);
    it->second.defaultValue = std::move(def);
    applyPendingLocked(it->second);
    return &it->second;
  }

  CVar v;
  v.name = std::string(name);
  v.type = type;
  v.help = std::string(help);
  v.value = def;
  v.defaultValue = std::move(def);

  auto [insIt, ok] = vars_.emplace(v.name, std::move(v));
  (void)ok;
  applyPendingLocked(insIt->second);
  return &insIt->second;
}

const CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::Int, CVarValue{defaultValue}, help);
}

const CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::Float, CVarValue{defaultValue}, help);
}

const CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::String, CVarValue{std::move(defaultValue)}, help);
}

bool CVarRegistry::setValueImpl(std::string_view name, const CVarValue& v, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  if (!matchesType(it->second.type, v)) {
    if (outError) *outError = "Type mismatch for cvar: " + it->second.name;
    return false;
  }
  it->second.value = v;
  return true;
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return setValueImpl(name, CVarValue{std::move(v)}, outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  CVarType type;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    type = it->second.type;
  }

  switch (type) {
    case CVarType::Int: {
      std::int64_t i = 0;
      if (!parseInt(value, i)) {
        if (outError) *outError = "Invalid int for " + std::string(name) + ": " + std::string(value);
        return false;
      }
      return setInt(name, i, outError);
    }
    case CVarType::Float: {
      double f = 0.0;
      if (!parseFloat(value, f)) {
        if (outError) *outError = "Invalid float for " + std::string(name) + ": " + std::string(value);
        return false;
      }
      return setFloat(name, f, outError);
    }
    case CVarType::String:
      return setString(name, unquote(value), outError);
  }
  if (outError) *outError = "Unknown cvar type.";
  return false;
}

bool CVarRegistry::setAssignment(std::string_view assignment, std::string* outError) {
  const std::size_t eq = assignment.find('=');
  if (eq == std::string_view::npos) {
    if (outError) *outError = "Expected name=value: " + std::string(assignment);
    return false;
  }
  const std::string_view name = trimView(assignment.substr(0, eq));
  if (name.empty()) {
    if (outError) *outError = "Missing cvar name: " + std::string(assignment);
    return false;
  }
  return setFromString(name, trimView(assignment.substr(eq + 1)), outError);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<std::int64_t>(it->second.value)) return fallback;
  return std::get<std::int64_t>(it->second.value);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<double>(it->second.value)) return fallback;
  return std::get<double>(it->second.value);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<std::string>(it->second.value)) {
    return std::string(fallback);
  }
  return std::get<std::string>(it->second.value);
}

std::vector<const CVar*> CVarRegistry::list(std::string_view filter) const {
  std::vector<const CVar*> out;
  const std::string needle = lowerAscii(filter);
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(vars_.size());
  for (const auto& kv : vars_) {
    if (!needle.empty() && lowerAscii(kv.first).find(needle) == std::string::npos) continue;
    out.push_back(&kv.second);
  }
  return out;
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVar& v) {
  switch (v.type) {
    case CVarType::Int:
      return std::to_string(std::get<std::int64_t>(v.value));
    case CVarType::Float: {
      std::ostringstream oss;
      oss.setf(std::ios::fixed);
      oss.precision(6);
      oss << std::get<double>(v.value);
      return oss.str();
    }
    case CVarType::String:
      return std::get<std::string>(v.value);
  }
  return {};
}

void CVarRegistry::applyPendingLocked(CVar& var) {
  auto pit = pending_.find(var.name);
  if (pit == pending_.end()) return;

  const std::string pendingVal = pit->second;
  pending_.erase(pit);

  // setFromString would re-take the lock, so parse in place.
  switch (var.type) {
    case CVarType::Int: {
      std::int64_t i = 0;
      if (parseInt(pendingVal, i)) var.value = i;
      break;
    }
    case CVarType::Float: {
      double f = 0.0;
      if (parseFloat(pendingVal, f)) var.value = f;
      break;
    }
    case CVarType::String:
      var.value = unquote(pendingVal);
      break;
  }
}

bool CVarRegistry::applyLine(std::string_view line, std::string* outError) {
  std::string_view sv = trimView(line);
  if (sv.empty() || sv.front() == '#' || sv.rfind("//", 0) == 0) return true;

  // Trailing comment.
  const std::size_t hash = sv.find('#');
  if (hash != std::string_view::npos) sv = trimView(sv.substr(0, hash));
  if (sv.empty()) return true;

  std::string_view name;
  std::string_view val;
  const std::size_t eq = sv.find('=');
  if (eq != std::string_view::npos) {
    name = trimView(sv.substr(0, eq));
    val = trimView(sv.substr(eq + 1));
  } else {
    std::size_t sp = 0;
    while (sp < sv.size() && !std::isspace((unsigned char)sv[sp])) ++sp;
    name = sv.substr(0, sp);
    val = trimView(sv.substr(sp));
  }

  if (name.empty()) {
    if (outError) *outError = "Missing cvar name";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (vars_.find(name) == vars_.end()) {
      pending_[std::string(name)] = std::string(val);
      return true;
    }
  }
  return setFromString(name, val, outError);
}

bool CVarRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(name) != pending_.end();
}

} // namespace seasafe::core
