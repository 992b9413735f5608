#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace seasafe::core {

// Console variables ("CVars"): named, typed run settings.
//
// Scenario files and the CLI write into a registry; the simulation reads a
// plain EngineConfig built from it. Iteration order is name-sorted so listings
// are stable between runs.

enum class CVarType : std::uint8_t {
  Int    = 0,
  Float  = 1,
  String = 2
};

using CVarValue = std::variant<std::int64_t, double, std::string>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};

  CVarValue value{};
  CVarValue defaultValue{};
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Definition is idempotent. Redefining with a different type returns nullptr.
  // A pending assignment from applyLine() is applied on first definition.
  const CVar* defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help = {});
  const CVar* defineFloat(std::string_view name, double defaultValue, std::string_view help = {});
  const CVar* defineString(std::string_view name, std::string defaultValue, std::string_view help = {});

  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double       getFloat(std::string_view name, double fallback = 0.0) const;
  std::string  getString(std::string_view name, std::string_view fallback = {}) const;

  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Parse `value` according to the variable's type. Int variables also accept
  // whole-number floats ("5.0"); Float variables accept integers.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  // Parse "name=value".
  bool setAssignment(std::string_view assignment, std::string* outError = nullptr);

  std::vector<const CVar*> list(std::string_view filter = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  // Apply one config line:
  //   # comment
  //   colregs.horizon_nm = 5.0
  //   sim.strategy = "backtracking"
  //
  // Blank lines and comments are accepted and ignored. Unknown names are kept
  // as pending assignments.
  bool applyLine(std::string_view line, std::string* outError = nullptr);

  bool hasPending(std::string_view name) const;

private:
  const CVar* defineImpl(std::string_view name, CVarType type, CVarValue def, std::string_view help);
  bool setValueImpl(std::string_view name, const CVarValue& v, std::string* outError);

  // Called with mutex held.
  void applyPendingLocked(CVar& var);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

} // namespace seasafe::core
