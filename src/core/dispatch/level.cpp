// src/core/dispatch/level.cpp
#include "fsink/core/dispatch/level.hpp"

#include <array>
#include <string_view>

namespace fsink {
namespace {

struct LevelName {
  std::string_view name;
  Level level;
};

constexpr std::array<LevelName, 12> kNames{{
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"notice", Level::kNotice},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"err", Level::kError},
    {"critical", Level::kCritical},
    {"crit", Level::kCritical},
    {"alert", Level::kAlert},
    {"emergency", Level::kEmergency},
    {"emerg", Level::kEmergency},
}};

}  // namespace

Result<Level> parse_level(const std::string& s) {
  for (const auto& n : kNames) {
    if (n.name == s) return Result<Level>::ok(n.level);
  }
  if (s.size() == 1 && s[0] >= '0' && s[0] <= '7') {
    return Result<Level>::ok(static_cast<Level>(s[0] - '0'));
  }
  return Result<Level>::err(Status::invalid_argument("unknown log level: '" + s + "'"));
}

const char* to_string(Level level) {
  switch (level) {
    case Level::kDebug: return "debug";
    case Level::kInfo: return "info";
    case Level::kNotice: return "notice";
    case Level::kWarning: return "warning";
    case Level::kError: return "error";
    case Level::kCritical: return "critical";
    case Level::kAlert: return "alert";
    case Level::kEmergency: return "emergency";
  }
  return "unknown";
}

}  // namespace fsink
