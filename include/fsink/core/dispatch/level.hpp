// include/fsink/core/dispatch/level.hpp
#pragma once

#include <string>

#include "fsink/core/status.hpp"

namespace fsink {

// Severity levels, lowest first. Numeric values are stable and accepted by
// parse_level() as an alternative to the names.
enum class Level : int {
  kDebug = 0,
  kInfo,
  kNotice,
  kWarning,
  kError,
  kCritical,
  kAlert,
  kEmergency,
};

// Accepts the canonical names, the short aliases (warn, err, crit, emerg)
// and "0".."7". Anything else is invalid_argument.
Result<Level> parse_level(const std::string& s);

const char* to_string(Level level);

}  // namespace fsink
