// include/fsink/core/config.hpp
#pragma once

#include <optional>
#include <string>

#include "fsink/core/dispatch/level.hpp"
#include "fsink/core/status.hpp"

namespace fsink {

// -----------------------------
// File sink
// -----------------------------
struct SinkConfig {
  // Target path. Required; the parent directory is never created for you.
  std::string filename;

  // Requested open mode: "write", ">", "append", ">>" or the decimal value of
  // O_APPEND. Unset means truncate. See resolve_open_mode().
  // In YAML the arrows must be quoted ('>>'); a bare > starts a block scalar.
  std::optional<std::string> mode;

  // Flush after every message so independent readers see it immediately.
  bool autoflush = true;

  // Open/write/close per message instead of holding the file open.
  // Forces append.
  bool close_after_write = false;
};

// -----------------------------
// Output (dispatch side)
// -----------------------------
struct OutputConfig {
  // Name of the output, not the filename.
  std::string name;

  Level min_level = Level::kDebug;

  // Unset means no upper bound.
  std::optional<Level> max_level;

  SinkConfig sink;
};

// -----------------------------
// Root config (fsink_log)
// -----------------------------
struct AppConfig {
  OutputConfig output;

  // Level used for stdin lines when --level is not given.
  Level default_level = Level::kInfo;
};

inline Status validate_sink_config(const SinkConfig& cfg) {
  if (cfg.filename.empty()) {
    return Status::invalid_argument("file.filename must not be empty");
  }
  return Status::ok_status();
}

inline Status validate_output_config(const OutputConfig& cfg) {
  if (cfg.name.empty()) {
    return Status::invalid_argument("name must not be empty");
  }
  if (cfg.max_level && *cfg.max_level < cfg.min_level) {
    return Status::invalid_argument("max_level must be >= min_level");
  }
  return validate_sink_config(cfg.sink);
}

inline Status validate_config(const AppConfig& cfg) {
  return validate_output_config(cfg.output);
}

}  // namespace fsink
