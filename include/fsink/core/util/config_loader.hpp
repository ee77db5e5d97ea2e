// include/fsink/core/util/config_loader.hpp
#pragma once

#include <string>

#include "fsink/core/config.hpp"
#include "fsink/core/status.hpp"

namespace fsink {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - Unrecognized keys are ignored.
//
// Returns a fully populated AppConfig with defaults applied + validated.
Result<AppConfig> load_config(const std::string& path);

}  // namespace fsink
