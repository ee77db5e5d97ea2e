// include/fsink/core/mode_resolver.hpp
#pragma once

#include <optional>
#include <string>

namespace fsink {

enum class OpenMode {
  kTruncate,
  kAppend,
};

// Resolution order:
//  1. close_after_write      -> kAppend (reopening must never truncate)
//  2. "append", ">>", or the decimal value of O_APPEND -> kAppend
//  3. anything else, including unset and unrecognized  -> kTruncate
//
// Never fails. Unknown mode strings degrade to kTruncate on purpose; callers
// rely on that leniency, so do not turn it into an error.
OpenMode resolve_open_mode(bool close_after_write, const std::optional<std::string>& requested);

// Numeric form: `flags` is compared against the platform O_APPEND value.
OpenMode resolve_open_mode(bool close_after_write, int flags);

const char* to_string(OpenMode mode);

}  // namespace fsink
