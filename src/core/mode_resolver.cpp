// src/core/mode_resolver.cpp
#include "fsink/core/mode_resolver.hpp"

#include <fcntl.h>

#include <charconv>
#include <system_error>

namespace fsink {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

bool is_append_flag_value(const std::string& s) {
  if (!is_digits(s)) return false;
  long long v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return false;  // overflow
  return v == static_cast<long long>(O_APPEND);
}

}  // namespace

OpenMode resolve_open_mode(bool close_after_write, const std::optional<std::string>& requested) {
  if (close_after_write) return OpenMode::kAppend;
  if (!requested) return OpenMode::kTruncate;

  const std::string& m = *requested;
  if (m == "append" || m == ">>") return OpenMode::kAppend;
  if (is_append_flag_value(m)) return OpenMode::kAppend;

  return OpenMode::kTruncate;
}

OpenMode resolve_open_mode(bool close_after_write, int flags) {
  if (close_after_write) return OpenMode::kAppend;
  return flags == O_APPEND ? OpenMode::kAppend : OpenMode::kTruncate;
}

const char* to_string(OpenMode mode) {
  switch (mode) {
    case OpenMode::kTruncate: return "truncate";
    case OpenMode::kAppend: return "append";
  }
  return "unknown";
}

}  // namespace fsink
