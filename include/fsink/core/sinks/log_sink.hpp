// include/fsink/core/sinks/log_sink.hpp
#pragma once

#include <string>

#include "fsink/core/status.hpp"

namespace fsink {

// Destination for fully formatted log messages.
// The dispatch side has already filtered and shaped the message; a sink
// writes it as-is, once per accepted record.
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual Status log_message(const std::string& message) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace fsink
