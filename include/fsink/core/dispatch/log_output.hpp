// include/fsink/core/dispatch/log_output.hpp
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fsink/core/config.hpp"
#include "fsink/core/dispatch/level.hpp"
#include "fsink/core/sinks/log_sink.hpp"
#include "fsink/core/status.hpp"

namespace fsink {

// Rewrites a message before it reaches the sink. Receives the output of the
// previous callback in the chain.
using Callback = std::function<std::string(const std::string& message, Level level)>;

// Dispatch-side wrapper around one sink: level window plus callback chain.
// For every accepted record the chain runs once and the sink sees exactly
// one log_message() call.
class LogOutput {
 public:
  LogOutput(std::string name, std::unique_ptr<LogSink> sink, Level min_level,
            std::optional<Level> max_level = std::nullopt,
            std::vector<Callback> callbacks = {});

  LogOutput(LogOutput&&) = default;
  LogOutput& operator=(LogOutput&&) = default;

  [[nodiscard]] bool would_log(Level level) const noexcept;

  // Records outside [min_level, max_level] are dropped and return OK.
  Status log(Level level, const std::string& message);

  Status flush() { return sink_->flush(); }
  void close() { sink_->close(); }

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] Level min_level() const noexcept { return min_level_; }
  [[nodiscard]] const std::optional<Level>& max_level() const noexcept { return max_level_; }

 private:
  std::string apply_callbacks_(const std::string& message, Level level) const;

  std::string name_;
  std::unique_ptr<LogSink> sink_;
  Level min_level_;
  std::optional<Level> max_level_;
  std::vector<Callback> callbacks_;
};

// Builds a FileSink from cfg.sink and wraps it. Returns the validation or
// open error.
Result<LogOutput> make_file_output(OutputConfig cfg, std::vector<Callback> callbacks = {});

}  // namespace fsink
