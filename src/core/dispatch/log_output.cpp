// src/core/dispatch/log_output.cpp
#include "fsink/core/dispatch/log_output.hpp"

#include <utility>

#include "fsink/core/sinks/file_sink.hpp"

namespace fsink {

LogOutput::LogOutput(std::string name, std::unique_ptr<LogSink> sink, Level min_level,
                     std::optional<Level> max_level, std::vector<Callback> callbacks)
    : name_(std::move(name)),
      sink_(std::move(sink)),
      min_level_(min_level),
      max_level_(max_level),
      callbacks_(std::move(callbacks)) {}

bool LogOutput::would_log(Level level) const noexcept {
  if (level < min_level_) return false;
  if (max_level_ && level > *max_level_) return false;
  return true;
}

std::string LogOutput::apply_callbacks_(const std::string& message, Level level) const {
  std::string out = message;
  for (const auto& cb : callbacks_) {
    out = cb(out, level);
  }
  return out;
}

Status LogOutput::log(Level level, const std::string& message) {
  if (!would_log(level)) return Status::ok_status();
  return sink_->log_message(apply_callbacks_(message, level));
}

Result<LogOutput> make_file_output(OutputConfig cfg, std::vector<Callback> callbacks) {
  const Status valid = validate_output_config(cfg);
  if (!valid.ok()) return Result<LogOutput>::err(valid);

  auto sink_r = FileSink::create(std::move(cfg.sink));
  if (!sink_r.ok()) return Result<LogOutput>::err(sink_r.status());

  return Result<LogOutput>::ok(LogOutput(std::move(cfg.name), sink_r.take_value(), cfg.min_level,
                                         cfg.max_level, std::move(callbacks)));
}

}  // namespace fsink
