// src/core/sinks/file_sink.cpp
#include "fsink/core/sinks/file_sink.hpp"

#include <utility>

namespace fsink {

FileSink::FileSink(Key, SinkConfig cfg) : files_(std::move(cfg)) {}

Result<std::unique_ptr<FileSink>> FileSink::create(SinkConfig cfg) {
  const Status valid = validate_sink_config(cfg);
  if (!valid.ok()) return Result<std::unique_ptr<FileSink>>::err(valid);

  auto sink = std::make_unique<FileSink>(Key{}, std::move(cfg));
  const Status st = sink->files_.start();
  if (!st.ok()) return Result<std::unique_ptr<FileSink>>::err(st);

  return Result<std::unique_ptr<FileSink>>::ok(std::move(sink));
}

FileSink::~FileSink() { close(); }

Status FileSink::log_message(const std::string& message) {
  if (closed_) {
    return Status::invalid_argument("FileSink::log_message called after close ('" + filename() + "')");
  }
  return files_.write(message);
}

Status FileSink::flush() { return files_.flush(); }

void FileSink::close() {
  files_.stop();
  closed_ = true;
}

}  // namespace fsink
