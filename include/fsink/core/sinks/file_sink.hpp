// include/fsink/core/sinks/file_sink.hpp
#pragma once

#include <memory>
#include <string>

#include "fsink/core/config.hpp"
#include "fsink/core/io/file_handle_manager.hpp"
#include "fsink/core/mode_resolver.hpp"
#include "fsink/core/sinks/log_sink.hpp"
#include "fsink/core/status.hpp"

namespace fsink {

// Writes each message to a file.
//
// Lifecycle: Constructed -> [Opened]? -> (writing)* -> Closed.
//  - Persistent mode opens inside create(); an open failure is returned
//    from there.
//  - close_after_write mode opens around every log_message(); an open
//    failure is returned from that call.
// The destructor closes any handle still held.
class FileSink final : public LogSink {
  struct Key {
    explicit Key() = default;
  };

 public:
  static Result<std::unique_ptr<FileSink>> create(SinkConfig cfg);

  // Use create(); Key keeps construction inside this class.
  FileSink(Key, SinkConfig cfg);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  Status log_message(const std::string& message) override;
  Status flush() override;
  void close() override;

  [[nodiscard]] const std::string& filename() const noexcept { return files_.config().filename; }
  [[nodiscard]] OpenMode mode() const noexcept { return files_.mode(); }
  [[nodiscard]] bool is_open() const { return files_.holds_handle(); }

 private:
  FileHandleManager files_;
  bool closed_{false};
};

}  // namespace fsink
