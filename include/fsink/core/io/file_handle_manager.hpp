// include/fsink/core/io/file_handle_manager.hpp
#pragma once

#include <optional>
#include <string>

#include "fsink/core/config.hpp"
#include "fsink/core/io/file_handle.hpp"
#include "fsink/core/mode_resolver.hpp"
#include "fsink/core/status.hpp"

namespace fsink {

// Sole owner of the sink's file handle. At most one handle is open at a time.
//
// Persistent (close_after_write == false):
//   start() opens once, write() reuses the handle, stop() closes it once.
// Ephemeral (close_after_write == true):
//   write() does open -> write -> close; no handle survives between calls.
//   Mode is always append, so reopening never truncates.
//
// Not thread-safe. Callers serialize write().
class FileHandleManager {
 public:
  explicit FileHandleManager(SinkConfig cfg);
  ~FileHandleManager();

  FileHandleManager(const FileHandleManager&) = delete;
  FileHandleManager& operator=(const FileHandleManager&) = delete;

  // Persistent mode: opens the file, returning the open error if any.
  // Ephemeral mode: no-op.
  Status start();

  Status write(const std::string& bytes);
  Status flush();

  // Closes any open handle. Safe to call repeatedly.
  void stop() noexcept;

  [[nodiscard]] OpenMode mode() const noexcept { return mode_; }
  [[nodiscard]] bool persistent() const noexcept { return !cfg_.close_after_write; }
  [[nodiscard]] bool holds_handle() const { return handle_.has_value() && handle_->is_open(); }
  [[nodiscard]] const SinkConfig& config() const noexcept { return cfg_; }

 private:
  Status write_ephemeral_(const std::string& bytes);

  const SinkConfig cfg_;
  const OpenMode mode_;
  std::optional<FileHandle> handle_;
};

}  // namespace fsink
