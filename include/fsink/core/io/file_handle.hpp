// include/fsink/core/io/file_handle.hpp
#pragma once

#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include "fsink/core/mode_resolver.hpp"
#include "fsink/core/status.hpp"

namespace fsink {

// RAII owner of one open output file. Only FileHandle::open() creates a
// usable handle; the destructor closes it. Close errors are swallowed so
// that they can never override the outcome of an earlier write.
class FileHandle {
 public:
  // Fails with io_error (message carries the path and the OS reason) if the
  // file cannot be opened for writing. Nothing is created on failure.
  static Result<FileHandle> open(const std::string& path, OpenMode mode, bool autoflush);

  FileHandle(FileHandle&&) = default;
  FileHandle& operator=(FileHandle&& other);
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  ~FileHandle();

  // Bytes go out exactly as given. With autoflush the stream is flushed
  // before returning.
  Status write(std::string_view bytes);
  Status flush();

  // Idempotent, best effort.
  void close() noexcept;

  [[nodiscard]] bool is_open() const { return f_.is_open(); }
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  FileHandle(std::string path, bool autoflush) : path_(std::move(path)), autoflush_(autoflush) {}

  std::string path_;
  bool autoflush_{true};
  std::ofstream f_;
};

}  // namespace fsink
