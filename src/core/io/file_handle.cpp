// src/core/io/file_handle.cpp
#include "fsink/core/io/file_handle.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

namespace fsink {
namespace {

std::ios::openmode to_openmode(OpenMode mode) {
  const std::ios::openmode base = std::ios::out | std::ios::binary;
  return mode == OpenMode::kAppend ? (base | std::ios::app) : (base | std::ios::trunc);
}

std::string os_reason(int err) {
  if (err == 0) return "unknown error";
  return std::generic_category().message(err);
}

}  // namespace

Result<FileHandle> FileHandle::open(const std::string& path, OpenMode mode, bool autoflush) {
  FileHandle h(path, autoflush);

  errno = 0;
  h.f_.open(path, to_openmode(mode));
  if (!h.f_.is_open()) {
    const int err = errno;
    return Result<FileHandle>::err(
        Status::io_error("can't write to '" + path + "': " + os_reason(err)));
  }
  return Result<FileHandle>::ok(std::move(h));
}

FileHandle& FileHandle::operator=(FileHandle&& other) {
  if (this != &other) {
    close();
    path_ = std::move(other.path_);
    autoflush_ = other.autoflush_;
    f_ = std::move(other.f_);
  }
  return *this;
}

FileHandle::~FileHandle() { close(); }

Status FileHandle::write(std::string_view bytes) {
  if (!f_.is_open()) return Status::invalid_argument("write on closed file '" + path_ + "'");

  f_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");

  if (autoflush_) return flush();
  return Status::ok_status();
}

Status FileHandle::flush() {
  if (!f_.is_open()) return Status::ok_status();
  f_.flush();
  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  return Status::ok_status();
}

void FileHandle::close() noexcept {
  if (f_.is_open()) f_.close();
  f_.clear();  // a failed close is not reported
}

}  // namespace fsink
