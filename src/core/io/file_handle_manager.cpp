// src/core/io/file_handle_manager.cpp
#include "fsink/core/io/file_handle_manager.hpp"

#include <utility>

namespace fsink {

FileHandleManager::FileHandleManager(SinkConfig cfg)
    : cfg_(std::move(cfg)), mode_(resolve_open_mode(cfg_.close_after_write, cfg_.mode)) {}

FileHandleManager::~FileHandleManager() { stop(); }

Status FileHandleManager::start() {
  if (!persistent() || holds_handle()) return Status::ok_status();

  auto h = FileHandle::open(cfg_.filename, mode_, cfg_.autoflush);
  if (!h.ok()) return h.status();
  handle_.emplace(h.take_value());
  return Status::ok_status();
}

Status FileHandleManager::write(const std::string& bytes) {
  if (!persistent()) return write_ephemeral_(bytes);

  if (!holds_handle()) {
    return Status::invalid_argument("file '" + cfg_.filename + "' is not open");
  }
  return handle_->write(bytes);
}

Status FileHandleManager::write_ephemeral_(const std::string& bytes) {
  auto h = FileHandle::open(cfg_.filename, mode_, cfg_.autoflush);
  if (!h.ok()) return h.status();

  // Scoped: closed on every path out of this function.
  FileHandle fh = h.take_value();
  const Status st = fh.write(bytes);
  fh.close();
  return st;
}

Status FileHandleManager::flush() {
  if (!holds_handle()) return Status::ok_status();
  return handle_->flush();
}

void FileHandleManager::stop() noexcept {
  if (handle_) {
    handle_->close();
    handle_.reset();
  }
}

}  // namespace fsink
