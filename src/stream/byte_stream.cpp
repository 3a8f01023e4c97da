// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/byte_stream.hpp"

#include <errno.h>
#include <unistd.h>

#include <algorithm>

#include "core/common_posix.hpp"
#include "core/logging.hpp"
#include "core/utils.hpp"
#include "stream/stream_errors.hpp"

namespace saea {

ByteSource::~ByteSource() = default;

ByteSink::~ByteSink() = default;

int ByteSink::Flush() {
  return OK;
}

FileByteSource::FileByteSource(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}

FileByteSource::~FileByteSource() {
  if (owns_fd_ && fd_ >= 0 && IGNORE_EINTR(close(fd_)) < 0) {
    PLOG(WARNING) << "close() failed";
  }
}

int FileByteSource::Read(uint8_t* buf, int buf_len) {
  ssize_t ret = HANDLE_EINTR(read(fd_, buf, buf_len));
  if (ret < 0) {
    PLOG(WARNING) << "read() failed";
    return ERR_IO_FAILED;
  }
  return static_cast<int>(ret);
}

FileByteSink::FileByteSink(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}

FileByteSink::~FileByteSink() {
  if (Close() != OK) {
    LOG(WARNING) << "Failed to close output";
  }
}

int FileByteSink::Write(const uint8_t* buf, size_t buf_len) {
  if (fd_ < 0) {
    return ERR_IO_FAILED;
  }
  if (!WriteFileDescriptor(fd_, buf, buf_len)) {
    PLOG(WARNING) << "write() failed";
    return ERR_IO_FAILED;
  }
  return OK;
}

int FileByteSink::Flush() {
  if (fd_ < 0) {
    return ERR_IO_FAILED;
  }
  // fsync is meaningless on pipes and terminals.
  if (HANDLE_EINTR(fsync(fd_)) < 0 && errno != EINVAL && errno != EROFS) {
    PLOG(WARNING) << "fsync() failed";
    return ERR_IO_FAILED;
  }
  return OK;
}

int FileByteSink::Close() {
  if (!owns_fd_ || fd_ < 0) {
    return OK;
  }
  int rv = Flush();
  int fd = fd_;
  fd_ = -1;
  if (IGNORE_EINTR(close(fd)) < 0) {
    PLOG(WARNING) << "close() failed";
    return ERR_IO_FAILED;
  }
  return rv;
}

IOBufByteSource::IOBufByteSource(const IOBuf* buf, size_t max_read)
    : IOBufByteSource(buf->data(), buf->length(), max_read) {}

IOBufByteSource::IOBufByteSource(const uint8_t* data, size_t len, size_t max_read)
    : data_(data), len_(len), max_read_(max_read) {}

int IOBufByteSource::Read(uint8_t* buf, int buf_len) {
  size_t n = std::min(static_cast<size_t>(buf_len), remaining());
  if (max_read_) {
    n = std::min(n, max_read_);
  }
  if (n) {
    memcpy(buf, data_ + offset_, n);
    offset_ += n;
  }
  return static_cast<int>(n);
}

IOBufByteSink::IOBufByteSink() = default;

int IOBufByteSink::Write(const uint8_t* buf, size_t buf_len) {
  buf_.append(buf, buf_len);
  return OK;
}

}  // namespace saea
