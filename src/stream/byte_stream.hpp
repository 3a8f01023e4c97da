// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_BYTE_STREAM
#define H_STREAM_BYTE_STREAM

#include <stddef.h>
#include <stdint.h>

#include <memory>

#include "core/iobuf.hpp"

namespace saea {

// Where ciphertext or plaintext is pulled from.
class ByteSource {
 public:
  virtual ~ByteSource();

  // Reads up to |buf_len| bytes into |buf|. Returns the number of bytes read,
  // 0 at end of input or ERR_IO_FAILED.
  virtual int Read(uint8_t* buf, int buf_len) = 0;
};

// Where ciphertext or plaintext is pushed to. Writes are append-only.
class ByteSink {
 public:
  virtual ~ByteSink();

  // Writes all of |buf|. Returns OK or ERR_IO_FAILED.
  virtual int Write(const uint8_t* buf, size_t buf_len) = 0;

  // Returns OK or ERR_IO_FAILED.
  virtual int Flush();
};

class FileByteSource : public ByteSource {
 public:
  // Takes ownership of |fd| if |owns_fd| is set.
  FileByteSource(int fd, bool owns_fd);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  int Read(uint8_t* buf, int buf_len) override;

  int fd() const { return fd_; }

 private:
  int fd_;
  bool owns_fd_;
};

class FileByteSink : public ByteSink {
 public:
  // Takes ownership of |fd| if |owns_fd| is set.
  FileByteSink(int fd, bool owns_fd);
  ~FileByteSink() override;

  FileByteSink(const FileByteSink&) = delete;
  FileByteSink& operator=(const FileByteSink&) = delete;

  int Write(const uint8_t* buf, size_t buf_len) override;
  int Flush() override;

  // Flushes and closes the descriptor if owned, later writes fail. Returns OK
  // or ERR_IO_FAILED.
  int Close();

 private:
  int fd_;
  bool owns_fd_;
};

// Reads from an in-memory buffer. |max_read| caps the size of a single
// Read() so short reads can be simulated.
class IOBufByteSource : public ByteSource {
 public:
  explicit IOBufByteSource(const IOBuf* buf, size_t max_read = 0);
  IOBufByteSource(const uint8_t* data, size_t len, size_t max_read = 0);

  int Read(uint8_t* buf, int buf_len) override;

  size_t remaining() const { return len_ - offset_; }

 private:
  const uint8_t* data_;
  size_t len_;
  size_t offset_ = 0;
  size_t max_read_;
};

// Appends to an in-memory buffer.
class IOBufByteSink : public ByteSink {
 public:
  IOBufByteSink();

  int Write(const uint8_t* buf, size_t buf_len) override;

  const IOBuf* buf() const { return &buf_; }
  IOBuf* mutable_buf() { return &buf_; }

 private:
  IOBuf buf_;
};

}  // namespace saea

#endif  // H_STREAM_BYTE_STREAM
