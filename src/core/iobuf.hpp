// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */
/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef H_CORE_IOBUF
#define H_CORE_IOBUF

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include <memory>

#include "core/logging.hpp"

namespace saea {

/**
 * A single contiguous byte buffer with headroom and tailroom.
 *
 *   +------------+--------------------+-----------+
 *   | headroom   |        data        |  tailroom |
 *   +------------+--------------------+-----------+
 *   ^            ^                    ^           ^
 *   buffer()   data()               tail()      bufferEnd()
 *
 * Each IOBuf exclusively owns its buffer, there is no sharing between
 * instances.
 */
class IOBuf {
 public:
  enum CreateOp { CREATE };
  enum CopyBufferOp { COPY_BUFFER };

  /**
   * Allocate a new IOBuf object with the requested capacity.
   *
   * The data pointer will initially point to the start of the newly allocated
   * buffer, and will have a data length of 0.
   *
   * Throws std::bad_alloc on error.
   */
  static std::unique_ptr<IOBuf> create(size_t capacity);
  IOBuf(CreateOp, size_t capacity);

  /**
   * Convenience function to create a new IOBuf object that copies data from a
   * user-supplied buffer, optionally allocating a given amount of
   * headroom and tailroom.
   */
  static std::unique_ptr<IOBuf> copyBuffer(const void* buf, size_t size, size_t headroom = 0, size_t minTailroom = 0);
  IOBuf(CopyBufferOp op, const void* buf, size_t size, size_t headroom = 0, size_t minTailroom = 0);

  /**
   * Allocate a new null buffer.
   *
   * This can be used to allocate an empty IOBuf on the stack.  It will have no
   * space allocated for it.
   */
  IOBuf() noexcept;

  IOBuf(IOBuf&& other) noexcept;
  IOBuf& operator=(IOBuf&& other) noexcept;

  IOBuf(const IOBuf& other) = delete;
  IOBuf& operator=(const IOBuf& other) = delete;

  ~IOBuf();

  const uint8_t* buffer() const { return buf_; }
  uint8_t* mutable_buffer() { return buf_; }
  size_t capacity() const { return capacity_; }

  const uint8_t* data() const { return data_; }
  uint8_t* mutable_data() { return data_; }
  size_t length() const { return length_; }
  bool empty() const { return !length(); }

  const uint8_t* tail() const { return data_ + length_; }
  uint8_t* mutable_tail() { return data_ + length_; }

  size_t headroom() const { return size_t(data_ - buf_); }
  size_t tailroom() const { return size_t(buf_ + capacity_ - (data_ + length_)); }

  /**
   * Adjust the data pointer to include more valid data at the beginning.
   *
   * The caller is responsible for ensuring that there is sufficient
   * headroom for the new data, and for populating it.
   */
  void prepend(size_t amount) {
    DCHECK_LE(amount, headroom());
    data_ -= amount;
    length_ += amount;
  }

  /**
   * Adjust the tail pointer to include more valid data at the end.
   *
   * The caller is responsible for ensuring that there is sufficient
   * tailroom for the new data, and for populating it.
   */
  void append(size_t amount) {
    DCHECK_LE(amount, tailroom());
    length_ += amount;
  }

  /**
   * Copy |size| bytes from |buf| to the tail, growing the buffer if needed.
   */
  void append(const void* buf, size_t size) {
    reserve(0, size);
    if (size) {
      memcpy(mutable_tail(), buf, size);
      append(size);
    }
  }

  /**
   * Adjust the data pointer forwards to include less valid data.
   */
  void trimStart(size_t amount) {
    DCHECK_LE(amount, length_);
    data_ += amount;
    length_ -= amount;
  }

  /**
   * Adjust the tail pointer backwards to include less valid data.
   */
  void trimEnd(size_t amount) {
    DCHECK_LE(amount, length_);
    length_ -= amount;
  }

  /**
   * Clear the buffer.
   *
   * Postcondition: headroom() == 0, length() == 0, tailroom() == capacity()
   */
  void clear() {
    data_ = mutable_buffer();
    length_ = 0;
  }

  /**
   * Ensure that this buffer has at least minHeadroom headroom bytes and at
   * least minTailroom tailroom bytes.
   *
   * Postcondition: headroom() >= minHeadroom, tailroom() >= minTailroom,
   * the data (between data() and data() + length()) is preserved.
   */
  void reserve(size_t minHeadroom, size_t minTailroom) {
    if (headroom() >= minHeadroom && tailroom() >= minTailroom) {
      return;
    }
    if (length() == 0 && headroom() + tailroom() >= minHeadroom + minTailroom) {
      data_ = mutable_buffer() + minHeadroom;
      return;
    }
    reserveSlow(minHeadroom, minTailroom);
  }

 private:
  void reserveSlow(size_t minHeadroom, size_t minTailroom);

  uint8_t* buf_ = nullptr;
  uint8_t* data_ = nullptr;
  size_t length_ = 0;
  size_t capacity_ = 0;
};

}  // namespace saea

#endif  // H_CORE_IOBUF
