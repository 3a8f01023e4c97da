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

#include "core/iobuf.hpp"

#include <stdlib.h>

#include <new>

namespace {

/**
 * Trivial wrappers around malloc, realloc that check for allocation
 * failure and throw std::bad_alloc in that case.
 */
inline void* checkedMalloc(size_t size) {
  void* p = malloc(size);
  if (!p) {
    throw std::bad_alloc();
  }
  return p;
}

inline void* checkedRealloc(void* ptr, size_t size) {
  void* p = realloc(ptr, size);
  if (!p) {
    throw std::bad_alloc();
  }
  return p;
}

// Add room for padding so the capacity is a multiple of 8 bytes.
inline size_t goodBufferSize(size_t minCapacity) {
  return (minCapacity + 7) & ~size_t{7};
}

}  // namespace

namespace saea {

IOBuf::IOBuf(CreateOp, size_t capacity) {
  capacity_ = goodBufferSize(capacity);
  buf_ = static_cast<uint8_t*>(checkedMalloc(capacity_ ? capacity_ : 1));
  data_ = buf_;
}

IOBuf::IOBuf(CopyBufferOp /* op */, const void* buf, size_t size, size_t headroom, size_t minTailroom)
    : IOBuf(CREATE, headroom + size + minTailroom) {
  data_ += headroom;
  if (size > 0) {
    DCHECK(buf != nullptr);
    memcpy(mutable_data(), buf, size);
    append(size);
  }
}

std::unique_ptr<IOBuf> IOBuf::create(size_t capacity) {
  return std::make_unique<IOBuf>(CREATE, capacity);
}

std::unique_ptr<IOBuf> IOBuf::copyBuffer(const void* buf, size_t size, size_t headroom, size_t minTailroom) {
  return std::make_unique<IOBuf>(COPY_BUFFER, buf, size, headroom, minTailroom);
}

IOBuf::IOBuf() noexcept = default;

IOBuf::IOBuf(IOBuf&& other) noexcept
    : buf_(other.buf_), data_(other.data_), length_(other.length_), capacity_(other.capacity_) {
  // Reset other so it is a clean state to be destroyed.
  other.buf_ = nullptr;
  other.data_ = nullptr;
  other.length_ = 0;
  other.capacity_ = 0;
}

IOBuf& IOBuf::operator=(IOBuf&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  free(buf_);

  data_ = other.data_;
  buf_ = other.buf_;
  length_ = other.length_;
  capacity_ = other.capacity_;

  // Reset other so it is a clean state to be destroyed.
  other.buf_ = nullptr;
  other.data_ = nullptr;
  other.length_ = 0;
  other.capacity_ = 0;
  return *this;
}

IOBuf::~IOBuf() {
  free(buf_);
}

void IOBuf::reserveSlow(size_t minHeadroom, size_t minTailroom) {
  size_t newCapacity = length_ + minHeadroom + minTailroom;

  // - If we have enough total room, move the data around in the buffer
  //   and adjust the data_ pointer.
  // - If we have enough headroom (headroom() >= minHeadroom) and the data is
  //   large compared to the slack, use realloc().
  // - Otherwise, bite the bullet and reallocate.
  if (buf_ && headroom() + tailroom() >= minHeadroom + minTailroom) {
    uint8_t* newData = mutable_buffer() + minHeadroom;
    memmove(newData, data_, length_);
    data_ = newData;
    return;
  }

  size_t newAllocatedCapacity = 0;
  uint8_t* newBuffer = nullptr;
  size_t newHeadroom = 0;
  size_t oldHeadroom = headroom();

  if (length_ && oldHeadroom >= minHeadroom) {
    size_t headSlack = oldHeadroom - minHeadroom;
    size_t copySlack = capacity() - length_;
    if (copySlack * 2 <= length_) {
      newAllocatedCapacity = goodBufferSize(newCapacity + headSlack);
      newBuffer = static_cast<uint8_t*>(checkedRealloc(buf_, newAllocatedCapacity));
      newHeadroom = oldHeadroom;
    }
  }

  // None of the previous reallocation strategies worked.  malloc/copy/free.
  if (newBuffer == nullptr) {
    newAllocatedCapacity = goodBufferSize(newCapacity);
    newBuffer = static_cast<uint8_t*>(checkedMalloc(newAllocatedCapacity ? newAllocatedCapacity : 1));
    if (length_ > 0) {
      memcpy(newBuffer + minHeadroom, data_, length_);
    }
    newHeadroom = minHeadroom;
    free(buf_);
  }

  capacity_ = newAllocatedCapacity;
  buf_ = newBuffer;
  data_ = newBuffer + newHeadroom;
}

}  // namespace saea
