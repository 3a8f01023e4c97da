// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

// Loads and stores of big-endian integers from unaligned byte buffers.

#ifndef H_CORE_SYS_BYTEORDER
#define H_CORE_SYS_BYTEORDER

#include <stdint.h>

namespace saea {

inline void StoreBigEndian32(uint8_t* out, uint32_t value) {
  out[0] = static_cast<uint8_t>(value >> 24);
  out[1] = static_cast<uint8_t>(value >> 16);
  out[2] = static_cast<uint8_t>(value >> 8);
  out[3] = static_cast<uint8_t>(value);
}

inline void StoreBigEndian64(uint8_t* out, uint64_t value) {
  for (int i = 7; i >= 0; --i) {
    out[i] = static_cast<uint8_t>(value);
    value >>= 8;
  }
}

inline uint32_t LoadBigEndian32(const uint8_t* in) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}


}  // namespace saea

#endif  // H_CORE_SYS_BYTEORDER
