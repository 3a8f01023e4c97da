// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "core/rand_util.hpp"

#include <openssl/rand.h>

#include "core/logging.hpp"

uint64_t RandUint64() {
  uint64_t number;
  RandBytes(&number, sizeof(number));
  return number;
}

void RandBytes(void* output, size_t output_length) {
  // BoringSSL aborts internally when the system entropy source is unusable,
  // a zero return is never expected.
  CHECK(RAND_bytes(reinterpret_cast<uint8_t*>(output), output_length)) << "RAND_bytes failed";
}
