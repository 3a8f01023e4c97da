// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CORE_RAND_UTIL
#define H_CORE_RAND_UTIL

#include <stddef.h>
#include <stdint.h>

// Returns a random number in range [0, UINT64_MAX]. Thread-safe.
uint64_t RandUint64();

// Fills |output_length| bytes of |output| with random data from the
// cryptographically secure generator. Thread-safe.
void RandBytes(void* output, size_t output_length);

#endif  // H_CORE_RAND_UTIL
