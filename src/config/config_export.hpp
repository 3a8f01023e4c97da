// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_CONFIG_CONFIG_EXPORT
#define H_CONFIG_CONFIG_EXPORT

#include <absl/strings/str_cat.h>
#include <stdint.h>
#include <string>
#include <string_view>
#include "crypto/crypter_export.hpp"

struct CipherMethodFlag {
  explicit CipherMethodFlag(cipher_method m = CRYPTO_INVALID) : method(m) {}
  operator std::string_view() const { return to_cipher_method_str(method); }
  operator cipher_method() const { return method; }
  cipher_method method;
};

// Plaintext bytes per chunk. Text form accepts a k or m suffix.
struct ChunkSizeFlag {
  explicit ChunkSizeFlag(uint32_t s = 0u) : size(s) {}
  operator std::string() const {
    if (size && size % (1U << 20) == 0) {
      return absl::StrCat(size / (1U << 20), "m");
    } else if (size && size % (1U << 10) == 0) {
      return absl::StrCat(size / (1U << 10), "k");
    }
    return absl::StrCat(size);
  }
  operator uint32_t() const { return size; }
  uint32_t size;
};

#endif  // H_CONFIG_CONFIG_EXPORT
