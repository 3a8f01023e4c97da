// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CRYPTO_XCHACHA20_POLY1305_EVP_DECRYPTER
#define H_CRYPTO_XCHACHA20_POLY1305_EVP_DECRYPTER

#include <stddef.h>
#include <stdint.h>

#include "crypto/aead_evp_decrypter.hpp"

namespace crypto {

// XChaCha20-Poly1305 with a 256-bit key, a 192-bit nonce and the full
// 128-bit Poly1305 tag.
class XChaCha20Poly1305EvpDecrypter : public AeadEvpDecrypter {
 public:
  enum : size_t {
    kAuthTagSize = 16,
  };

  XChaCha20Poly1305EvpDecrypter();
  ~XChaCha20Poly1305EvpDecrypter() override;

  uint8_t cipher_id() const override;
};

}  // namespace crypto

#endif  // H_CRYPTO_XCHACHA20_POLY1305_EVP_DECRYPTER
