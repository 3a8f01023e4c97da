// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CRYPTO_AEAD_BASE_DECRYPTER
#define H_CRYPTO_AEAD_BASE_DECRYPTER

#include "crypto/decrypter.hpp"

#include <stddef.h>
#include <stdint.h>

namespace crypto {

class AeadBaseDecrypter : public Decrypter {
 public:
  AeadBaseDecrypter(size_t key_size, size_t auth_tag_size, size_t nonce_size);
  ~AeadBaseDecrypter() override;

  bool SetKey(const uint8_t* key, size_t key_len) override;

  size_t GetKeySize() const override;
  size_t GetNonceSize() const override;
  size_t GetTagSize() const override;
  size_t GetPlaintextSize(size_t ciphertext_size) const override;

 protected:
  static constexpr size_t kMaxKeySize = MAX_KEY_LENGTH;
  enum : size_t { kMaxNonceSize = MAX_NONCE_LENGTH };

  const size_t key_size_;
  const size_t auth_tag_size_;
  const size_t nonce_size_;
};

}  // namespace crypto

#endif  // H_CRYPTO_AEAD_BASE_DECRYPTER
