// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CRYPTO_AEAD_EVP_ENCRYPTER
#define H_CRYPTO_AEAD_EVP_ENCRYPTER

#include "crypto/aead_base_encrypter.hpp"

#include <openssl/aead.h>

namespace crypto {

// Uses a BoringSSL EVP_AEAD to seal records.
class AeadEvpEncrypter : public AeadBaseEncrypter {
 public:
  AeadEvpEncrypter(const EVP_AEAD* (*aead_getter)(), size_t key_size, size_t auth_tag_size, size_t nonce_size);
  ~AeadEvpEncrypter() override;

  bool SetKey(const uint8_t* key, size_t key_len) override;

  bool Encrypt(const uint8_t* nonce,
               size_t nonce_len,
               const uint8_t* associated_data,
               size_t associated_data_len,
               const uint8_t* plaintext,
               size_t plaintext_len,
               uint8_t* output,
               size_t* output_length,
               size_t max_output_length) override;

 private:
  const EVP_AEAD* const aead_alg_;
  bssl::ScopedEVP_AEAD_CTX ctx_;
  bool has_key_ = false;
};

}  // namespace crypto

#endif  // H_CRYPTO_AEAD_EVP_ENCRYPTER
