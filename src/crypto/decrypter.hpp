// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CRYPTO_DECRYPTER
#define H_CRYPTO_DECRYPTER

#include <stddef.h>
#include <stdint.h>

#include <memory>

#include "crypto/crypter.hpp"
#include "crypto/crypter_export.hpp"

namespace crypto {

class Decrypter : public Crypter {
 public:
  ~Decrypter() override;

  // Returns nullptr if |method| is not a usable algorithm.
  static std::unique_ptr<Decrypter> CreateFromCipherSuite(enum cipher_method method);

  // Opens |ciphertext| (which carries the tag as its last GetTagSize() bytes)
  // under |nonce| and |associated_data|. Returns false if the tag does not
  // verify, in which case the content of |output| is unspecified.
  virtual bool Decrypt(const uint8_t* nonce,
                       size_t nonce_len,
                       const uint8_t* associated_data,
                       size_t associated_data_len,
                       const uint8_t* ciphertext,
                       size_t ciphertext_len,
                       uint8_t* output,
                       size_t* output_length,
                       size_t max_output_length) = 0;

  // Returns the length of the plaintext recovered from a ciphertext of
  // |ciphertext_size| bytes.
  virtual size_t GetPlaintextSize(size_t ciphertext_size) const = 0;
};

}  // namespace crypto

#endif  // H_CRYPTO_DECRYPTER
