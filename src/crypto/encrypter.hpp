// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CRYPTO_ENCRYPTER
#define H_CRYPTO_ENCRYPTER

#include <stddef.h>
#include <stdint.h>

#include <memory>

#include "crypto/crypter.hpp"
#include "crypto/crypter_export.hpp"

namespace crypto {

class Encrypter : public Crypter {
 public:
  ~Encrypter() override;

  // Returns nullptr if |method| is not a usable algorithm.
  static std::unique_ptr<Encrypter> CreateFromCipherSuite(enum cipher_method method);

  // Seals |plaintext| under |nonce| and |associated_data| and writes the
  // ciphertext followed by the tag to |output|. |nonce_len| must equal
  // GetNonceSize(). Returns false on failure.
  virtual bool Encrypt(const uint8_t* nonce,
                       size_t nonce_len,
                       const uint8_t* associated_data,
                       size_t associated_data_len,
                       const uint8_t* plaintext,
                       size_t plaintext_len,
                       uint8_t* output,
                       size_t* output_length,
                       size_t max_output_length) = 0;

  // Returns the maximum length of plaintext that can be encrypted
  // to ciphertext no larger than |ciphertext_size|.
  virtual size_t GetMaxPlaintextSize(size_t ciphertext_size) const = 0;

  // Returns the length of the ciphertext that would be generated by encrypting
  // to plaintext of size |plaintext_size|.
  virtual size_t GetCiphertextSize(size_t plaintext_size) const = 0;
};

}  // namespace crypto

#endif  // H_CRYPTO_ENCRYPTER
