// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CRYPTO_CRYPTER
#define H_CRYPTO_CRYPTER

#include <stddef.h>
#include <stdint.h>

namespace crypto {

class Crypter {
 public:
  virtual ~Crypter();

  // Sets the symmetric encryption/decryption key. Returns true on success,
  // false on failure.
  //
  // NOTE: The key material is handed to the AEAD context and not retained
  // by the crypter itself.
  virtual bool SetKey(const uint8_t* key, size_t key_len) = 0;

  // Returns the size in bytes of a key for the algorithm.
  virtual size_t GetKeySize() const = 0;
  // Returns the size in bytes of the nonce the caller passes in with each
  // seal or open.
  virtual size_t GetNonceSize() const = 0;
  // Returns the size in bytes of the auth tag size(AEAD).
  virtual size_t GetTagSize() const = 0;

  // Returns the algorithm id (see cipher_method).
  virtual uint8_t cipher_id() const = 0;
};

}  // namespace crypto

#endif  // H_CRYPTO_CRYPTER
