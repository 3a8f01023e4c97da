// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */
#include "crypto/aead_evp_encrypter.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>

#include "core/dump_hex.hpp"
#include "core/logging.hpp"

// In debug builds only, log OpenSSL error stack. Then clear OpenSSL error
// stack.
static void DLogOpenSslErrors() {
#ifdef NDEBUG
  ERR_clear_error();
#else
  while (uint32_t error = ERR_get_error()) {
    char buf[120];
    ERR_error_string_n(error, buf, sizeof(buf));
    DLOG(ERROR) << "OpenSSL error: " << buf;
  }
#endif
}

static const EVP_AEAD* InitAndCall(const EVP_AEAD* (*aead_getter)()) {
  // Ensure BoringSSL is initialized before calling |aead_getter|.
  ::CRYPTO_library_init();
  return aead_getter();
}

namespace crypto {

AeadEvpEncrypter::AeadEvpEncrypter(const EVP_AEAD* (*aead_getter)(),
                                   size_t key_size,
                                   size_t auth_tag_size,
                                   size_t nonce_size)
    : AeadBaseEncrypter(key_size, auth_tag_size, nonce_size), aead_alg_(InitAndCall(aead_getter)) {
  DCHECK_EQ(EVP_AEAD_key_length(aead_alg_), key_size);
  DCHECK_EQ(EVP_AEAD_nonce_length(aead_alg_), nonce_size);
  DCHECK_GE(EVP_AEAD_max_tag_len(aead_alg_), auth_tag_size);
}

AeadEvpEncrypter::~AeadEvpEncrypter() = default;

bool AeadEvpEncrypter::SetKey(const uint8_t* key, size_t key_len) {
  if (!AeadBaseEncrypter::SetKey(key, key_len)) {
    return false;
  }
  EVP_AEAD_CTX_cleanup(ctx_.get());
  has_key_ = false;
  if (!EVP_AEAD_CTX_init(ctx_.get(), aead_alg_, key, key_size_, auth_tag_size_, nullptr)) {
    DLogOpenSslErrors();
    return false;
  }
  has_key_ = true;
  return true;
}

bool AeadEvpEncrypter::Encrypt(const uint8_t* nonce,
                               size_t nonce_len,
                               const uint8_t* associated_data,
                               size_t associated_data_len,
                               const uint8_t* plaintext,
                               size_t plaintext_len,
                               uint8_t* output,
                               size_t* output_length,
                               size_t max_output_length) {
  if (!has_key_) {
    LOG(ERROR) << "Unable to encrypt without a key";
    return false;
  }
  if (nonce_len != nonce_size_) {
    LOG(ERROR) << "Invalid nonce length: " << nonce_len;
    return false;
  }
  size_t ciphertext_size = GetCiphertextSize(plaintext_len);
  if (max_output_length < ciphertext_size) {
    return false;
  }

  DumpHex("EN-NONCE", nonce, nonce_len);

  if (!EVP_AEAD_CTX_seal(ctx_.get(), output, output_length, max_output_length, nonce, nonce_len, plaintext,
                         plaintext_len, associated_data, associated_data_len)) {
    DLogOpenSslErrors();
    return false;
  }
  DCHECK_EQ(*output_length, ciphertext_size);
  return true;
}

}  // namespace crypto
