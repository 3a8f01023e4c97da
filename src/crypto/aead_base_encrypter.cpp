// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "crypto/aead_base_encrypter.hpp"

#include <algorithm>

#include "core/logging.hpp"

namespace crypto {

AeadBaseEncrypter::AeadBaseEncrypter(size_t key_size, size_t auth_tag_size, size_t nonce_size)
    : key_size_(key_size), auth_tag_size_(auth_tag_size), nonce_size_(nonce_size) {
  DCHECK_LE(key_size_, kMaxKeySize);
  DCHECK_GE(kMaxNonceSize, nonce_size_);
}

AeadBaseEncrypter::~AeadBaseEncrypter() = default;

bool AeadBaseEncrypter::SetKey(const uint8_t* key, size_t key_len) {
  if (key == nullptr || key_len != key_size_) {
    LOG(WARNING) << "Invalid key length: " << key_len << " (expected " << key_size_ << ")";
    return false;
  }
  return true;
}

size_t AeadBaseEncrypter::GetKeySize() const {
  return key_size_;
}

size_t AeadBaseEncrypter::GetNonceSize() const {
  return nonce_size_;
}

size_t AeadBaseEncrypter::GetTagSize() const {
  return auth_tag_size_;
}

size_t AeadBaseEncrypter::GetMaxPlaintextSize(size_t ciphertext_size) const {
  return ciphertext_size - std::min(ciphertext_size, auth_tag_size_);
}

size_t AeadBaseEncrypter::GetCiphertextSize(size_t plaintext_size) const {
  return plaintext_size + auth_tag_size_;
}

}  // namespace crypto
