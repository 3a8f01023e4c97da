// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "crypto/encrypter.hpp"
#include "core/logging.hpp"

#include "crypto/crypter_export.hpp"
#include "crypto/xchacha20_poly1305_evp_encrypter.hpp"

namespace crypto {

Encrypter::~Encrypter() = default;

std::unique_ptr<Encrypter> Encrypter::CreateFromCipherSuite(enum cipher_method method) {
  switch (method) {
    case CRYPTO_XCHACHA20POLY1305:
      return std::make_unique<XChaCha20Poly1305EvpEncrypter>();
    default:
      LOG(ERROR) << "Unsupported cipher created: " << to_cipher_method_str(method) << " ("
                 << static_cast<int>(method) << ")";
      return nullptr;
  }
}

}  // namespace crypto
