// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "crypto/decrypter.hpp"
#include "core/logging.hpp"

#include "crypto/crypter_export.hpp"
#include "crypto/xchacha20_poly1305_evp_decrypter.hpp"

namespace crypto {

Decrypter::~Decrypter() = default;

std::unique_ptr<Decrypter> Decrypter::CreateFromCipherSuite(enum cipher_method method) {
  switch (method) {
    case CRYPTO_XCHACHA20POLY1305:
      return std::make_unique<XChaCha20Poly1305EvpDecrypter>();
    default:
      LOG(ERROR) << "Unsupported cipher created: " << to_cipher_method_str(method) << " ("
                 << static_cast<int>(method) << ")";
      return nullptr;
  }
}

}  // namespace crypto
