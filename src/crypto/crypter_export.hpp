// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CRYPTO_CRYPTER_EXPORT
#define H_CRYPTO_CRYPTER_EXPORT

#include <stddef.h>
#include <stdint.h>
#include <string_view>

#define MAX_KEY_LENGTH 64
#define MAX_NONCE_LENGTH 32

// The numeric value is the algorithm id stored in the stream header, so
// values must never be changed or re-used.
#define CIPHER_METHOD_MAP_BORINGSSL(XX) XX(0x01U, XCHACHA20POLY1305, "xchacha20-poly1305")

#define CIPHER_METHOD_VALID_MAP(XX) CIPHER_METHOD_MAP_BORINGSSL(XX)

#define CIPHER_METHOD_MAP(XX)  \
  XX(0x0U, INVALID, "invalid") \
  CIPHER_METHOD_VALID_MAP(XX)

enum cipher_method : uint8_t {
#define XX(num, name, string) CRYPTO_##name = num,
  CIPHER_METHOD_MAP(XX)
#undef XX
};

#define CRYPTO_DEFAULT CRYPTO_XCHACHA20POLY1305
#define CRYPTO_DEFAULT_STR CRYPTO_XCHACHA20POLY1305_STR

enum cipher_method to_cipher_method(std::string_view method);
std::string_view to_cipher_method_str(enum cipher_method method);
bool is_valid_cipher_method(uint8_t method);

#define XX(num, name, string) constexpr const std::string_view CRYPTO_##name##_STR = string;
CIPHER_METHOD_MAP(XX)
#undef XX

extern const std::string_view kCipherMethodsStr;

#endif  // H_CRYPTO_CRYPTER_EXPORT
