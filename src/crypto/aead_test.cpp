// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include <gtest/gtest-message.h>
#include <gtest/gtest.h>

#include <gmock/gmock.h>
#include <memory>
#include <vector>

#include "core/rand_util.hpp"
#include "crypto/decrypter.hpp"
#include "crypto/encrypter.hpp"

#include "test_util.hpp"

using namespace crypto;

namespace {
std::vector<uint8_t> GenerateRandContent(size_t size) {
  std::vector<uint8_t> buf(size);
  if (size) {
    RandBytes(buf.data(), size);
  }
  return buf;
}
}  // anonymous namespace

class AeadTest : public ::testing::TestWithParam<size_t> {
 public:
  void SetUp() override {
    key_ = GenerateRandContent(32);
    nonce_ = GenerateRandContent(24);
  }

 protected:
  void EncodeAndDecode(cipher_method method, size_t size) {
    auto encrypter = Encrypter::CreateFromCipherSuite(method);
    auto decrypter = Decrypter::CreateFromCipherSuite(method);
    ASSERT_TRUE(encrypter);
    ASSERT_TRUE(decrypter);
    ASSERT_EQ(encrypter->cipher_id(), method);
    ASSERT_TRUE(encrypter->SetKey(key_.data(), key_.size()));
    ASSERT_TRUE(decrypter->SetKey(key_.data(), key_.size()));

    auto plaintext = GenerateRandContent(size);
    std::vector<uint8_t> ciphertext(encrypter->GetCiphertextSize(size));
    size_t ciphertext_len = 0;
    ASSERT_TRUE(encrypter->Encrypt(nonce_.data(), nonce_.size(), nullptr, 0, plaintext.data(), plaintext.size(),
                                   ciphertext.data(), &ciphertext_len, ciphertext.size()));
    ASSERT_EQ(ciphertext_len, size + encrypter->GetTagSize());

    std::vector<uint8_t> decrypted(decrypter->GetPlaintextSize(ciphertext_len) + 1);
    size_t decrypted_len = 0;
    ASSERT_TRUE(decrypter->Decrypt(nonce_.data(), nonce_.size(), nullptr, 0, ciphertext.data(), ciphertext_len,
                                   decrypted.data(), &decrypted_len, decrypted.size()));
    ASSERT_EQ(decrypted_len, size);
    EXPECT_EQ(::testing::Bytes(plaintext.data(), size), ::testing::Bytes(decrypted.data(), decrypted_len));

    // flip the last bit of the tag
    ciphertext[ciphertext_len - 1] ^= 0x01;
    EXPECT_FALSE(decrypter->Decrypt(nonce_.data(), nonce_.size(), nullptr, 0, ciphertext.data(), ciphertext_len,
                                    decrypted.data(), &decrypted_len, decrypted.size()));
    ciphertext[ciphertext_len - 1] ^= 0x01;

    // a different nonce
    nonce_[23] ^= 0x01;
    EXPECT_FALSE(decrypter->Decrypt(nonce_.data(), nonce_.size(), nullptr, 0, ciphertext.data(), ciphertext_len,
                                    decrypted.data(), &decrypted_len, decrypted.size()));
  }

  std::vector<uint8_t> key_;
  std::vector<uint8_t> nonce_;
};

#define XX(num, name, string) \
  TEST_P(AeadTest, name) {    \
    EncodeAndDecode(CRYPTO_##name, GetParam()); \
  }

CIPHER_METHOD_VALID_MAP(XX)
#undef XX

INSTANTIATE_TEST_SUITE_P(SizedAeadTest,
                         AeadTest,
                         ::testing::Values(0, 1, 16, 256, 4096, 16 * 1024 - 1, 65536),
                         ::testing::PrintToStringParamName());

TEST(AeadFactoryTest, InvalidMethod) {
  EXPECT_EQ(Encrypter::CreateFromCipherSuite(CRYPTO_INVALID), nullptr);
  EXPECT_EQ(Decrypter::CreateFromCipherSuite(CRYPTO_INVALID), nullptr);
}

TEST(AeadFactoryTest, XChaCha20Poly1305Sizes) {
  auto encrypter = Encrypter::CreateFromCipherSuite(CRYPTO_XCHACHA20POLY1305);
  ASSERT_TRUE(encrypter);
  EXPECT_EQ(encrypter->GetKeySize(), 32u);
  EXPECT_EQ(encrypter->GetNonceSize(), 24u);
  EXPECT_EQ(encrypter->GetTagSize(), 16u);
  EXPECT_EQ(encrypter->GetCiphertextSize(100), 116u);
  EXPECT_EQ(encrypter->GetMaxPlaintextSize(116), 100u);
}

TEST(AeadFactoryTest, RejectsWrongKeySize) {
  auto encrypter = Encrypter::CreateFromCipherSuite(CRYPTO_XCHACHA20POLY1305);
  auto decrypter = Decrypter::CreateFromCipherSuite(CRYPTO_XCHACHA20POLY1305);
  ASSERT_TRUE(encrypter);
  ASSERT_TRUE(decrypter);
  uint8_t key[33] = {};
  EXPECT_FALSE(encrypter->SetKey(key, 16));
  EXPECT_FALSE(encrypter->SetKey(key, 33));
  EXPECT_FALSE(decrypter->SetKey(key, 31));
  EXPECT_TRUE(decrypter->SetKey(key, 32));
}

TEST(AeadFactoryTest, EncryptWithoutKeyFails) {
  auto encrypter = Encrypter::CreateFromCipherSuite(CRYPTO_XCHACHA20POLY1305);
  ASSERT_TRUE(encrypter);
  uint8_t nonce[24] = {};
  uint8_t plaintext[4] = {1, 2, 3, 4};
  uint8_t output[64];
  size_t output_len = 0;
  EXPECT_FALSE(encrypter->Encrypt(nonce, sizeof(nonce), nullptr, 0, plaintext, sizeof(plaintext), output, &output_len,
                                  sizeof(output)));
}
