// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2023-2024 Chilledheart  */

#include <gtest/gtest-message.h>
#include <gtest/gtest.h>

#include <absl/flags/flag.h>
#include <absl/strings/str_cat.h>
#include <gmock/gmock.h>
#include <cstdlib>
#include "config/config.hpp"
#include "config/config_impl.hpp"
#include "core/rand_util.hpp"
#include "core/utils.hpp"
#include "core/utils_fs.hpp"

using namespace saea;

ABSL_FLAG(bool, test_bool, true, "Test bool value");
ABSL_FLAG(int32_t, test_signed_val, 0, "Test int32_t value");
ABSL_FLAG(uint32_t, test_unsigned_val, 0, "Test uint32_t value");
ABSL_FLAG(int64_t, test_signed_64val, 0, "Test int64_t value");
ABSL_FLAG(uint64_t, test_unsigned_64val, 0, "Test uint64_t value");
ABSL_FLAG(std::string, test_string, "", "Test string value");

class ConfigTest : public ::testing::Test {
 public:
  void SetUp() override {
    key_prefix_ = absl::StrCat("pid_", GetPID(), "_run_", RandUint64());
    original_configfile_ = config::g_configfile;
    const char* tmpdir = getenv("TMPDIR");
    if (!tmpdir || *tmpdir == '\0')
      tmpdir = "/tmp";
    config::g_configfile = absl::StrCat(tmpdir, "/", "saea_unittest_", key_prefix(), ".tmp");
  }
  void TearDown() override {
    RemoveFile(config::g_configfile);
    config::g_configfile = original_configfile_;
  }

  const std::string& key_prefix() const { return key_prefix_; }

 private:
  std::string key_prefix_;
  std::string original_configfile_;
};

TEST_F(ConfigTest, RWBool) {
  auto config_impl = config::ConfigImpl::Create();
  constexpr bool test_bool = true;
  const std::string test_key = absl::StrCat("test_bool_", key_prefix());

  absl::SetFlag(&FLAGS_test_bool, test_bool);

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_test_bool));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_test_bool, false);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<bool>(test_key));
  EXPECT_FALSE(config_impl->HasKey<std::string>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_test_bool));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_test_bool), test_bool);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Delete(test_key));
  ASSERT_TRUE(config_impl->Close());

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_FALSE(config_impl->HasKey<bool>(test_key));
  ASSERT_TRUE(config_impl->Close());
}

TEST_F(ConfigTest, RWInt32) {
  auto config_impl = config::ConfigImpl::Create();
  constexpr int32_t test_signed_val = -12345;
  const std::string test_key = absl::StrCat("test_signed_val_", key_prefix());

  absl::SetFlag(&FLAGS_test_signed_val, test_signed_val);

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_test_signed_val));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_test_signed_val, 0);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<int32_t>(test_key));
  EXPECT_TRUE(config_impl->HasKey<int64_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<std::string>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_test_signed_val));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_test_signed_val), test_signed_val);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Delete(test_key));
  ASSERT_TRUE(config_impl->Close());

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_FALSE(config_impl->HasKey<int32_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<int64_t>(test_key));
  ASSERT_TRUE(config_impl->Close());
}

TEST_F(ConfigTest, RWUint32) {
  auto config_impl = config::ConfigImpl::Create();
  constexpr uint32_t test_unsigned_val = 12345U;
  const std::string test_key = absl::StrCat("test_unsigned_val_", key_prefix());

  absl::SetFlag(&FLAGS_test_unsigned_val, test_unsigned_val);

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_test_unsigned_val));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_test_unsigned_val, 0);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<uint32_t>(test_key));
  EXPECT_TRUE(config_impl->HasKey<uint64_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<std::string>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_test_unsigned_val));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_test_unsigned_val), test_unsigned_val);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Delete(test_key));
  ASSERT_TRUE(config_impl->Close());

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_FALSE(config_impl->HasKey<uint32_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<uint64_t>(test_key));
  ASSERT_TRUE(config_impl->Close());
}

TEST_F(ConfigTest, RWInt64) {
  auto config_impl = config::ConfigImpl::Create();
  constexpr int64_t test_signed_64val = -123456LL - INT32_MAX;
  const std::string test_key = absl::StrCat("test_signed_64val_", key_prefix());

  absl::SetFlag(&FLAGS_test_signed_64val, test_signed_64val);

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_test_signed_64val));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_test_signed_64val, 0);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<int64_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<std::string>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_test_signed_64val));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_test_signed_64val), test_signed_64val);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Delete(test_key));
  ASSERT_TRUE(config_impl->Close());

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_FALSE(config_impl->HasKey<int64_t>(test_key));
  ASSERT_TRUE(config_impl->Close());
}

TEST_F(ConfigTest, RWUint64) {
  auto config_impl = config::ConfigImpl::Create();
  constexpr uint64_t test_unsigned_64val = 123456ULL + UINT32_MAX;
  const std::string test_key = absl::StrCat("test_unsigned_64val_", key_prefix());

  absl::SetFlag(&FLAGS_test_unsigned_64val, test_unsigned_64val);

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_test_unsigned_64val));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_test_unsigned_64val, 0);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<uint64_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<std::string>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_test_unsigned_64val));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_test_unsigned_64val), test_unsigned_64val);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Delete(test_key));
  ASSERT_TRUE(config_impl->Close());

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_FALSE(config_impl->HasKey<uint64_t>(test_key));
  ASSERT_TRUE(config_impl->Close());
}

TEST_F(ConfigTest, RWString) {
  auto config_impl = config::ConfigImpl::Create();
  constexpr std::string_view test_string = "test-str";
  const std::string test_key = absl::StrCat("test_string_", key_prefix());

  absl::SetFlag(&FLAGS_test_string, test_string);

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_test_string));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_test_string, "");

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<std::string>(test_key));
  EXPECT_FALSE(config_impl->HasKey<bool>(test_key));
  EXPECT_FALSE(config_impl->HasKey<uint32_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<uint64_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<int32_t>(test_key));
  EXPECT_FALSE(config_impl->HasKey<int64_t>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_test_string));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_test_string), test_string);

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Delete(test_key));
  ASSERT_TRUE(config_impl->Close());

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_FALSE(config_impl->HasKey<std::string>(test_key));
  ASSERT_TRUE(config_impl->Close());
}

TEST_F(ConfigTest, RWChunkSize) {
  auto config_impl = config::ConfigImpl::Create();
  const std::string test_key = absl::StrCat("test_chunk_size_", key_prefix());
  const ChunkSizeFlag original = absl::GetFlag(FLAGS_chunk_size);

  absl::SetFlag(&FLAGS_chunk_size, ChunkSizeFlag(1U << 20));

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_chunk_size));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_chunk_size, ChunkSizeFlag(1024));

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<uint32_t>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_chunk_size));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(static_cast<uint32_t>(absl::GetFlag(FLAGS_chunk_size)), 1U << 20);

  absl::SetFlag(&FLAGS_chunk_size, original);
}

TEST_F(ConfigTest, ReadChunkSizeWithUnit) {
  const ChunkSizeFlag original = absl::GetFlag(FLAGS_chunk_size);
  const std::string content = "{\"chunk_size\": \"16k\"}";
  ASSERT_EQ(static_cast<ssize_t>(content.size()), WriteFileWithBuffer(config::g_configfile, content));

  auto config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<std::string>("chunk_size"));
  EXPECT_TRUE(config_impl->Read("chunk_size", &FLAGS_chunk_size));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(static_cast<uint32_t>(absl::GetFlag(FLAGS_chunk_size)), 16U * 1024);

  absl::SetFlag(&FLAGS_chunk_size, original);
}

TEST_F(ConfigTest, RWCipherMethod) {
  auto config_impl = config::ConfigImpl::Create();
  const std::string test_key = absl::StrCat("test_method_", key_prefix());
  const CipherMethodFlag original = absl::GetFlag(FLAGS_method);

  absl::SetFlag(&FLAGS_method, CipherMethodFlag(CRYPTO_XCHACHA20POLY1305));

  ASSERT_TRUE(config_impl->Open(true));
  EXPECT_TRUE(config_impl->Write(test_key, FLAGS_method));
  ASSERT_TRUE(config_impl->Close());

  absl::SetFlag(&FLAGS_method, CipherMethodFlag(CRYPTO_INVALID));

  config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_TRUE(config_impl->HasKey<std::string>(test_key));
  EXPECT_TRUE(config_impl->Read(test_key, &FLAGS_method));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_method).method, CRYPTO_XCHACHA20POLY1305);

  absl::SetFlag(&FLAGS_method, original);
}

TEST_F(ConfigTest, ReadUnknownCipherMethod) {
  const CipherMethodFlag original = absl::GetFlag(FLAGS_method);
  const std::string content = "{\"method\": \"rot13\"}";
  ASSERT_EQ(static_cast<ssize_t>(content.size()), WriteFileWithBuffer(config::g_configfile, content));

  auto config_impl = config::ConfigImpl::Create();
  ASSERT_TRUE(config_impl->Open(false));
  EXPECT_FALSE(config_impl->Read("method", &FLAGS_method));
  ASSERT_TRUE(config_impl->Close());

  EXPECT_EQ(absl::GetFlag(FLAGS_method).method, original.method);
}

TEST_F(ConfigTest, ReadConfigMissingEnforcedFile) {
  EXPECT_FALSE(IsFile(config::g_configfile));
  EXPECT_FALSE(config::ReadConfig());
}

TEST_F(ConfigTest, ReadConfigOptionalFields) {
  const uint32_t original_parallel_max = absl::GetFlag(FLAGS_parallel_max);
  const ChunkSizeFlag original_chunk_size = absl::GetFlag(FLAGS_chunk_size);
  const std::string content = "{\"parallel_max\": 7}";
  ASSERT_EQ(static_cast<ssize_t>(content.size()), WriteFileWithBuffer(config::g_configfile, content));

  EXPECT_TRUE(config::ReadConfig());
  EXPECT_EQ(absl::GetFlag(FLAGS_parallel_max), 7U);
  EXPECT_EQ(static_cast<uint32_t>(absl::GetFlag(FLAGS_chunk_size)), static_cast<uint32_t>(original_chunk_size));

  absl::SetFlag(&FLAGS_parallel_max, original_parallel_max);
}

TEST_F(ConfigTest, SaveAndReadConfig) {
  const uint32_t original_parallel_max = absl::GetFlag(FLAGS_parallel_max);
  const ChunkSizeFlag original_chunk_size = absl::GetFlag(FLAGS_chunk_size);

  absl::SetFlag(&FLAGS_parallel_max, 3U);
  absl::SetFlag(&FLAGS_chunk_size, ChunkSizeFlag(4096));
  ASSERT_TRUE(config::SaveConfig());

  absl::SetFlag(&FLAGS_parallel_max, 1U);
  absl::SetFlag(&FLAGS_chunk_size, ChunkSizeFlag(1));
  ASSERT_TRUE(config::ReadConfig());

  EXPECT_EQ(absl::GetFlag(FLAGS_parallel_max), 3U);
  EXPECT_EQ(static_cast<uint32_t>(absl::GetFlag(FLAGS_chunk_size)), 4096U);

  absl::SetFlag(&FLAGS_parallel_max, original_parallel_max);
  absl::SetFlag(&FLAGS_chunk_size, original_chunk_size);
}

TEST_F(ConfigTest, ValidateConfig) {
  const uint32_t original_parallel_max = absl::GetFlag(FLAGS_parallel_max);
  const ChunkSizeFlag original_chunk_size = absl::GetFlag(FLAGS_chunk_size);
  const CipherMethodFlag original_method = absl::GetFlag(FLAGS_method);
  const std::string original_output = absl::GetFlag(FLAGS_output);
  const std::string original_output_dir = absl::GetFlag(FLAGS_output_dir);

  absl::SetFlag(&FLAGS_parallel_max, 4U);
  absl::SetFlag(&FLAGS_chunk_size, ChunkSizeFlag(65536));
  absl::SetFlag(&FLAGS_method, CipherMethodFlag(CRYPTO_XCHACHA20POLY1305));
  absl::SetFlag(&FLAGS_output, "");
  absl::SetFlag(&FLAGS_output_dir, "");
  EXPECT_EQ(config::ValidateConfig(), "");

  absl::SetFlag(&FLAGS_chunk_size, ChunkSizeFlag(0));
  EXPECT_THAT(config::ValidateConfig(), ::testing::HasSubstr("Invalid Chunk Size"));
  absl::SetFlag(&FLAGS_chunk_size, ChunkSizeFlag(65536));

  absl::SetFlag(&FLAGS_parallel_max, 0U);
  EXPECT_THAT(config::ValidateConfig(), ::testing::HasSubstr("Invalid Parallel Max"));
  absl::SetFlag(&FLAGS_parallel_max, 4U);

  absl::SetFlag(&FLAGS_method, CipherMethodFlag(CRYPTO_INVALID));
  EXPECT_THAT(config::ValidateConfig(), ::testing::HasSubstr("Invalid Cipher"));
  absl::SetFlag(&FLAGS_method, CipherMethodFlag(CRYPTO_XCHACHA20POLY1305));

  std::string dir(Dirname(config::g_configfile));
  absl::SetFlag(&FLAGS_output_dir, dir);
  EXPECT_EQ(config::ValidateConfig(), "");

  absl::SetFlag(&FLAGS_output, "out.saea");
  EXPECT_THAT(config::ValidateConfig(), ::testing::HasSubstr("Conflicting Output Dir"));
  absl::SetFlag(&FLAGS_output, "");

  absl::SetFlag(&FLAGS_output_dir, config::g_configfile + ".missing");
  EXPECT_THAT(config::ValidateConfig(), ::testing::HasSubstr("Invalid Output Dir"));

  absl::SetFlag(&FLAGS_parallel_max, original_parallel_max);
  absl::SetFlag(&FLAGS_chunk_size, original_chunk_size);
  absl::SetFlag(&FLAGS_method, original_method);
  absl::SetFlag(&FLAGS_output, original_output);
  absl::SetFlag(&FLAGS_output_dir, original_output_dir);
}

TEST_F(ConfigTest, ConfigFileOption) {
  const uint32_t original_parallel_max = absl::GetFlag(FLAGS_parallel_max);
  const std::string configfile = config::g_configfile;

  absl::SetFlag(&FLAGS_parallel_max, 7U);
  ASSERT_TRUE(config::SaveConfig());
  absl::SetFlag(&FLAGS_parallel_max, 1U);

  config::g_configfile.clear();
  const char* argv[] = {"saea", "-c", configfile.c_str(), "input"};
  std::vector<std::string> positional = config::ReadConfigFileAndArguments(4, argv);
  EXPECT_EQ(config::g_configfile, configfile);
  EXPECT_EQ(absl::GetFlag(FLAGS_parallel_max), 7U);
  EXPECT_THAT(positional, ::testing::ElementsAre("input"));

  config::g_configfile.clear();
  absl::SetFlag(&FLAGS_parallel_max, 1U);
  const std::string option = absl::StrCat("--configfile=", configfile);
  const char* argv2[] = {"saea", option.c_str(), "a", "b"};
  positional = config::ReadConfigFileAndArguments(4, argv2);
  EXPECT_EQ(config::g_configfile, configfile);
  EXPECT_EQ(absl::GetFlag(FLAGS_parallel_max), 7U);
  EXPECT_THAT(positional, ::testing::ElementsAre("a", "b"));

  absl::SetFlag(&FLAGS_parallel_max, original_parallel_max);
}

TEST_F(ConfigTest, ConfigFileOptionHasNoOtherAliases) {
  const std::string configfile = config::g_configfile;
  ASSERT_TRUE(config::SaveConfig());
  for (const char* alias : {"-K", "--config"}) {
    const char* argv[] = {"saea", alias, configfile.c_str()};
    EXPECT_EXIT(config::ReadConfigFileAndArguments(3, argv), ::testing::ExitedWithCode(1), "") << alias;
  }
}

TEST(ConfigFlagTest, ParseChunkSize) {
  ChunkSizeFlag flag;
  std::string err;
  EXPECT_TRUE(AbslParseFlag("65536", &flag, &err));
  EXPECT_EQ(flag.size, 65536U);
  EXPECT_TRUE(AbslParseFlag("64k", &flag, &err));
  EXPECT_EQ(flag.size, 65536U);
  EXPECT_TRUE(AbslParseFlag("1M", &flag, &err));
  EXPECT_EQ(flag.size, 1U << 20);
  EXPECT_EQ(AbslUnparseFlag(flag), "1m");

  EXPECT_FALSE(AbslParseFlag("", &flag, &err));
  EXPECT_FALSE(AbslParseFlag("0", &flag, &err));
  EXPECT_FALSE(AbslParseFlag("-1", &flag, &err));
  EXPECT_FALSE(AbslParseFlag("12x", &flag, &err));
  EXPECT_FALSE(AbslParseFlag("17m", &flag, &err));
  EXPECT_FALSE(err.empty());
}

TEST(ConfigFlagTest, ParseCipherMethod) {
  CipherMethodFlag flag;
  std::string err;
  EXPECT_TRUE(AbslParseFlag("xchacha20-poly1305", &flag, &err));
  EXPECT_EQ(flag.method, CRYPTO_XCHACHA20POLY1305);
  EXPECT_EQ(AbslUnparseFlag(flag), "xchacha20-poly1305");

  EXPECT_FALSE(AbslParseFlag("invalid", &flag, &err));
  EXPECT_FALSE(AbslParseFlag("aes-256-gcm", &flag, &err));
  EXPECT_FALSE(err.empty());
}
