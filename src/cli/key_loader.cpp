// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "cli/key_loader.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <openssl/mem.h>
#include <stdlib.h>

#include "core/logging.hpp"
#include "core/utils.hpp"

namespace cli {

const char kKeyEnvironmentVariable[] = "SAEA_KEY";

// a key file holds 64 hex characters and maybe a trailing newline
static constexpr size_t kMaxKeyFileSize = 4096;

bool ParseHexKey(std::string_view text, std::string* key, std::string* err) {
  absl::string_view hex = absl::StripAsciiWhitespace(absl::string_view(text.data(), text.size()));
  if (hex.size() != kKeyHexLength) {
    *err = absl::StrCat("key must be ", kKeyHexLength, " hex characters, got ", hex.size());
    return false;
  }
  for (char c : hex) {
    if (!absl::ascii_isxdigit(static_cast<unsigned char>(c))) {
      *err = "key contains a non-hex character";
      return false;
    }
  }
  *key = absl::HexStringToBytes(hex);
  return true;
}

bool LoadKey(const std::string& key_file, std::string* key, std::string* err) {
  if (key_file.empty()) {
    const char* env = getenv(kKeyEnvironmentVariable);
    if (!env || *env == '\0') {
      *err = absl::StrCat("no key given, use --key_file or set ", kKeyEnvironmentVariable);
      return false;
    }
    VLOG(1) << "loading key from environment " << kKeyEnvironmentVariable;
    return ParseHexKey(env, key, err);
  }

  std::string path = saea::ExpandUser(key_file);
  char buffer[kMaxKeyFileSize];
  ssize_t ret = saea::ReadFileToBuffer(path, absl::MakeSpan(reinterpret_cast<uint8_t*>(buffer), sizeof(buffer)));
  if (ret < 0) {
    *err = absl::StrCat("failed to read key file: ", key_file);
    return false;
  }
  if (ret == static_cast<ssize_t>(sizeof(buffer))) {
    *err = absl::StrCat("key file is too large: ", key_file);
    return false;
  }
  VLOG(1) << "loading key from file " << key_file;
  bool parsed = ParseHexKey(std::string_view(buffer, ret), key, err);
  OPENSSL_cleanse(buffer, sizeof(buffer));
  return parsed;
}

}  // namespace cli
