// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_CLI_KEY_LOADER
#define H_CLI_KEY_LOADER

#include <string>
#include <string_view>

namespace cli {

// Environment variable consulted when no key file is given.
extern const char kKeyEnvironmentVariable[];

// Number of hex characters of a 256-bit key.
constexpr size_t kKeyHexLength = 64;

// Decodes a key written as 64 hex characters, surrounding whitespace is
// ignored. Returns false and fills |err| on malformed input.
bool ParseHexKey(std::string_view text, std::string* key, std::string* err);

// Loads the key from |key_file|, or from $SAEA_KEY when |key_file| is empty.
bool LoadKey(const std::string& key_file, std::string* key, std::string* err);

}  // namespace cli

#endif  // H_CLI_KEY_LOADER
