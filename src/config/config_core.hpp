// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_CONFIG_CONFIG_CORE
#define H_CONFIG_CONFIG_CORE

#include <absl/flags/declare.h>
#include <absl/strings/string_view.h>
#include <stdint.h>
#include <string>

#include "config/config_export.hpp"

bool AbslParseFlag(absl::string_view text, CipherMethodFlag* flag, std::string* err);
std::string AbslUnparseFlag(const CipherMethodFlag& flag);

bool AbslParseFlag(absl::string_view text, ChunkSizeFlag* flag, std::string* err);
std::string AbslUnparseFlag(const ChunkSizeFlag& flag);

ABSL_DECLARE_FLAG(CipherMethodFlag, method);
ABSL_DECLARE_FLAG(ChunkSizeFlag, chunk_size);
ABSL_DECLARE_FLAG(std::string, key_file);
ABSL_DECLARE_FLAG(uint32_t, parallel_max);
ABSL_DECLARE_FLAG(std::string, output);
ABSL_DECLARE_FLAG(std::string, output_dir);

#endif  // H_CONFIG_CONFIG_CORE
