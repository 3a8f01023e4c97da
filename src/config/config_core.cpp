// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "config/config_core.hpp"

#include <absl/flags/flag.h>
#include <absl/strings/str_cat.h>
#include <stdint.h>

#include "stream/chunk_framer.hpp"

bool AbslParseFlag(absl::string_view text, CipherMethodFlag* flag, std::string* err) {
  flag->method = to_cipher_method(std::string_view(text.data(), text.size()));
  if (flag->method == CRYPTO_INVALID) {
    *err = absl::StrCat("bad cipher_method: ", text, ", expected one of ",
                        absl::string_view(kCipherMethodsStr.data(), kCipherMethodsStr.size()));
    return false;
  }
  return true;
}

// Similarly, for unparsing, we can simply invoke `absl::UnparseFlag()` on
// the constituent types.
std::string AbslUnparseFlag(const CipherMethodFlag& flag) {
  return std::string(std::string_view(flag));
}

// Within the implementation, `AbslParseFlag()` will, in turn invoke
// `absl::ParseFlag()` on its constituent `int` and `std::string` types
// (which have built-in Abseil flag support.

static int64_t ngx_atosz(const char* line, size_t n) {
  int64_t value, cutoff, cutlim;

  if (n == 0) {
    return -1;
  }

  cutoff = INT64_MAX / 10;
  cutlim = INT64_MAX % 10;

  for (value = 0; n--; line++) {
    if (*line < '0' || *line > '9') {
      return -1;
    }

    if (value >= cutoff && (value > cutoff || *line - '0' > cutlim)) {
      return -1;
    }

    value = value * 10 + (*line - '0');
  }

  return value;
}

static int64_t ngx_parse_size(const char* line, size_t len) {
  char unit;
  int64_t size, scale, max;

  if (len == 0) {
    return -1;
  }

  unit = line[len - 1];

  switch (unit) {
    case 'K':
    case 'k':
      len--;
      max = INT64_MAX / 1024;
      scale = 1024;
      break;

    case 'M':
    case 'm':
      len--;
      max = INT64_MAX / (1024 * 1024);
      scale = 1024 * 1024;
      break;

    default:
      max = INT64_MAX;
      scale = 1;
  }

  size = ngx_atosz(line, len);
  if (size < 0 || size > max) {
    return -1;
  }

  size *= scale;

  return size;
}

bool AbslParseFlag(absl::string_view text, ChunkSizeFlag* flag, std::string* err) {
  int64_t size = ngx_parse_size(text.data(), text.size());
  if (size <= 0 || size > saea::kMaxChunkSize) {
    *err = absl::StrCat("bad chunk size: ", text, ", expected 1 to ", saea::kMaxChunkSize / (1024 * 1024), "m");
    return false;
  }
  flag->size = static_cast<uint32_t>(size);
  return true;
}

std::string AbslUnparseFlag(const ChunkSizeFlag& flag) {
  return flag;
}

static const std::string kCipherMethodHelpMessage =
    absl::StrCat("Specify the algorithm of new streams, one of ",
                 absl::string_view(kCipherMethodsStr.data(), kCipherMethodsStr.size()));
ABSL_FLAG(CipherMethodFlag, method, CipherMethodFlag(CRYPTO_DEFAULT), kCipherMethodHelpMessage);
ABSL_FLAG(ChunkSizeFlag,
          chunk_size,
          ChunkSizeFlag(saea::kDefaultChunkSize),
          "Plaintext bytes per chunk of new streams. Unit can be (none), k, m.");
ABSL_FLAG(std::string, key_file, "", "Read the 256-bit key as 64 hex characters from this file");
ABSL_FLAG(uint32_t, parallel_max, 4, "Maximum number of files processed in parallel");
ABSL_FLAG(std::string, output, "", "Output path when a single file is given, - for stdout");
ABSL_FLAG(std::string, output_dir, "", "Directory for output files, defaults to beside the inputs");
