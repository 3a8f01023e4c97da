// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_FILE_SESSION
#define H_STREAM_FILE_SESSION

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "crypto/crypter_export.hpp"

namespace saea {

// Path standing for stdin or stdout.
extern const char kStdioPath[];

// Encrypts |input_path| into |output_path| in one session. The output is
// written with mode 0600 to a temporary file beside |output_path| and renamed
// into place only when the session succeeds. Returns ERR_INVALID_ARGUMENT if
// both paths name the same file, otherwise OK or a stream error.
int EncryptFile(const std::string& input_path,
                const std::string& output_path,
                const uint8_t* key,
                size_t key_len,
                uint32_t chunk_size,
                enum cipher_method method = CRYPTO_DEFAULT);

// Decrypts |input_path| into |output_path|. Plaintext of chunks that
// authenticated is written to the temporary file as it is released, which is
// discarded if the stream later turns out to be invalid.
int DecryptFile(const std::string& input_path, const std::string& output_path, const uint8_t* key, size_t key_len);

}  // namespace saea

#endif  // H_STREAM_FILE_SESSION
