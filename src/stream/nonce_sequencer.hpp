// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_NONCE_SEQUENCER
#define H_STREAM_NONCE_SEQUENCER

#include <stddef.h>
#include <stdint.h>

#include <array>

namespace saea {

constexpr size_t kNonceSize = 24;
// Bytes of the base nonce carried into every derived nonce.
constexpr size_t kNoncePrefixSize = 15;
constexpr size_t kNonceIndexOffset = kNoncePrefixSize;
constexpr size_t kNonceFinalFlagOffset = kNonceIndexOffset + sizeof(uint64_t);

using Nonce = std::array<uint8_t, kNonceSize>;

// Derives the per-chunk nonces of one stream.
//
// Nonce layout:
//   [0, 15)   base nonce bytes [0, 15)
//   [15, 23)  chunk index, big-endian
//   23        final flag, 1 for the last chunk of the stream, 0 otherwise
//
// Distinct (index, is_final) pairs always map to distinct nonces. Bytes
// [15, 24) of the base nonce are carried in the stream header but take no
// part in the derivation.
class NonceSequencer {
 public:
  explicit NonceSequencer(const Nonce& base_nonce);

  Nonce Derive(uint64_t index, bool is_final) const;

  const Nonce& base_nonce() const { return base_nonce_; }

 private:
  const Nonce base_nonce_;
};

}  // namespace saea

#endif  // H_STREAM_NONCE_SEQUENCER
