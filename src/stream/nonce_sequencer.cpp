// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/nonce_sequencer.hpp"

#include <string.h>

#include "core/sys_byteorder.hpp"

namespace saea {

static_assert(kNonceFinalFlagOffset + 1 == kNonceSize, "nonce layout mismatch");

NonceSequencer::NonceSequencer(const Nonce& base_nonce) : base_nonce_(base_nonce) {}

Nonce NonceSequencer::Derive(uint64_t index, bool is_final) const {
  Nonce nonce;
  memcpy(nonce.data(), base_nonce_.data(), kNoncePrefixSize);
  StoreBigEndian64(nonce.data() + kNonceIndexOffset, index);
  nonce[kNonceFinalFlagOffset] = is_final ? 1 : 0;
  return nonce;
}

}  // namespace saea
