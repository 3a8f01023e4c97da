// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/chunk_framer.hpp"

#include <limits.h>
#include <string.h>

#include <algorithm>

#include "core/dump_hex.hpp"
#include "core/logging.hpp"
#include "core/sys_byteorder.hpp"
#include "crypto/crypter_export.hpp"
#include "stream/stream_errors.hpp"

namespace saea {

namespace {

constexpr size_t kMagicOffset = 0;
constexpr size_t kVersionOffset = kMagicOffset + sizeof(kMagic);
constexpr size_t kAlgorithmOffset = kVersionOffset + 1;
constexpr size_t kChunkSizeOffset = kAlgorithmOffset + 1;
constexpr size_t kBaseNonceOffset = kChunkSizeOffset + sizeof(uint32_t);

static_assert(kBaseNonceOffset + kNonceSize == kHeaderSize, "header layout mismatch");
static_assert(kHeaderSize == 34, "header size mismatch");
static_assert(kMaxChunkSize + kTagSize <= INT_MAX, "record length overflows int");

// Upper bound of a single read from the source.
constexpr size_t kReadSize = 16 * 1024;

}  // namespace

ChunkFramer::ChunkFramer(ByteSource* source) : source_(source) {}

void ChunkFramer::WriteHeader(const Nonce& base_nonce, uint32_t chunk_size, uint8_t algorithm_id, IOBuf* out) {
  out->reserve(0, kHeaderSize);
  uint8_t* p = out->mutable_tail();
  memcpy(p + kMagicOffset, kMagic, sizeof(kMagic));
  p[kVersionOffset] = kVersion;
  p[kAlgorithmOffset] = algorithm_id;
  StoreBigEndian32(p + kChunkSizeOffset, chunk_size);
  memcpy(p + kBaseNonceOffset, base_nonce.data(), kNonceSize);
  out->append(kHeaderSize);
}

void ChunkFramer::WriteRecord(IOBuf* ciphertext) {
  DCHECK_GE(ciphertext->length(), kTagSize);
  uint32_t record_len = static_cast<uint32_t>(ciphertext->length());
  ciphertext->reserve(kRecordLengthSize, 0);
  ciphertext->prepend(kRecordLengthSize);
  StoreBigEndian32(ciphertext->mutable_data(), record_len);
}

int ChunkFramer::ParseHeader(const uint8_t* data, size_t len, StreamHeader* header) {
  if (len < kHeaderSize) {
    VLOG(1) << "Stream header truncated: " << len << " bytes";
    return ERR_TRUNCATED_HEADER;
  }
  DumpHex("HEADER", data, kHeaderSize);
  if (memcmp(data + kMagicOffset, kMagic, sizeof(kMagic)) != 0) {
    VLOG(1) << "Stream header has bad magic";
    return ERR_BAD_MAGIC;
  }
  uint8_t version = data[kVersionOffset];
  if (version != kVersion) {
    VLOG(1) << "Stream header has unsupported version: " << static_cast<int>(version);
    return ERR_UNSUPPORTED_VERSION;
  }
  uint8_t algorithm_id = data[kAlgorithmOffset];
  if (!is_valid_cipher_method(algorithm_id)) {
    VLOG(1) << "Stream header has unsupported algorithm: " << static_cast<int>(algorithm_id);
    return ERR_UNSUPPORTED_ALGORITHM;
  }
  uint32_t chunk_size = LoadBigEndian32(data + kChunkSizeOffset);
  if (chunk_size == 0 || chunk_size > kMaxChunkSize) {
    VLOG(1) << "Stream header has invalid chunk size: " << chunk_size;
    return ERR_INVALID_CHUNK_SIZE;
  }
  header->version = version;
  header->algorithm_id = algorithm_id;
  header->chunk_size = chunk_size;
  memcpy(header->base_nonce.data(), data + kBaseNonceOffset, kNonceSize);
  return OK;
}

int ChunkFramer::ReadHeader(StreamHeader* header) {
  int ret = FillBuffer(kHeaderSize);
  if (ret != OK) {
    return ret;
  }
  ret = ParseHeader(buffer_.data(), buffer_.length(), header);
  if (ret != OK) {
    return ret;
  }
  buffer_.trimStart(kHeaderSize);
  chunk_size_ = header->chunk_size;
  return OK;
}

int ChunkFramer::ReadRecord(IOBuf* ciphertext) {
  int ret = FillBuffer(kRecordLengthSize);
  if (ret != OK) {
    return ret;
  }
  if (buffer_.empty()) {
    DCHECK(eof_);
    return ERR_END_OF_INPUT;
  }
  if (buffer_.length() < kRecordLengthSize) {
    VLOG(1) << "Record length prefix truncated";
    return ERR_TRUNCATED_RECORD;
  }
  size_t record_len = LoadBigEndian32(buffer_.data());
  if (record_len < kTagSize) {
    VLOG(1) << "Record length below tag size: " << record_len;
    return ERR_RECORD_TOO_SHORT;
  }
  if (record_len > static_cast<size_t>(chunk_size_) + kTagSize) {
    VLOG(1) << "Record length out of range: " << record_len << " (chunk size " << chunk_size_ << ")";
    return ERR_RECORD_TOO_LARGE;
  }
  ret = FillBuffer(kRecordLengthSize + record_len);
  if (ret != OK) {
    return ret;
  }
  if (buffer_.length() < kRecordLengthSize + record_len) {
    VLOG(1) << "Record truncated: " << buffer_.length() - kRecordLengthSize << " of " << record_len << " bytes";
    return ERR_TRUNCATED_RECORD;
  }
  buffer_.trimStart(kRecordLengthSize);
  ciphertext->clear();
  ciphertext->append(buffer_.data(), record_len);
  buffer_.trimStart(record_len);
  return OK;
}

int ChunkFramer::AtEndOfInput(bool* at_end) {
  int ret = FillBuffer(1);
  if (ret != OK) {
    return ret;
  }
  *at_end = buffer_.empty();
  return OK;
}

int ChunkFramer::FillBuffer(size_t need) {
  if (buffer_.empty()) {
    buffer_.clear();
  }
  while (buffer_.length() < need && !eof_) {
    size_t want = std::max(need - buffer_.length(), std::min(kReadSize, static_cast<size_t>(chunk_size_)));
    buffer_.reserve(0, want);
    int ret = source_->Read(buffer_.mutable_tail(), static_cast<int>(std::min(want, buffer_.tailroom())));
    if (ret < 0) {
      return ERR_IO_FAILED;
    }
    if (ret == 0) {
      eof_ = true;
      break;
    }
    buffer_.append(ret);
  }
  return OK;
}

}  // namespace saea
