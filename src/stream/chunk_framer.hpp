// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_CHUNK_FRAMER
#define H_STREAM_CHUNK_FRAMER

#include <stddef.h>
#include <stdint.h>

#include "core/iobuf.hpp"
#include "stream/byte_stream.hpp"
#include "stream/nonce_sequencer.hpp"

namespace saea {

// Stream layout, all integers big-endian:
//
//   StreamHeader:  magic[4]="SAEA" | version[1] | algo_id[1] | chunk_size[4] | base_nonce[24]
//   ChunkRecord*:  record_len[4] | ciphertext[record_len]
//
// record_len counts the ciphertext including its 16-byte tag.
constexpr uint8_t kMagic[4] = {'S', 'A', 'E', 'A'};
constexpr uint8_t kVersion = 1;
constexpr size_t kHeaderSize = sizeof(kMagic) + 1 + 1 + sizeof(uint32_t) + kNonceSize;
constexpr size_t kRecordLengthSize = sizeof(uint32_t);
constexpr size_t kTagSize = 16;
constexpr uint32_t kDefaultChunkSize = 64 * 1024;
constexpr uint32_t kMaxChunkSize = 16 * 1024 * 1024;

struct StreamHeader {
  uint8_t version = kVersion;
  uint8_t algorithm_id = 0;
  uint32_t chunk_size = 0;
  Nonce base_nonce = {};
};

// Reads headers and records off a ByteSource. The static helpers produce
// the byte layout on the writing side.
class ChunkFramer {
 public:
  // |source| must outlive the framer.
  explicit ChunkFramer(ByteSource* source);

  ChunkFramer(const ChunkFramer&) = delete;
  ChunkFramer& operator=(const ChunkFramer&) = delete;

  // Appends the kHeaderSize bytes of the stream header to |out|.
  static void WriteHeader(const Nonce& base_nonce, uint32_t chunk_size, uint8_t algorithm_id, IOBuf* out);

  // Prepends the big-endian length of |ciphertext| in place.
  static void WriteRecord(IOBuf* ciphertext);

  // Parses and validates a header held in memory. Returns OK,
  // ERR_TRUNCATED_HEADER, ERR_BAD_MAGIC, ERR_UNSUPPORTED_VERSION,
  // ERR_UNSUPPORTED_ALGORITHM or ERR_INVALID_CHUNK_SIZE.
  static int ParseHeader(const uint8_t* data, size_t len, StreamHeader* header);

  // Reads and validates the stream header. On success the record size limit
  // is taken from the header's chunk size. Same errors as ParseHeader plus
  // ERR_IO_FAILED.
  int ReadHeader(StreamHeader* header);

  // Overrides the chunk size used to bound record lengths.
  void set_chunk_size(uint32_t chunk_size) { chunk_size_ = chunk_size; }
  uint32_t chunk_size() const { return chunk_size_; }

  // Reads one record and replaces the content of |ciphertext| with its
  // ciphertext. Returns OK, ERR_END_OF_INPUT if the source ended cleanly
  // before the record, ERR_TRUNCATED_RECORD, ERR_RECORD_TOO_SHORT,
  // ERR_RECORD_TOO_LARGE or ERR_IO_FAILED.
  int ReadRecord(IOBuf* ciphertext);

  // Sets |*at_end| to whether the source has no byte left after what has
  // been consumed so far. Returns OK or ERR_IO_FAILED.
  int AtEndOfInput(bool* at_end);

 private:
  // Reads until |need| bytes are buffered or the source ends.
  int FillBuffer(size_t need);

  ByteSource* const source_;
  IOBuf buffer_;
  bool eof_ = false;
  uint32_t chunk_size_ = kDefaultChunkSize;
};

}  // namespace saea

#endif  // H_STREAM_CHUNK_FRAMER
