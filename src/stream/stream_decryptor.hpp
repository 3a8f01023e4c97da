// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_STREAM_DECRYPTOR
#define H_STREAM_STREAM_DECRYPTOR

#include <stddef.h>
#include <stdint.h>

#include <memory>

#include "core/iobuf.hpp"
#include "crypto/decrypter.hpp"
#include "stream/byte_stream.hpp"
#include "stream/chunk_framer.hpp"
#include "stream/nonce_sequencer.hpp"

namespace saea {

// Reads a stream written by StreamEncryptor and releases the plaintext one
// authenticated chunk at a time.
//
// End of input is only accepted after a record authenticated with the final
// flag set. The first error is sticky: once failed, every later call returns
// it again and no more plaintext is released.
class StreamDecryptor {
 public:
  enum State {
    STATE_INIT,
    STATE_STREAMING,
    STATE_COMPLETE,
    STATE_FAILED,
  };

  // |source| must outlive the decryptor.
  explicit StreamDecryptor(ByteSource* source);
  ~StreamDecryptor();

  StreamDecryptor(const StreamDecryptor&) = delete;
  StreamDecryptor& operator=(const StreamDecryptor&) = delete;

  // Reads and validates the stream header. Any header problem is reported
  // as ERR_HEADER_INVALID. Also returns ERR_INVALID_ARGUMENT,
  // ERR_CRYPTO_FAILED or ERR_IO_FAILED.
  int Init(const uint8_t* key, size_t key_len);

  // Replaces |*plaintext| with the next chunk of plaintext, or with nullptr
  // once the stream is complete.
  int ProcessNext(std::unique_ptr<IOBuf>* plaintext);

  bool is_finished() const { return state_ == STATE_COMPLETE; }
  State state() const { return state_; }
  const StreamHeader& header() const { return header_; }
  uint64_t chunk_index() const { return chunk_index_; }

 private:
  int ReadChunk(std::unique_ptr<IOBuf>* plaintext);
  bool Open(uint64_t index, bool is_final, IOBuf* plaintext);
  int Fail(int error);

  ChunkFramer framer_;
  State state_ = STATE_INIT;
  int error_ = 0;

  StreamHeader header_;
  std::unique_ptr<crypto::Decrypter> decrypter_;
  std::unique_ptr<NonceSequencer> sequencer_;
  uint64_t chunk_index_ = 0;

  IOBuf record_;
};

// Creates a decryptor over |source| and reads the stream header; the chunk
// size comes from the header. Returns nullptr and sets |*rv| on failure.
std::unique_ptr<StreamDecryptor> OpenDecryptor(ByteSource* source, const uint8_t* key, size_t key_len, int* rv);

}  // namespace saea

#endif  // H_STREAM_STREAM_DECRYPTOR
