// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_STREAM_ENCRYPTOR
#define H_STREAM_STREAM_ENCRYPTOR

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <optional>

#include <absl/types/span.h>

#include "core/iobuf.hpp"
#include "crypto/crypter_export.hpp"
#include "crypto/encrypter.hpp"
#include "stream/byte_stream.hpp"
#include "stream/nonce_sequencer.hpp"

namespace saea {

// Turns a plaintext byte stream into the header followed by framed records.
//
// One plaintext chunk is always held back so that Finalize() can seal the
// real last chunk with the final flag set.
class StreamEncryptor {
 public:
  enum State {
    STATE_INIT,
    STATE_STREAMING,
    STATE_FINALIZED,
    STATE_FAILED,
  };

  // |sink| must outlive the encryptor.
  StreamEncryptor(ByteSink* sink, enum cipher_method method, uint32_t chunk_size);
  ~StreamEncryptor();

  StreamEncryptor(const StreamEncryptor&) = delete;
  StreamEncryptor& operator=(const StreamEncryptor&) = delete;

  // Draws a random base nonce and writes the stream header to the sink.
  // Returns OK, ERR_INVALID_ARGUMENT, ERR_CRYPTO_FAILED or ERR_IO_FAILED.
  int Init(const uint8_t* key, size_t key_len);

  // Same as Init() with a caller-chosen base nonce.
  int InitWithBaseNonceForTesting(const uint8_t* key, size_t key_len, const Nonce& base_nonce);

  // Feeds up to chunk_size() bytes of plaintext, a larger chunk fails the
  // session with ERR_CHUNK_TOO_LARGE. Seals and writes the chunk
  // held back by the previous call, if any, and stores the size of the
  // emitted record in |*record_size| (0 if nothing was emitted). Empty input
  // is ignored.
  int EncryptChunk(const uint8_t* data, size_t len, size_t* record_size);

  // Seals the held back chunk, or an empty one, as the final chunk and
  // closes the session.
  int Finalize(size_t* record_size);

  // Feeds |plaintext| as one chunk, or finalizes the session if it is empty.
  // |*record_size| is set to the size of the record written by this call and
  // left empty if the chunk was held back.
  int ProcessNext(absl::Span<const uint8_t> plaintext, std::optional<size_t>* record_size);

  bool is_finished() const { return state_ == STATE_FINALIZED; }
  State state() const { return state_; }
  uint32_t chunk_size() const { return chunk_size_; }
  uint64_t chunk_index() const { return chunk_index_; }
  const Nonce& base_nonce() const { return sequencer_->base_nonce(); }

  void SetChunkIndexForTesting(uint64_t chunk_index) { chunk_index_ = chunk_index; }

 private:
  int InitInternal(const uint8_t* key, size_t key_len, const Nonce& base_nonce);
  int SealPending(bool is_final, size_t* record_size);
  int Fail(int error);

  ByteSink* const sink_;
  const enum cipher_method method_;
  const uint32_t chunk_size_;
  State state_ = STATE_INIT;

  std::unique_ptr<crypto::Encrypter> encrypter_;
  std::unique_ptr<NonceSequencer> sequencer_;
  uint64_t chunk_index_ = 0;

  IOBuf pending_;
  bool has_pending_ = false;
  IOBuf record_;
};

// Creates an encryptor over |sink| and writes the stream header. Returns
// nullptr and sets |*rv| on failure.
std::unique_ptr<StreamEncryptor> OpenEncryptor(ByteSink* sink,
                                               const uint8_t* key,
                                               size_t key_len,
                                               uint32_t chunk_size,
                                               int* rv,
                                               enum cipher_method method = CRYPTO_DEFAULT);

}  // namespace saea

#endif  // H_STREAM_STREAM_ENCRYPTOR
