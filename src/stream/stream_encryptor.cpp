// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/stream_encryptor.hpp"

#include <limits>

#include "core/logging.hpp"
#include "core/rand_util.hpp"
#include "stream/chunk_framer.hpp"
#include "stream/stream_errors.hpp"

namespace saea {

StreamEncryptor::StreamEncryptor(ByteSink* sink, enum cipher_method method, uint32_t chunk_size)
    : sink_(sink), method_(method), chunk_size_(chunk_size) {}

StreamEncryptor::~StreamEncryptor() {
  if (state_ == STATE_STREAMING) {
    VLOG(1) << "Encryptor destroyed before finalize after " << chunk_index_ << " chunks";
  }
}

int StreamEncryptor::Init(const uint8_t* key, size_t key_len) {
  Nonce base_nonce;
  RandBytes(base_nonce.data(), base_nonce.size());
  return InitInternal(key, key_len, base_nonce);
}

int StreamEncryptor::InitWithBaseNonceForTesting(const uint8_t* key, size_t key_len, const Nonce& base_nonce) {
  return InitInternal(key, key_len, base_nonce);
}

int StreamEncryptor::InitInternal(const uint8_t* key, size_t key_len, const Nonce& base_nonce) {
  if (state_ != STATE_INIT) {
    return ERR_SESSION_CLOSED;
  }
  if (chunk_size_ == 0 || chunk_size_ > kMaxChunkSize) {
    LOG(WARNING) << "Invalid chunk size: " << chunk_size_;
    return ERR_INVALID_ARGUMENT;
  }
  encrypter_ = crypto::Encrypter::CreateFromCipherSuite(method_);
  if (!encrypter_) {
    return ERR_INVALID_ARGUMENT;
  }
  DCHECK_EQ(encrypter_->GetNonceSize(), kNonceSize);
  DCHECK_EQ(encrypter_->GetTagSize(), kTagSize);
  if (key == nullptr || key_len != encrypter_->GetKeySize()) {
    LOG(WARNING) << "Invalid key length: " << key_len;
    return ERR_INVALID_ARGUMENT;
  }
  if (!encrypter_->SetKey(key, key_len)) {
    return Fail(ERR_CRYPTO_FAILED);
  }
  sequencer_ = std::make_unique<NonceSequencer>(base_nonce);
  chunk_index_ = 0;
  pending_ = IOBuf(IOBuf::CREATE, chunk_size_);
  has_pending_ = false;

  record_.clear();
  ChunkFramer::WriteHeader(base_nonce, chunk_size_, encrypter_->cipher_id(), &record_);
  if (sink_->Write(record_.data(), record_.length()) != OK) {
    return Fail(ERR_IO_FAILED);
  }
  state_ = STATE_STREAMING;
  VLOG(2) << "Encryptor initialized: " << to_cipher_method_str(method_) << " chunk size " << chunk_size_;
  return OK;
}

int StreamEncryptor::EncryptChunk(const uint8_t* data, size_t len, size_t* record_size) {
  *record_size = 0;
  if (state_ == STATE_INIT) {
    return ERR_INVALID_ARGUMENT;
  }
  if (state_ != STATE_STREAMING) {
    return ERR_SESSION_CLOSED;
  }
  if (len > chunk_size_) {
    LOG(WARNING) << "Chunk of " << len << " bytes exceeds chunk size " << chunk_size_;
    return Fail(ERR_CHUNK_TOO_LARGE);
  }
  if (len == 0) {
    return OK;
  }
  if (has_pending_) {
    int ret = SealPending(false, record_size);
    if (ret != OK) {
      return ret;
    }
  }
  pending_.clear();
  pending_.append(data, len);
  has_pending_ = true;
  return OK;
}

int StreamEncryptor::Finalize(size_t* record_size) {
  *record_size = 0;
  if (state_ == STATE_INIT) {
    return ERR_INVALID_ARGUMENT;
  }
  if (state_ != STATE_STREAMING) {
    return ERR_SESSION_CLOSED;
  }
  if (!has_pending_) {
    pending_.clear();
  }
  int ret = SealPending(true, record_size);
  if (ret != OK) {
    return ret;
  }
  if (sink_->Flush() != OK) {
    return Fail(ERR_IO_FAILED);
  }
  state_ = STATE_FINALIZED;
  VLOG(2) << "Encryptor finalized after " << chunk_index_ + 1 << " chunks";
  return OK;
}

int StreamEncryptor::ProcessNext(absl::Span<const uint8_t> plaintext, std::optional<size_t>* record_size) {
  record_size->reset();
  size_t written = 0;
  int ret;
  if (plaintext.empty()) {
    ret = Finalize(&written);
  } else {
    ret = EncryptChunk(plaintext.data(), plaintext.size(), &written);
  }
  if (ret == OK && written) {
    *record_size = written;
  }
  return ret;
}

int StreamEncryptor::SealPending(bool is_final, size_t* record_size) {
  // The final chunk may use the last index, any other chunk needs a
  // successor.
  if (!is_final && chunk_index_ == std::numeric_limits<uint64_t>::max()) {
    LOG(WARNING) << "Chunk index exhausted";
    return Fail(ERR_CHUNK_INDEX_EXHAUSTED);
  }
  Nonce nonce = sequencer_->Derive(chunk_index_, is_final);

  size_t ciphertext_size = encrypter_->GetCiphertextSize(pending_.length());
  record_.clear();
  record_.reserve(kRecordLengthSize, ciphertext_size);
  size_t out_len = 0;
  if (!encrypter_->Encrypt(nonce.data(), nonce.size(), nullptr, 0, pending_.data(), pending_.length(),
                           record_.mutable_tail(), &out_len, record_.tailroom())) {
    LOG(WARNING) << "Failed to seal chunk " << chunk_index_;
    return Fail(ERR_CRYPTO_FAILED);
  }
  DCHECK_EQ(out_len, ciphertext_size);
  record_.append(out_len);
  ChunkFramer::WriteRecord(&record_);

  if (sink_->Write(record_.data(), record_.length()) != OK) {
    return Fail(ERR_IO_FAILED);
  }
  VLOG(3) << "Sealed chunk " << chunk_index_ << " (" << pending_.length() << " bytes"
          << (is_final ? ", final" : "") << ")";
  *record_size = record_.length();
  if (!is_final) {
    ++chunk_index_;
  }
  pending_.clear();
  has_pending_ = false;
  return OK;
}

int StreamEncryptor::Fail(int error) {
  state_ = STATE_FAILED;
  pending_.clear();
  has_pending_ = false;
  return error;
}

std::unique_ptr<StreamEncryptor> OpenEncryptor(ByteSink* sink,
                                               const uint8_t* key,
                                               size_t key_len,
                                               uint32_t chunk_size,
                                               int* rv,
                                               enum cipher_method method) {
  auto encryptor = std::make_unique<StreamEncryptor>(sink, method, chunk_size);
  *rv = encryptor->Init(key, key_len);
  if (*rv != OK) {
    return nullptr;
  }
  return encryptor;
}

}  // namespace saea
