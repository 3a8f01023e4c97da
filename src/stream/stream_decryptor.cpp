// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/stream_decryptor.hpp"

#include <limits>

#include "core/logging.hpp"
#include "crypto/crypter_export.hpp"
#include "stream/stream_errors.hpp"

namespace saea {

StreamDecryptor::StreamDecryptor(ByteSource* source) : framer_(source) {}

StreamDecryptor::~StreamDecryptor() = default;

int StreamDecryptor::Init(const uint8_t* key, size_t key_len) {
  if (state_ != STATE_INIT) {
    return ERR_SESSION_CLOSED;
  }
  int ret = framer_.ReadHeader(&header_);
  if (ret == ERR_IO_FAILED) {
    return Fail(ret);
  }
  if (ret != OK) {
    VLOG(1) << "Rejecting stream header: " << ErrorToString(ret);
    return Fail(ERR_HEADER_INVALID);
  }
  decrypter_ = crypto::Decrypter::CreateFromCipherSuite(static_cast<enum cipher_method>(header_.algorithm_id));
  if (!decrypter_) {
    return Fail(ERR_HEADER_INVALID);
  }
  DCHECK_EQ(decrypter_->GetNonceSize(), kNonceSize);
  DCHECK_EQ(decrypter_->GetTagSize(), kTagSize);
  if (key == nullptr || key_len != decrypter_->GetKeySize()) {
    LOG(WARNING) << "Invalid key length: " << key_len;
    return Fail(ERR_INVALID_ARGUMENT);
  }
  if (!decrypter_->SetKey(key, key_len)) {
    return Fail(ERR_CRYPTO_FAILED);
  }
  sequencer_ = std::make_unique<NonceSequencer>(header_.base_nonce);
  chunk_index_ = 0;
  state_ = STATE_STREAMING;
  VLOG(2) << "Decryptor initialized: "
          << to_cipher_method_str(static_cast<enum cipher_method>(header_.algorithm_id)) << " chunk size "
          << header_.chunk_size;
  return OK;
}

int StreamDecryptor::ProcessNext(std::unique_ptr<IOBuf>* plaintext) {
  plaintext->reset();
  switch (state_) {
    case STATE_INIT:
      return ERR_INVALID_ARGUMENT;
    case STATE_COMPLETE:
      return OK;
    case STATE_FAILED:
      return error_;
    case STATE_STREAMING:
      break;
  }
  int ret = ReadChunk(plaintext);
  if (ret != OK) {
    plaintext->reset();
    return ret;
  }
  // An empty final chunk carries nothing to hand out.
  if (state_ == STATE_COMPLETE && (*plaintext)->empty()) {
    plaintext->reset();
  }
  return OK;
}

int StreamDecryptor::ReadChunk(std::unique_ptr<IOBuf>* plaintext) {
  int ret = framer_.ReadRecord(&record_);
  if (ret == ERR_END_OF_INPUT) {
    VLOG(1) << "Input ended before the final chunk, after " << chunk_index_ << " chunks";
    return Fail(ERR_TRUNCATED_STREAM);
  }
  if (ret != OK) {
    return Fail(ret);
  }

  bool at_end = false;
  ret = framer_.AtEndOfInput(&at_end);
  if (ret != OK) {
    return Fail(ret);
  }

  auto out = IOBuf::create(decrypter_->GetPlaintextSize(record_.length()));
  if (Open(chunk_index_, at_end, out.get())) {
    if (at_end) {
      state_ = STATE_COMPLETE;
      VLOG(2) << "Decryptor complete after " << chunk_index_ + 1 << " chunks";
    } else if (chunk_index_ == std::numeric_limits<uint64_t>::max()) {
      LOG(WARNING) << "Chunk index exhausted";
      return Fail(ERR_CHUNK_INDEX_EXHAUSTED);
    } else {
      ++chunk_index_;
    }
    *plaintext = std::move(out);
    return OK;
  }

  // Find out whether the record is intact but sits at the wrong end of the
  // input. Its plaintext is never released.
  out->clear();
  if (Open(chunk_index_, !at_end, out.get())) {
    if (at_end) {
      VLOG(1) << "Chunk " << chunk_index_ << " is not final but input ended";
      return Fail(ERR_TRUNCATED_STREAM);
    }
    VLOG(1) << "Chunk " << chunk_index_ << " is final but more input follows";
    return Fail(ERR_TRAILING_DATA);
  }

  VLOG(1) << "Chunk " << chunk_index_ << " failed authentication";
  return Fail(ERR_AUTHENTICATION_FAILURE);
}

bool StreamDecryptor::Open(uint64_t index, bool is_final, IOBuf* plaintext) {
  Nonce nonce = sequencer_->Derive(index, is_final);
  size_t out_len = 0;
  if (!decrypter_->Decrypt(nonce.data(), nonce.size(), nullptr, 0, record_.data(), record_.length(),
                           plaintext->mutable_tail(), &out_len, plaintext->tailroom())) {
    return false;
  }
  plaintext->append(out_len);
  return true;
}

int StreamDecryptor::Fail(int error) {
  state_ = STATE_FAILED;
  error_ = error;
  record_.clear();
  return error;
}

std::unique_ptr<StreamDecryptor> OpenDecryptor(ByteSource* source, const uint8_t* key, size_t key_len, int* rv) {
  auto decryptor = std::make_unique<StreamDecryptor>(source);
  *rv = decryptor->Init(key, key_len);
  if (*rv != OK) {
    return nullptr;
  }
  return decryptor;
}

}  // namespace saea
