// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_SESSION_POOL
#define H_STREAM_SESSION_POOL

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/functional/any_invocable.h>
#include <absl/synchronization/mutex.h>

#include "crypto/crypter_export.hpp"

namespace saea {

struct FileJob {
  enum Direction {
    ENCRYPT,
    DECRYPT,
  };
  Direction direction = ENCRYPT;
  std::string input_path;
  std::string output_path;
};

// Runs independent file sessions on a fixed number of worker threads. Each
// session runs from start to end on one thread, sessions share nothing but
// the key.
class SessionPool {
 public:
  using JobCallback = absl::AnyInvocable<void(const FileJob& job, int result)>;

  SessionPool(int parallel_max, std::string key, uint32_t chunk_size, enum cipher_method method = CRYPTO_DEFAULT);
  ~SessionPool();

  SessionPool(const SessionPool&) = delete;
  SessionPool& operator=(const SessionPool&) = delete;

  // Invoked once per finished job from the worker thread, never concurrently.
  // The pool lock is not held, so the callback may call jobs_done().
  void set_job_callback(JobCallback&& callback) { callback_ = std::move(callback); }

  // Runs every job to completion. Returns one result per job, in the order
  // of |jobs|.
  std::vector<int> Run(const std::vector<FileJob>& jobs);

  size_t jobs_done() const;

 private:
  int RunJob(const FileJob& job) const;

  const int parallel_max_;
  std::string key_;
  const uint32_t chunk_size_;
  const enum cipher_method method_;

  JobCallback callback_;
  absl::Mutex callback_mutex_;

  mutable absl::Mutex mutex_;
  std::vector<int> results_ ABSL_GUARDED_BY(mutex_);
  size_t jobs_done_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace saea

#endif  // H_STREAM_SESSION_POOL
