// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/session_pool.hpp"

#include <algorithm>

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <openssl/mem.h>

#include "core/logging.hpp"
#include "stream/file_session.hpp"
#include "stream/stream_errors.hpp"

namespace saea {

SessionPool::SessionPool(int parallel_max, std::string key, uint32_t chunk_size, enum cipher_method method)
    : parallel_max_(std::max(parallel_max, 1)), key_(std::move(key)), chunk_size_(chunk_size), method_(method) {}

SessionPool::~SessionPool() {
  OPENSSL_cleanse(&key_[0], key_.size());
}

std::vector<int> SessionPool::Run(const std::vector<FileJob>& jobs) {
  {
    absl::MutexLock lk(&mutex_);
    results_.assign(jobs.size(), OK);
    jobs_done_ = 0;
  }
  if (jobs.empty()) {
    return {};
  }

  size_t num_threads = std::min(jobs.size(), static_cast<size_t>(parallel_max_));
  VLOG(1) << "session pool: running " << jobs.size() << " jobs on " << num_threads << " threads";

  asio::thread_pool pool(num_threads);
  for (size_t i = 0; i < jobs.size(); ++i) {
    asio::post(pool, [this, i, &jobs]() {
      int rv = RunJob(jobs[i]);
      {
        absl::MutexLock lk(&mutex_);
        results_[i] = rv;
        ++jobs_done_;
      }
      if (callback_) {
        absl::MutexLock lk(&callback_mutex_);
        callback_(jobs[i], rv);
      }
    });
  }
  pool.join();

  absl::MutexLock lk(&mutex_);
  return results_;
}

size_t SessionPool::jobs_done() const {
  absl::MutexLock lk(&mutex_);
  return jobs_done_;
}

int SessionPool::RunJob(const FileJob& job) const {
  const uint8_t* key = reinterpret_cast<const uint8_t*>(key_.data());
  switch (job.direction) {
    case FileJob::ENCRYPT:
      return EncryptFile(job.input_path, job.output_path, key, key_.size(), chunk_size_, method_);
    case FileJob::DECRYPT:
      return DecryptFile(job.input_path, job.output_path, key, key_.size());
  }
  NOTREACHED();
  return ERR_INVALID_ARGUMENT;
}

}  // namespace saea
