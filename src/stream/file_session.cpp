// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/file_session.hpp"

#include <fcntl.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <optional>

#include <absl/strings/str_cat.h>

#include "core/common_posix.hpp"
#include "core/iobuf.hpp"
#include "core/logging.hpp"
#include "core/rand_util.hpp"
#include "core/utils.hpp"
#include "core/utils_fs.hpp"
#include "stream/byte_stream.hpp"
#include "stream/stream_decryptor.hpp"
#include "stream/stream_encryptor.hpp"
#include "stream/stream_errors.hpp"

namespace saea {

const char kStdioPath[] = "-";

namespace {

std::unique_ptr<FileByteSource> OpenSource(const std::string& path) {
  if (path == kStdioPath) {
    return std::make_unique<FileByteSource>(STDIN_FILENO, false);
  }
  int fd = HANDLE_EINTR(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd < 0) {
    PLOG(WARNING) << "Failed to open " << path;
    return nullptr;
  }
  return std::make_unique<FileByteSource>(fd, true);
}

// Returns true if |path| is the file |source| reads from. Writing to it
// would truncate the input before it is read.
bool IsSameFile(const FileByteSource& source, const std::string& path) {
  if (path == kStdioPath) {
    return false;
  }
  struct stat source_st, output_st;
  if (fstat(source.fd(), &source_st) != 0 || stat(path.c_str(), &output_st) != 0) {
    return false;
  }
  return source_st.st_dev == output_st.st_dev && source_st.st_ino == output_st.st_ino;
}

// The output is written to |*tmp_path| beside |path| and only renamed over
// |path| once the session succeeded.
std::unique_ptr<FileByteSink> OpenSink(const std::string& path, std::string* tmp_path) {
  tmp_path->clear();
  if (path == kStdioPath) {
    return std::make_unique<FileByteSink>(STDOUT_FILENO, false);
  }
  *tmp_path = absl::StrCat(path, ".", GetPID(), ".", RandUint64(), ".tmp");
  int fd = HANDLE_EINTR(open(tmp_path->c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
  if (fd < 0) {
    PLOG(WARNING) << "Failed to create " << *tmp_path;
    tmp_path->clear();
    return nullptr;
  }
  return std::make_unique<FileByteSink>(fd, true);
}

// Closes the output and moves it to |path| if the session succeeded,
// otherwise removes it.
int FinishOutput(FileByteSink* sink, const std::string& path, const std::string& tmp_path, int rv) {
  int close_rv = sink->Close();
  if (rv == OK) {
    rv = close_rv;
  }
  if (tmp_path.empty()) {
    return rv;
  }
  if (rv == OK && rename(tmp_path.c_str(), path.c_str()) != 0) {
    PLOG(WARNING) << "Failed to rename " << tmp_path << " to " << path;
    rv = ERR_IO_FAILED;
  }
  if (rv != OK) {
    if (!RemoveFile(tmp_path)) {
      PLOG(WARNING) << "Failed to remove partial output " << tmp_path;
    } else {
      VLOG(1) << "Removed partial output " << tmp_path;
    }
  }
  return rv;
}

// Reads until |buf| holds |len| bytes or the source ends.
int ReadFull(ByteSource* source, IOBuf* buf, size_t len) {
  buf->clear();
  while (buf->length() < len) {
    int ret = source->Read(buf->mutable_tail(), static_cast<int>(len - buf->length()));
    if (ret < 0) {
      return ret;
    }
    if (ret == 0) {
      break;
    }
    buf->append(ret);
  }
  return OK;
}

int RunEncryptor(ByteSource* source, ByteSink* sink, const uint8_t* key, size_t key_len, uint32_t chunk_size,
                 enum cipher_method method) {
  int rv;
  auto encryptor = OpenEncryptor(sink, key, key_len, chunk_size, &rv, method);
  if (!encryptor) {
    return rv;
  }
  auto chunk = IOBuf::create(chunk_size);
  std::optional<size_t> record_size;
  do {
    rv = ReadFull(source, chunk.get(), chunk_size);
    if (rv != OK) {
      return rv;
    }
    // An empty read finalizes the session.
    rv = encryptor->ProcessNext(absl::MakeConstSpan(chunk->data(), chunk->length()), &record_size);
    if (rv != OK) {
      return rv;
    }
  } while (!encryptor->is_finished());
  return OK;
}

int RunDecryptor(ByteSource* source, ByteSink* sink, const uint8_t* key, size_t key_len) {
  int rv;
  auto decryptor = OpenDecryptor(source, key, key_len, &rv);
  if (!decryptor) {
    return rv;
  }
  std::unique_ptr<IOBuf> plaintext;
  while (!decryptor->is_finished()) {
    rv = decryptor->ProcessNext(&plaintext);
    if (rv != OK) {
      return rv;
    }
    if (plaintext && sink->Write(plaintext->data(), plaintext->length()) != OK) {
      return ERR_IO_FAILED;
    }
  }
  return sink->Flush();
}

}  // namespace

int EncryptFile(const std::string& input_path,
                const std::string& output_path,
                const uint8_t* key,
                size_t key_len,
                uint32_t chunk_size,
                enum cipher_method method) {
  auto source = OpenSource(input_path);
  if (!source) {
    return ERR_IO_FAILED;
  }
  if (IsSameFile(*source, output_path)) {
    LOG(WARNING) << "Refusing to overwrite the input " << input_path;
    return ERR_INVALID_ARGUMENT;
  }
  std::string tmp_path;
  auto sink = OpenSink(output_path, &tmp_path);
  if (!sink) {
    return ERR_IO_FAILED;
  }
  int rv = RunEncryptor(source.get(), sink.get(), key, key_len, chunk_size, method);
  rv = FinishOutput(sink.get(), output_path, tmp_path, rv);
  if (rv != OK) {
    LOG(WARNING) << "Failed to encrypt " << input_path << ": " << ErrorToString(rv);
  }
  return rv;
}

int DecryptFile(const std::string& input_path, const std::string& output_path, const uint8_t* key, size_t key_len) {
  auto source = OpenSource(input_path);
  if (!source) {
    return ERR_IO_FAILED;
  }
  if (IsSameFile(*source, output_path)) {
    LOG(WARNING) << "Refusing to overwrite the input " << input_path;
    return ERR_INVALID_ARGUMENT;
  }
  std::string tmp_path;
  auto sink = OpenSink(output_path, &tmp_path);
  if (!sink) {
    return ERR_IO_FAILED;
  }
  int rv = RunDecryptor(source.get(), sink.get(), key, key_len);
  rv = FinishOutput(sink.get(), output_path, tmp_path, rv);
  if (rv != OK) {
    // The detailed reason of an integrity failure stays out of the default
    // log output.
    VLOG(1) << "Failed to decrypt " << input_path << ": " << ErrorToString(rv);
  }
  return rv;
}

}  // namespace saea
