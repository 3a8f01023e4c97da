// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "core/utils.hpp"

#include <fcntl.h>
#include <limits.h>
#include <pwd.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/common_posix.hpp"
#include "core/logging.hpp"

namespace saea {

const char kSeparators[] = "/";

std::string_view Dirname(std::string_view path) {
  // trim the extra trailing slash
  auto first_non_slash_at_end_pos = path.find_last_not_of(kSeparators);

  // path is in the root directory
  if (first_non_slash_at_end_pos == std::string_view::npos) {
    return path.empty() ? "/" : path.substr(0, 1);
  }

  auto last_slash_pos = path.find_last_of(kSeparators, first_non_slash_at_end_pos);

  // path is in the current directory.
  if (last_slash_pos == std::string_view::npos) {
    return ".";
  }

  // trim the extra trailing slash
  first_non_slash_at_end_pos = path.find_last_not_of(kSeparators, last_slash_pos);

  // path is in the root directory
  if (first_non_slash_at_end_pos == std::string_view::npos) {
    return path.substr(0, 1);
  }

  return path.substr(0, first_non_slash_at_end_pos + 1);
}

std::string_view Basename(std::string_view path) {
  // trim the extra trailing slash
  auto first_non_slash_at_end_pos = path.find_last_not_of(kSeparators);

  // path is in the root directory
  if (first_non_slash_at_end_pos == std::string_view::npos) {
    return path.empty() ? "" : path.substr(0, 1);
  }

  auto last_slash_pos = path.find_last_of(kSeparators, first_non_slash_at_end_pos);

  // path is in the current directory
  if (last_slash_pos == std::string_view::npos) {
    return path.substr(0, first_non_slash_at_end_pos + 1);
  }

  return path.substr(last_slash_pos + 1, first_non_slash_at_end_pos - last_slash_pos);
}

std::string ExpandUser(std::string_view file_path) {
  std::string real_path = std::string(file_path);

  if (real_path.empty() || real_path[0] != '~') {
    return real_path;
  }

  std::string home;
  const char* home_str = ::getenv("HOME");
  if (home_str) {
    home = home_str;
  }
  if (home.empty()) {
    struct passwd pwd;
    struct passwd* result = nullptr;
    char buffer[PATH_MAX * 2] = {'\0'};
    int pwuid_res = ::getpwuid_r(::geteuid(), &pwd, buffer, sizeof(buffer), &result);
    if (pwuid_res == 0 && result) {
      home = pwd.pw_dir;
    } else {
      home = "/";
    }
  }
  if (real_path.size() == 1) {
    return home;
  }
  // ~username is not expanded
  if (real_path[1] != '/') {
    return real_path;
  }
  return home + real_path.substr(1);
}

uint64_t GetPID() {
  return static_cast<uint64_t>(::getpid());
}

ssize_t ReadFileToBuffer(const std::string& path, absl::Span<uint8_t> buffer) {
  int fd = HANDLE_EINTR(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd < 0) {
    return -1;
  }
  ssize_t total = 0;
  while (static_cast<size_t>(total) < buffer.size()) {
    ssize_t ret = HANDLE_EINTR(::read(fd, buffer.data() + total, buffer.size() - total));
    if (ret < 0) {
      total = -1;
      break;
    }
    if (ret == 0) {
      break;
    }
    total += ret;
  }

  if (IGNORE_EINTR(::close(fd)) < 0) {
    return -1;
  }
  return total;
}

bool WriteFileDescriptor(int fd, const uint8_t* data, size_t size) {
  // Allow for partial writes.
  size_t bytes_written_total = 0;
  DCHECK_LE(size, static_cast<size_t>(SSIZE_MAX));
  while (bytes_written_total < size) {
    ssize_t bytes_written_partial =
        HANDLE_EINTR(::write(fd, data + bytes_written_total, size - bytes_written_total));
    if (bytes_written_partial < 0) {
      return false;
    }
    bytes_written_total += static_cast<size_t>(bytes_written_partial);
  }
  return true;
}

ssize_t WriteFileWithBuffer(const std::string& path, std::string_view buf) {
  int fd = HANDLE_EINTR(::open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR));
  if (fd < 0) {
    return -1;
  }

  ssize_t ret =
      WriteFileDescriptor(fd, reinterpret_cast<const uint8_t*>(buf.data()), buf.size()) ? buf.size() : -1;

  if (IGNORE_EINTR(::close(fd)) < 0) {
    return -1;
  }
  return ret;
}

}  // namespace saea
