// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2023-2024 Chilledheart  */
#include "core/utils_fs.hpp"

#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>

namespace saea {

// returns true if the "file" exists and is a regular file
bool IsFile(const std::string& path) {
  std::error_code ec;
  auto stat = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::is_regular_file(stat)) {
    return false;
  }
  return true;
}

// returns true if the "dir" exists and is a directory
bool IsDirectory(const std::string& path) {
  if (path == "." || path == "..") {
    return true;
  }
  std::error_code ec;
  auto stat = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::is_directory(stat)) {
    return false;
  }
  return true;
}

bool CreateDirectories(const std::string& path) {
  if (IsDirectory(path)) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return false;
  }
  return true;
}

bool RemoveFile(const std::string& path) {
  const char* path_str = path.c_str();
  struct stat file_info {};
  if (::lstat(path_str, &file_info) != 0) {
    return (errno == ENOENT);
  }
  if (S_ISDIR(file_info.st_mode)) {
    return (rmdir(path_str) == 0) || (errno == ENOENT);
  } else {
    return (unlink(path_str) == 0) || (errno == ENOENT);
  }
}

}  // namespace saea
