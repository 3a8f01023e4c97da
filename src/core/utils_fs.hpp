// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2023-2024 Chilledheart  */
#ifndef H_CORE_UTILS_FS
#define H_CORE_UTILS_FS

#include <string>

namespace saea {

bool IsDirectory(const std::string& path);
bool IsFile(const std::string& path);
bool CreateDirectories(const std::string& path);
bool RemoveFile(const std::string& path);

}  // namespace saea
#endif  // H_CORE_UTILS_FS
