// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CORE_UTILS
#define H_CORE_UTILS

#include <stdint.h>
#include <sys/types.h>

#include <string>
#include <string_view>

#include <absl/types/span.h>

namespace saea {

extern const char kSeparators[];

// A portable interface that returns the dirname of the filename passed as an
// argument. It is similar to dirname(3)
// <https://linux.die.net/man/3/dirname>.
// For example:
//     Dirname("a/b/prog/file.cc")
// returns "a/b/prog"
//     Dirname("a/b/prog//")
// returns "a/b"
//     Dirname("file.cc")
// returns "."
//     Dirname("/file.cc")
// returns "/"
//     Dirname("//file.cc")
// returns "/"
//     Dirname("/dir//file.cc")
// returns "/dir"
std::string_view Dirname(std::string_view path);

// A portable interface that returns the basename of the filename passed as an
// argument. It is similar to basename(3)
// <https://linux.die.net/man/3/basename>.
// For example:
//     Basename("a/b/prog/file.cc")
// returns "file.cc"
//     Basename("a/b/prog//")
// returns "prog"
//     Basename("file.cc")
// returns "file.cc"
//     Basename("/file.cc")
// returns "file.cc"
//     Basename("////")
// returns "/"
std::string_view Basename(std::string_view path);

// Expands a leading "~" to the home directory of the current user.
std::string ExpandUser(std::string_view file_path);

uint64_t GetPID();

// Reads at most |buffer.size()| bytes of |path|. Returns the number of bytes
// read or -1 on failure.
ssize_t ReadFileToBuffer(const std::string& path, absl::Span<uint8_t> buffer);

// Creates or truncates |path| and writes |buf| to it with mode 0600. Returns
// the number of bytes written or -1 on failure.
ssize_t WriteFileWithBuffer(const std::string& path, std::string_view buf);

// Writes all of |data| to |fd|, allowing for partial writes.
bool WriteFileDescriptor(int fd, const uint8_t* data, size_t size);

}  // namespace saea

#endif  // H_CORE_UTILS
