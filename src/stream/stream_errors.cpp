// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "stream/stream_errors.hpp"

#include "core/logging.hpp"

namespace saea {

// Validate all error values in stream_error_list.hpp are negative.
#define STREAM_ERROR(label, value) static_assert(value < 0, "ERR_" #label " should be negative");
#include "stream/stream_error_list.hpp"
#undef STREAM_ERROR

std::string ErrorToString(int error) {
  return "saea::" + ErrorToShortString(error);
}

std::string ErrorToShortString(int error) {
  if (error == OK)
    return "OK";

  const char* error_string;
  switch (error) {
#define STREAM_ERROR(label, value) \
  case ERR_##label:                \
    error_string = #label;         \
    break;
#include "stream/stream_error_list.hpp"
#undef STREAM_ERROR
    default:
      NOTREACHED();
      error_string = "<unknown>";
  }
  return std::string("ERR_") + error_string;
}

std::string ErrorToPublicString(int error) {
  if (error == OK)
    return "success";
  if (IsIntegrityError(error))
    return "stream invalid or tampered";
  switch (error) {
    case ERR_IO_FAILED:
      return "input/output error";
    case ERR_INVALID_ARGUMENT:
      return "invalid argument";
    case ERR_CHUNK_TOO_LARGE:
      return "chunk too large";
    case ERR_SESSION_CLOSED:
      return "session closed";
    case ERR_CHUNK_INDEX_EXHAUSTED:
      return "chunk index exhausted";
    case ERR_CRYPTO_FAILED:
      return "cryptographic failure";
    default:
      return "unknown error";
  }
}

bool IsIntegrityError(int error) {
  // Integrity errors are negative integers from ERR_INTEGRITY_BEGIN
  // (inclusive) to ERR_INTEGRITY_END (exclusive) in *decreasing* order.
  return error <= ERR_INTEGRITY_BEGIN && error > ERR_INTEGRITY_END;
}

}  // namespace saea
