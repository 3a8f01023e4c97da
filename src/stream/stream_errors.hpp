// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_STREAM_STREAM_ERRORS
#define H_STREAM_STREAM_ERRORS

#include <string>

namespace saea {

// Error values are negative.
enum Error {
  // No error.
  OK = 0,

#define STREAM_ERROR(label, value) ERR_##label = value,
#include "stream/stream_error_list.hpp"
#undef STREAM_ERROR

  // The value of the first integrity error code.
  ERR_INTEGRITY_BEGIN = ERR_TRUNCATED_HEADER,
  ERR_INTEGRITY_END = -200,
};

// Returns a textual representation of the error code for logging purposes.
std::string ErrorToString(int error);

// Same as above, but leaves off the leading "saea::".
std::string ErrorToShortString(int error);

// Returns the message shown to end users. Every integrity error maps to the
// same text.
std::string ErrorToPublicString(int error);

// Returns true if |error| reports a malformed, truncated or tampered stream.
bool IsIntegrityError(int error);

}  // namespace saea

#endif  // H_STREAM_STREAM_ERRORS
