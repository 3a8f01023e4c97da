// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

// This file intentionally does not have header guards, it's included
// inside a macro to generate enum values. The following line silences a
// presubmit and Tricium warning that would otherwise be triggered by this:
// no-include-guard-because-multiply-included

// This file contains the list of stream errors.

//
// Ranges:
//     0- 99 General and caller errors
//   100-199 Integrity errors (framing, authentication, truncation)
//

// A read or write on the underlying transport failed.
STREAM_ERROR(IO_FAILED, -1)

// An argument to the function is incorrect, e.g. a key of the wrong length.
STREAM_ERROR(INVALID_ARGUMENT, -2)

// A plaintext chunk larger than the session's chunk size was supplied.
STREAM_ERROR(CHUNK_TOO_LARGE, -3)

// The session has already been finalized, completed or has failed.
STREAM_ERROR(SESSION_CLOSED, -4)

// The chunk index space of the session is used up.
STREAM_ERROR(CHUNK_INDEX_EXHAUSTED, -5)

// The AEAD primitive failed to initialize or to seal.
STREAM_ERROR(CRYPTO_FAILED, -6)

// The source ended cleanly before the first byte of a record.
STREAM_ERROR(END_OF_INPUT, -7)

// The source ended inside the stream header.
STREAM_ERROR(TRUNCATED_HEADER, -100)

// The stream does not start with the "SAEA" magic.
STREAM_ERROR(BAD_MAGIC, -101)

// The header carries a format version this build does not understand.
STREAM_ERROR(UNSUPPORTED_VERSION, -102)

// The header names an algorithm id with no registered backend.
STREAM_ERROR(UNSUPPORTED_ALGORITHM, -103)

// The header carries a chunk size of zero or above the maximum.
STREAM_ERROR(INVALID_CHUNK_SIZE, -104)

// The stream header could not be accepted.
STREAM_ERROR(HEADER_INVALID, -105)

// The source ended inside a record.
STREAM_ERROR(TRUNCATED_RECORD, -106)

// A record length prefix is above chunk size plus tag.
STREAM_ERROR(RECORD_TOO_LARGE, -107)

// A record failed to authenticate.
STREAM_ERROR(AUTHENTICATION_FAILURE, -108)

// The source ended before a final record was authenticated.
STREAM_ERROR(TRUNCATED_STREAM, -109)

// Bytes follow the record that authenticated as final.
STREAM_ERROR(TRAILING_DATA, -110)

// A record length prefix is below the tag size.
STREAM_ERROR(RECORD_TOO_SHORT, -111)
