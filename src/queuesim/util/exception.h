// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>

namespace queuesim {

// A producer-facing error carries the HTTP status that an ingress front end should answer with.
// The detail payload is the status code as two big-endian bytes.
constexpr kj::Exception::DetailTypeId HTTP_STATUS_DETAIL_ID = 0xd3a1f0c4b9e27a65ull;

constexpr uint HTTP_BAD_REQUEST = 400;
constexpr uint HTTP_PAYLOAD_TOO_LARGE = 413;

// Builds a FAILED exception with the given status attached.
kj::Exception httpStatusError(uint status, kj::String message);

// Returns the status attached by httpStatusError(), if any.
kj::Maybe<uint> getHttpStatus(const kj::Exception& exception);

// Throws a FAILED exception carrying an HTTP status. The message is built like KJ_FAIL_REQUIRE's
// parameters are, with kj::str().
#define QUEUESIM_FAIL_HTTP(status, ...)                                                             \
  kj::throwFatalException(::queuesim::httpStatusError(status, kj::str(__VA_ARGS__)))

}  // namespace queuesim

// KJ exception handling macros that allow catching exceptions by type instead of using
// the awkward `catch (...)` + `kj::getCaughtExceptionAsKj()` pattern.
//
// Usage:
//   KJ_TRY {
//     someCode();
//   } KJ_CATCH (kj::Exception& exception) {
//     handleException(exception);
//   }
#define KJ_TRY                                                                                     \
  try {                                                                                            \
    try
#define KJ_CATCH                                                                                   \
  catch (...) {                                                                                    \
    throw kj::getCaughtExceptionAsKj();                                                            \
  }                                                                                                \
  }                                                                                                \
  catch
