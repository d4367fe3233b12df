// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "exception.h"

#include <kj/test.h>

namespace queuesim {
namespace {

KJ_TEST("HTTP status travels with the exception") {
  auto exception = httpStatusError(HTTP_PAYLOAD_TOO_LARGE, kj::str("too big"));
  KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
  KJ_EXPECT(exception.getDescription() == "too big");
  KJ_EXPECT(KJ_ASSERT_NONNULL(getHttpStatus(exception)) == 413);

  KJ_EXPECT(getHttpStatus(KJ_EXCEPTION(FAILED, "plain")) == kj::none);
}

KJ_TEST("QUEUESIM_FAIL_HTTP throws") {
  auto exception = KJ_ASSERT_NONNULL(kj::runCatchingExceptions([]() {
    QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "bad ", 42, " thing");
  }));
  KJ_EXPECT(exception.getDescription() == "bad 42 thing");
  KJ_EXPECT(KJ_ASSERT_NONNULL(getHttpStatus(exception)) == HTTP_BAD_REQUEST);
}

KJ_TEST("KJ_CATCH sees the exception as a kj::Exception") {
  kj::Maybe<uint> status;
  KJ_TRY {
    QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "nope");
  } KJ_CATCH (kj::Exception& exception) {
    status = getHttpStatus(exception);
  }
  KJ_EXPECT(KJ_ASSERT_NONNULL(status) == HTTP_BAD_REQUEST);
}

}  // namespace
}  // namespace queuesim
