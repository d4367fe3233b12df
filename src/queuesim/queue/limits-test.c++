// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "limits.h"

#include <queuesim/util/exception.h>

#include <kj/test.h>

namespace queuesim {
namespace {

uint statusOf(kj::Function<void()> func) {
  KJ_IF_SOME(exception, kj::runCatchingExceptions(kj::mv(func))) {
    KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
    KJ_IF_SOME(status, getHttpStatus(exception)) {
      return status;
    }
    KJ_FAIL_EXPECT("exception has no HTTP status", exception);
    return 0;
  }
  return 200;
}

KJ_TEST("message size limit") {
  validateMessageSize(0);
  validateMessageSize(MAX_MESSAGE_SIZE_BYTES);
  KJ_EXPECT(statusOf([]() { validateMessageSize(MAX_MESSAGE_SIZE_BYTES + 1); }) == 413);
  KJ_EXPECT_THROW_MESSAGE("message length of 128001 bytes exceeds limit of 128000",
      validateMessageSize(128001));
}

KJ_TEST("content types match exactly") {
  KJ_EXPECT(validateContentType("text"_kj) == ContentType::TEXT);
  KJ_EXPECT(validateContentType("json"_kj) == ContentType::JSON);
  KJ_EXPECT(validateContentType("bytes"_kj) == ContentType::BYTES);
  KJ_EXPECT(validateContentType("opaque"_kj) == ContentType::OPAQUE);
  KJ_EXPECT(validateContentType(kj::none) == ContentType::OPAQUE);

  KJ_EXPECT(statusOf([]() { validateContentType("TEXT"_kj); }) == 400);
  KJ_EXPECT(statusOf([]() { validateContentType("v8"_kj); }) == 400);
  KJ_EXPECT_THROW_MESSAGE("message content type xml is invalid; if specified, must be one of "
                          "'text', 'json', 'bytes', or 'opaque'",
      validateContentType("xml"_kj));
}

KJ_TEST("batch limits") {
  validateBatchSize({});
  validateBatchSize({.count = 100, .largestMessage = 128000, .totalBytes = 288000});

  KJ_EXPECT(statusOf([]() { validateBatchSize({.count = 101}); }) == 413);
  KJ_EXPECT(statusOf([]() { validateBatchSize({.largestMessage = 128001}); }) == 413);
  KJ_EXPECT(statusOf([]() { validateBatchSize({.totalBytes = 288001}); }) == 413);

  KJ_EXPECT_THROW_MESSAGE("batch message count of 101 exceeds limit of 100",
      validateBatchSize({.count = 101}));
  KJ_EXPECT_THROW_MESSAGE("batch size of 300000 bytes exceeds limit of 288000",
      validateBatchSize({.count = 3, .totalBytes = 300000}));
}

KJ_TEST("describeBatch measures decoded bodies") {
  auto messages = kj::heapArrayBuilder<IncomingMessage>(3);
  for (size_t size: {10, 300, 20}) {
    IncomingMessage message;
    message.body = kj::heapArray<kj::byte>(size);
    messages.add(kj::mv(message));
  }
  auto batch = messages.finish();

  auto descriptor = describeBatch(batch);
  KJ_EXPECT(KJ_ASSERT_NONNULL(descriptor.count) == 3);
  KJ_EXPECT(KJ_ASSERT_NONNULL(descriptor.largestMessage) == 300);
  KJ_EXPECT(KJ_ASSERT_NONNULL(descriptor.totalBytes) == 330);
}

}  // namespace
}  // namespace queuesim
