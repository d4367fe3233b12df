// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "limits.h"

#include <queuesim/util/exception.h>

namespace queuesim {

void validateMessageSize(size_t size) {
  if (size > MAX_MESSAGE_SIZE_BYTES) {
    QUEUESIM_FAIL_HTTP(HTTP_PAYLOAD_TOO_LARGE, "message length of ", size,
        " bytes exceeds limit of ", MAX_MESSAGE_SIZE_BYTES);
  }
}

ContentType validateContentType(kj::Maybe<kj::StringPtr> tag) {
  KJ_IF_SOME(t, tag) {
    KJ_IF_SOME(type, tryParseContentType(t)) {
      return type;
    }
    QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "message content type ", t,
        " is invalid; if specified, must be one of 'text', 'json', 'bytes', or 'opaque'");
  }
  return ContentType::OPAQUE;
}

void validateBatchSize(const BatchDescriptor& batch) {
  KJ_IF_SOME(count, batch.count) {
    if (count > MAX_MESSAGE_BATCH_COUNT) {
      QUEUESIM_FAIL_HTTP(HTTP_PAYLOAD_TOO_LARGE, "batch message count of ", count,
          " exceeds limit of ", MAX_MESSAGE_BATCH_COUNT);
    }
  }
  KJ_IF_SOME(largest, batch.largestMessage) {
    if (largest > MAX_MESSAGE_SIZE_BYTES) {
      QUEUESIM_FAIL_HTTP(HTTP_PAYLOAD_TOO_LARGE, "message in batch has length ", largest,
          " bytes which exceeds single message size limit of ", MAX_MESSAGE_SIZE_BYTES);
    }
  }
  KJ_IF_SOME(total, batch.totalBytes) {
    if (total > MAX_MESSAGE_BATCH_SIZE) {
      QUEUESIM_FAIL_HTTP(HTTP_PAYLOAD_TOO_LARGE, "batch size of ", total,
          " bytes exceeds limit of ", MAX_MESSAGE_BATCH_SIZE);
    }
  }
}

BatchDescriptor describeBatch(kj::ArrayPtr<const IncomingMessage> messages) {
  size_t largest = 0;
  size_t total = 0;
  for (auto& message: messages) {
    largest = kj::max(largest, message.body.size());
    total += message.body.size();
  }
  return {
    .count = messages.size(),
    .largestMessage = largest,
    .totalBytes = total,
  };
}

}  // namespace queuesim
