// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "message.h"

#include <kj/common.h>
#include <kj/string.h>

namespace queuesim {

// Limits a producer has to stay within. Checked before anything is buffered; a failure throws
// an exception carrying the HTTP status to respond with (see util/exception.h).
constexpr size_t MAX_MESSAGE_SIZE_BYTES = 128000;
constexpr size_t MAX_MESSAGE_BATCH_COUNT = 100;
constexpr size_t MAX_MESSAGE_BATCH_SIZE = 288000;

// 413 if a single message is larger than MAX_MESSAGE_SIZE_BYTES.
void validateMessageSize(size_t size);

// Content types are matched exactly. An absent tag means OPAQUE; an unknown one is a 400.
ContentType validateContentType(kj::Maybe<kj::StringPtr> tag);

// Sizes a producer declares for a batch. A field left unset was not declared and passes.
struct BatchDescriptor {
  kj::Maybe<size_t> count;
  kj::Maybe<size_t> largestMessage;
  kj::Maybe<size_t> totalBytes;
};

// 413 if the batch has too many messages, a message that's too large, or too many bytes overall.
void validateBatchSize(const BatchDescriptor& batch);

// Computes the descriptor of an already-decoded batch.
BatchDescriptor describeBatch(kj::ArrayPtr<const IncomingMessage> messages);

}  // namespace queuesim
