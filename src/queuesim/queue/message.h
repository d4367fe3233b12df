// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <queuesim/queue/queue.capnp.h>

#include <capnp/compat/json.capnp.h>
#include <capnp/message.h>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <kj/time.h>

namespace queuesim {

// Serialization format of a message body. Producers declare it with each message; it decides how
// the bytes are interpreted when the message is decoded.
enum class ContentType {
  TEXT,
  JSON,
  BYTES,
  // A runtime-native serialized value (e.g. a structured clone). Never interpreted by the broker.
  OPAQUE,
};

kj::StringPtr KJ_STRINGIFY(ContentType type);

// Parses a content type tag. Returns kj::none for anything that isn't one of the four tags.
kj::Maybe<ContentType> tryParseContentType(kj::StringPtr tag);

struct TextBody {
  kj::String text;
};

struct JsonBody {
  // Holds the parsed value. Owned through a pointer so the body stays movable.
  kj::Own<capnp::MallocMessageBuilder> message;

  capnp::JsonValue::Reader getValue() const;
};

struct BytesBody {
  kj::Array<kj::byte> bytes;
};

struct OpaqueBody {
  kj::Array<kj::byte> data;
};

using QueueBody = kj::OneOf<TextBody, JsonBody, BytesBody, OpaqueBody>;

ContentType getContentType(const QueueBody& body);

// Interprets `bytes` according to `type`. Throws if a JSON body doesn't parse; that is the
// producer's error, not the broker's.
QueueBody deserialize(ContentType type, kj::Array<kj::byte> bytes);

// Inverse of deserialize(): the payload bytes of a body.
kj::Array<kj::byte> serialize(const QueueBody& body);

// A message as it crosses a transport boundary: dispatched to a consumer, or forwarded to a
// dead-letter queue. The body is always base64-encoded.
struct SerializedMessage {
  kj::String id;
  kj::Date timestamp;
  ContentType contentType;
  kj::String body;

  void copyTo(rpc::QueueMessage::Builder builder) const;
};

// A message arriving at a queue from a producer or from another queue. `id` and `timestamp` are
// only set when a message is re-enqueued on a dead-letter queue.
struct IncomingMessage {
  kj::Maybe<kj::String> id;
  kj::Maybe<kj::Date> timestamp;
  ContentType contentType = ContentType::OPAQUE;
  kj::Array<kj::byte> body;

  // Decodes a wire message. Throws on an invalid content type or invalid base64.
  static IncomingMessage fromWire(rpc::QueueMessage::Reader message);
  static IncomingMessage fromSerialized(const SerializedMessage& message);
};

// A message buffered by a queue.
//
// The queue holding a QueueMessage owns it exclusively. Moving a message to another queue means
// constructing a new QueueMessage there with the same id, timestamp and body; the failed attempt
// counter doesn't travel with it.
class QueueMessage {
 public:
  QueueMessage(kj::String id, kj::Date timestamp, QueueBody body)
      : id(kj::mv(id)),
        timestamp(timestamp),
        body(kj::mv(body)) {}

  KJ_DISALLOW_COPY(QueueMessage);
  QueueMessage(QueueMessage&&) = default;
  QueueMessage& operator=(QueueMessage&&) = default;

  kj::StringPtr getId() const {
    return id;
  }
  kj::Date getTimestamp() const {
    return timestamp;
  }
  const QueueBody& getBody() const {
    return body;
  }
  ContentType getContentType() const {
    return queuesim::getContentType(body);
  }

  uint getFailedAttempts() const {
    return failedAttempts;
  }

  // Records a delivery attempt that ended with this message marked for retry. Returns the new
  // number of failed attempts.
  uint incrementFailedAttempts() {
    return ++failedAttempts;
  }

  SerializedMessage serialize() const;

 private:
  kj::String id;
  kj::Date timestamp;
  QueueBody body;
  uint failedAttempts = 0;
};

}  // namespace queuesim
