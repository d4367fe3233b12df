// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "message.h"

#include "limits.h"

#include <queuesim/util/exception.h>

#include <capnp/compat/json.h>
#include <kj/debug.h>
#include <kj/encoding.h>

#include <cmath>

namespace queuesim {

kj::StringPtr KJ_STRINGIFY(ContentType type) {
  switch (type) {
    case ContentType::TEXT:
      return "text"_kj;
    case ContentType::JSON:
      return "json"_kj;
    case ContentType::BYTES:
      return "bytes"_kj;
    case ContentType::OPAQUE:
      return "opaque"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<ContentType> tryParseContentType(kj::StringPtr tag) {
  if (tag == "text"_kj) return ContentType::TEXT;
  if (tag == "json"_kj) return ContentType::JSON;
  if (tag == "bytes"_kj) return ContentType::BYTES;
  if (tag == "opaque"_kj) return ContentType::OPAQUE;
  return kj::none;
}

capnp::JsonValue::Reader JsonBody::getValue() const {
  return message->getRoot<capnp::JsonValue>().asReader();
}

ContentType getContentType(const QueueBody& body) {
  KJ_SWITCH_ONEOF(body) {
    KJ_CASE_ONEOF(text, TextBody) {
      return ContentType::TEXT;
    }
    KJ_CASE_ONEOF(json, JsonBody) {
      return ContentType::JSON;
    }
    KJ_CASE_ONEOF(bytes, BytesBody) {
      return ContentType::BYTES;
    }
    KJ_CASE_ONEOF(opaque, OpaqueBody) {
      return ContentType::OPAQUE;
    }
  }
  KJ_UNREACHABLE;
}

QueueBody deserialize(ContentType type, kj::Array<kj::byte> bytes) {
  switch (type) {
    case ContentType::TEXT:
      return TextBody{kj::heapString(bytes.asChars())};
    case ContentType::JSON: {
      auto message = kj::heap<capnp::MallocMessageBuilder>();
      auto root = message->initRoot<capnp::JsonValue>();
      capnp::JsonCodec codec;
      KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
        codec.decodeRaw(bytes.asChars(), root);
      })) {
        QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "message body is not valid JSON: ",
            exception.getDescription());
      }
      return JsonBody{kj::mv(message)};
    }
    case ContentType::BYTES:
      return BytesBody{kj::mv(bytes)};
    case ContentType::OPAQUE:
      return OpaqueBody{kj::mv(bytes)};
  }
  KJ_UNREACHABLE;
}

kj::Array<kj::byte> serialize(const QueueBody& body) {
  KJ_SWITCH_ONEOF(body) {
    KJ_CASE_ONEOF(text, TextBody) {
      return kj::heapArray(text.text.asBytes());
    }
    KJ_CASE_ONEOF(json, JsonBody) {
      capnp::JsonCodec codec;
      auto encoded = codec.encodeRaw(json.getValue());
      return kj::heapArray(encoded.asBytes());
    }
    KJ_CASE_ONEOF(bytes, BytesBody) {
      return kj::heapArray(bytes.bytes.asPtr());
    }
    KJ_CASE_ONEOF(opaque, OpaqueBody) {
      return kj::heapArray(opaque.data.asPtr());
    }
  }
  KJ_UNREACHABLE;
}

namespace {

double toWireTimestamp(kj::Date date) {
  return (date - kj::UNIX_EPOCH) / kj::MILLISECONDS;
}

// kj::Date counts nanoseconds in an int64_t, which runs out a little after 9.2e12 milliseconds
// either side of the epoch (the year 2262).
constexpr double MAX_TIMESTAMP_MILLIS = 9.2e12;

kj::Date fromWireTimestamp(double millis) {
  if (!std::isfinite(millis) || millis > MAX_TIMESTAMP_MILLIS || millis < -MAX_TIMESTAMP_MILLIS) {
    QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "message timestamp ", millis, " is out of range");
  }
  return kj::UNIX_EPOCH + static_cast<int64_t>(millis) * kj::MILLISECONDS;
}

kj::Array<kj::byte> decodeBody(kj::StringPtr base64) {
  auto decoded = kj::decodeBase64(base64);
  if (decoded.hadErrors) {
    QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "message body is not valid base64");
  }
  return kj::mv(decoded);
}

}  // namespace

void SerializedMessage::copyTo(rpc::QueueMessage::Builder builder) const {
  builder.setId(id);
  builder.setTimestamp(toWireTimestamp(timestamp));
  builder.setContentType(kj::str(contentType));
  builder.setBody(body);
}

IncomingMessage IncomingMessage::fromWire(rpc::QueueMessage::Reader message) {
  IncomingMessage result;
  if (message.hasId()) {
    result.id = kj::str(message.getId());
  }
  double timestamp = message.getTimestamp();
  if (!std::isnan(timestamp)) {
    result.timestamp = fromWireTimestamp(timestamp);
  }
  kj::Maybe<kj::StringPtr> contentType;
  if (message.hasContentType() && message.getContentType().size() > 0) {
    contentType = message.getContentType();
  }
  result.contentType = validateContentType(contentType);
  result.body = decodeBody(message.getBody());
  return result;
}

IncomingMessage IncomingMessage::fromSerialized(const SerializedMessage& message) {
  return IncomingMessage{
    .id = kj::str(message.id),
    .timestamp = message.timestamp,
    .contentType = message.contentType,
    .body = decodeBody(message.body),
  };
}

SerializedMessage QueueMessage::serialize() const {
  return SerializedMessage{
    .id = kj::str(id),
    .timestamp = timestamp,
    .contentType = getContentType(),
    .body = kj::encodeBase64(queuesim::serialize(body)),
  };
}

}  // namespace queuesim
