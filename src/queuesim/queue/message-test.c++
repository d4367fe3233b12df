// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "message.h"

#include <queuesim/util/exception.h>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/encoding.h>
#include <kj/test.h>

namespace queuesim {
namespace {

kj::Array<kj::byte> bytesOf(kj::StringPtr text) {
  return kj::heapArray(text.asBytes());
}

kj::String textOf(kj::ArrayPtr<const kj::byte> bytes) {
  return kj::heapString(bytes.asChars());
}

KJ_TEST("content type tags") {
  KJ_EXPECT(kj::str(ContentType::TEXT) == "text");
  KJ_EXPECT(kj::str(ContentType::JSON) == "json");
  KJ_EXPECT(kj::str(ContentType::BYTES) == "bytes");
  KJ_EXPECT(kj::str(ContentType::OPAQUE) == "opaque");

  KJ_EXPECT(KJ_ASSERT_NONNULL(tryParseContentType("json")) == ContentType::JSON);
  KJ_EXPECT(tryParseContentType("Json") == kj::none);
  KJ_EXPECT(tryParseContentType("v8") == kj::none);
}

KJ_TEST("text bodies") {
  auto body = deserialize(ContentType::TEXT, bytesOf("h\xc3\xa9llo"));
  KJ_EXPECT(getContentType(body) == ContentType::TEXT);
  KJ_EXPECT(body.get<TextBody>().text == "h\xc3\xa9llo");
  KJ_EXPECT(textOf(serialize(body)) == "h\xc3\xa9llo");
}

KJ_TEST("json bodies are parsed") {
  auto body = deserialize(ContentType::JSON, bytesOf(R"({"key": [1, true, "two"]})"));
  KJ_EXPECT(getContentType(body) == ContentType::JSON);

  auto value = body.get<JsonBody>().getValue();
  KJ_ASSERT(value.isObject());
  auto object = value.getObject();
  KJ_ASSERT(object.size() == 1);
  KJ_EXPECT(object[0].getName() == "key");
  auto array = object[0].getValue().getArray();
  KJ_ASSERT(array.size() == 3);
  KJ_EXPECT(array[0].getNumber() == 1);
  KJ_EXPECT(array[1].getBoolean());
  KJ_EXPECT(array[2].getString() == "two");

  // Re-encoding normalizes whitespace.
  KJ_EXPECT(textOf(serialize(body)) == R"({"key":[1,true,"two"]})");
}

KJ_TEST("malformed json is the producer's error") {
  KJ_EXPECT_THROW_MESSAGE("message body is not valid JSON",
      deserialize(ContentType::JSON, bytesOf("{not json")));

  auto exception = KJ_ASSERT_NONNULL(kj::runCatchingExceptions([]() {
    deserialize(ContentType::JSON, bytesOf("[1, 2"));
  }));
  KJ_EXPECT(KJ_ASSERT_NONNULL(getHttpStatus(exception)) == HTTP_BAD_REQUEST);
}

KJ_TEST("bytes and opaque bodies are passed through") {
  kj::byte raw[] = {0, 1, 2, 0xff};

  auto bytes = deserialize(ContentType::BYTES, kj::heapArray<kj::byte>(raw, 4));
  KJ_EXPECT(getContentType(bytes) == ContentType::BYTES);
  KJ_EXPECT(bytes.get<BytesBody>().bytes.asPtr() == kj::arrayPtr(raw, 4));

  auto opaque = deserialize(ContentType::OPAQUE, kj::heapArray<kj::byte>(raw, 4));
  KJ_EXPECT(getContentType(opaque) == ContentType::OPAQUE);
  KJ_EXPECT(serialize(opaque).asPtr() == kj::arrayPtr(raw, 4));
}

KJ_TEST("QueueMessage serializes with a base64 body") {
  auto date = kj::UNIX_EPOCH + 1700000000123 * kj::MILLISECONDS;
  QueueMessage message(kj::str("abc"), date, deserialize(ContentType::TEXT, bytesOf("hi")));
  KJ_EXPECT(message.getFailedAttempts() == 0);
  KJ_EXPECT(message.incrementFailedAttempts() == 1);
  KJ_EXPECT(message.incrementFailedAttempts() == 2);

  auto serialized = message.serialize();
  KJ_EXPECT(serialized.id == "abc");
  KJ_EXPECT(serialized.timestamp == date);
  KJ_EXPECT(serialized.contentType == ContentType::TEXT);
  KJ_EXPECT(serialized.body == "aGk=");

  capnp::MallocMessageBuilder builder;
  auto wire = builder.initRoot<rpc::QueueMessage>();
  serialized.copyTo(wire);
  KJ_EXPECT(wire.getTimestamp() == 1700000000123.0);
  KJ_EXPECT(wire.getContentType() == "text");

  capnp::JsonCodec codec;
  KJ_EXPECT(codec.encode(wire.asReader()) ==
      R"({"id":"abc","timestamp":1700000000123,"contentType":"text","body":"aGk="})");

  // A forwarded message keeps its identity.
  auto incoming = IncomingMessage::fromWire(wire.asReader());
  KJ_EXPECT(KJ_ASSERT_NONNULL(incoming.id) == "abc");
  KJ_EXPECT(KJ_ASSERT_NONNULL(incoming.timestamp) == date);
  KJ_EXPECT(incoming.contentType == ContentType::TEXT);
  KJ_EXPECT(textOf(incoming.body) == "hi");
}

KJ_TEST("IncomingMessage from a producer's wire message") {
  capnp::MallocMessageBuilder builder;
  auto wire = builder.initRoot<rpc::QueueMessage>();
  wire.setBody(kj::encodeBase64("payload"_kj.asBytes()));

  auto incoming = IncomingMessage::fromWire(wire.asReader());
  KJ_EXPECT(incoming.id == kj::none);
  KJ_EXPECT(incoming.timestamp == kj::none);
  KJ_EXPECT(incoming.contentType == ContentType::OPAQUE);
  KJ_EXPECT(textOf(incoming.body) == "payload");

  wire.setContentType("xml");
  KJ_EXPECT_THROW_MESSAGE("message content type xml is invalid",
      IncomingMessage::fromWire(wire.asReader()));

  wire.setContentType("bytes");
  wire.setTimestamp(1e16);
  KJ_EXPECT_THROW_MESSAGE("out of range", IncomingMessage::fromWire(wire.asReader()));
  wire.setTimestamp(-1e300);
  KJ_EXPECT_THROW_MESSAGE("out of range", IncomingMessage::fromWire(wire.asReader()));
  wire.setTimestamp(kj::inf());
  auto exception = KJ_ASSERT_NONNULL(kj::runCatchingExceptions([&]() {
    IncomingMessage::fromWire(wire.asReader());
  }));
  KJ_EXPECT(KJ_ASSERT_NONNULL(getHttpStatus(exception)) == HTTP_BAD_REQUEST);

  // The largest accepted timestamp, in 2261.
  wire.setTimestamp(9.2e12);
  KJ_EXPECT(KJ_ASSERT_NONNULL(IncomingMessage::fromWire(wire.asReader()).timestamp) ==
      kj::UNIX_EPOCH + 9200000000000 * kj::MILLISECONDS);

  wire.setTimestamp(kj::nan());
  wire.setBody("!!! not base64 !!!");
  KJ_EXPECT_THROW_MESSAGE("not valid base64", IncomingMessage::fromWire(wire.asReader()));
}

}  // namespace
}  // namespace queuesim
