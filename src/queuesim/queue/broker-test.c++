// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "limits.h"
#include "test-fixture.h"

#include <queuesim/util/exception.h>

#include <kj/test.h>

namespace queuesim::test {
namespace {

using FlushState = Queue::FlushState;

kj::Promise<QueueResponse> retryEverything(const FakeDispatcher::Call&) {
  QueueResponse response;
  response.retryAll = true;
  return kj::mv(response);
}

IncomingMessage incoming(kj::StringPtr text, ContentType type = ContentType::TEXT) {
  return IncomingMessage{
    .contentType = type,
    .body = kj::heapArray(text.asBytes()),
  };
}

uint statusOf(kj::Function<void()> func) {
  auto maybeException = kj::runCatchingExceptions(kj::mv(func));
  auto& exception = KJ_ASSERT_NONNULL(maybeException);
  return KJ_ASSERT_NONNULL(getHttpStatus(exception));
}

KJ_TEST("queues are created on first reference") {
  QueueFixture f;
  KJ_EXPECT(f.broker.tryGetQueue("queue") == kj::none);

  auto& queue = f.broker.getOrCreateQueue("queue");
  KJ_EXPECT(queue.getName() == "queue");
  KJ_EXPECT(queue.getConsumer() == kj::none);
  KJ_EXPECT(&KJ_ASSERT_NONNULL(f.broker.tryGetQueue("queue")) == &queue);
  KJ_EXPECT(&f.broker.getOrCreateQueue("queue") == &queue);
}

KJ_TEST("messages get generated ids and the current time") {
  QueueFixture f;
  auto& consumer = f.attach("queue");

  f.advance(1234 * kj::MILLISECONDS);
  f.send("queue", "first");
  f.send("queue", "second");

  auto pending = f.queue("queue").getPending();
  KJ_ASSERT(pending.size() == 2);
  KJ_EXPECT(pending[0].getId() == "000102030405060708090a0b0c0d0e0f");
  KJ_EXPECT(pending[1].getId() == "101112131415161718191a1b1c1d1e1f");
  KJ_EXPECT(pending[0].getTimestamp() == kj::UNIX_EPOCH + 1234 * kj::MILLISECONDS);

  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(consumer.calls.size() == 1);
  KJ_EXPECT(consumer.calls[0].messages[0].id == "000102030405060708090a0b0c0d0e0f");
  KJ_EXPECT(consumer.calls[0].messages[0].timestamp == kj::UNIX_EPOCH + 1234 * kj::MILLISECONDS);
}

KJ_TEST("single messages are validated before buffering") {
  QueueFixture f;
  f.attach("queue");

  KJ_EXPECT(statusOf([&]() {
    f.broker.enqueueOne("queue", kj::heapArray<kj::byte>(MAX_MESSAGE_SIZE_BYTES + 1), "bytes"_kj);
  }) == 413);
  KJ_EXPECT(statusOf([&]() {
    f.broker.enqueueOne("queue", kj::heapArray("hi"_kj.asBytes()), "text/plain"_kj);
  }) == 400);
  KJ_EXPECT(statusOf([&]() {
    f.broker.enqueueOne("queue", kj::heapArray("{"_kj.asBytes()), "json"_kj);
  }) == 400);
  KJ_EXPECT(f.queue("queue").getPending().size() == 0);

  // A message exactly at the limit is fine, and no content type means opaque.
  f.broker.enqueueOne("queue", kj::heapArray<kj::byte>(MAX_MESSAGE_SIZE_BYTES), kj::none);
  auto pending = f.queue("queue").getPending();
  KJ_ASSERT(pending.size() == 1);
  KJ_EXPECT(pending[0].getContentType() == ContentType::OPAQUE);
}

KJ_TEST("batches are validated and rejected atomically") {
  QueueFixture f;
  f.attach("queue", 100);

  auto tooMany = kj::heapArrayBuilder<IncomingMessage>(MAX_MESSAGE_BATCH_COUNT + 1);
  for (size_t i = 0; i < MAX_MESSAGE_BATCH_COUNT + 1; i++) {
    tooMany.add(incoming("x"));
  }
  KJ_EXPECT(statusOf([&]() { f.broker.enqueueBatch("queue", tooMany.finish()); }) == 413);

  // Three 100kB messages are each within limits but too large together.
  auto tooLarge = kj::heapArrayBuilder<IncomingMessage>(3);
  for (size_t i = 0; i < 3; i++) {
    tooLarge.add(IncomingMessage{
      .contentType = ContentType::BYTES,
      .body = kj::heapArray<kj::byte>(100000),
    });
  }
  KJ_EXPECT(statusOf([&]() { f.broker.enqueueBatch("queue", tooLarge.finish()); }) == 413);

  // One undecodable body rejects the whole batch.
  auto badJson = kj::heapArrayBuilder<IncomingMessage>(2);
  badJson.add(incoming("{\"ok\":true}", ContentType::JSON));
  badJson.add(incoming("{\"ok\":", ContentType::JSON));
  KJ_EXPECT(statusOf([&]() { f.broker.enqueueBatch("queue", badJson.finish()); }) == 400);

  KJ_EXPECT(f.queue("queue").getPending().size() == 0);

  auto good = kj::heapArrayBuilder<IncomingMessage>(3);
  good.add(incoming("one"));
  good.add(incoming("{\"two\":2}", ContentType::JSON));
  good.add(incoming("three", ContentType::BYTES));
  f.broker.enqueueBatch("queue", good.finish());

  auto pending = f.queue("queue").getPending();
  KJ_ASSERT(pending.size() == 3);
  KJ_EXPECT(pending[0].getContentType() == ContentType::TEXT);
  KJ_EXPECT(pending[1].getContentType() == ContentType::JSON);
  KJ_EXPECT(pending[2].getContentType() == ContentType::BYTES);
}

KJ_TEST("messages to a queue without a consumer are discarded") {
  QueueFixture f;
  f.send("nobody", "hello");
  KJ_EXPECT(f.queue("nobody").getPending().size() == 0);
  KJ_EXPECT(f.queue("nobody").getFlushState() == FlushState::IDLE);

  // Limits still apply.
  KJ_EXPECT(statusOf([&]() {
    f.broker.enqueueOne("nobody", kj::heapArray("hi"_kj.asBytes()), "xml"_kj);
  }) == 400);
  KJ_EXPECT(statusOf([&]() {
    auto body = kj::heapArray<kj::byte>(MAX_MESSAGE_SIZE_BYTES + 1);
    f.broker.enqueueOne("nobody", kj::mv(body), "bytes"_kj);
  }) == 413);

  // Bodies are never decoded, so malformed JSON is accepted and dropped too.
  f.broker.enqueueOne("nobody", kj::heapArray("{not json"_kj.asBytes()), "json"_kj);
  KJ_EXPECT(f.queue("nobody").getPending().size() == 0);
}

KJ_TEST("exhausted messages move to the dead letter queue") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 1, "DLQ"_kj);
  consumer.respond = [](const FakeDispatcher::Call& call) { return retryEverything(call); };
  auto& deadLetters = f.attach("DLQ");

  f.send("queue", "message1");
  auto id = kj::str(f.queue("queue").getPending()[0].getId());

  f.advance(1 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 1);
  KJ_EXPECT(f.queue("queue").getPending().size() == 1);

  {
    auto expected = kj::str("Moving message \"", id,
        "\" on queue \"queue\" to dead letter queue \"DLQ\" after 2 failed attempts...");
    KJ_EXPECT_LOG(WARNING, expected);
    f.advance(1 * kj::SECONDS);
  }
  KJ_EXPECT(consumer.calls.size() == 2);
  KJ_EXPECT(f.queue("queue").getPending().size() == 0);

  // The move happened on a later turn, and arrived as a fresh message with the same identity.
  auto pending = f.queue("DLQ").getPending();
  KJ_ASSERT(pending.size() == 1);
  KJ_EXPECT(pending[0].getId() == id);
  KJ_EXPECT(pending[0].getTimestamp() == kj::UNIX_EPOCH);
  KJ_EXPECT(pending[0].getFailedAttempts() == 0);
  KJ_EXPECT(f.queue("DLQ").getFlushState() == FlushState::DELAYED);

  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(deadLetters.calls.size() == 1);
  auto& call = deadLetters.calls[0];
  KJ_EXPECT(call.queue == "DLQ");
  KJ_ASSERT(call.messages.size() == 1);
  KJ_EXPECT(call.messages[0].id == id);
  KJ_EXPECT(call.messages[0].timestamp == kj::UNIX_EPOCH);
  KJ_EXPECT(call.messages[0].contentType == ContentType::TEXT);
  KJ_EXPECT(call.text(0) == "message1");

  // The original queue stays quiet.
  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 2);
}

KJ_TEST("dead letter forwards skip batch limits") {
  QueueFixture f;
  f.attach("DLQ", 100);

  auto messages = kj::heapArrayBuilder<SerializedMessage>(MAX_MESSAGE_BATCH_COUNT + 1);
  for (size_t i = 0; i < MAX_MESSAGE_BATCH_COUNT + 1; i++) {
    messages.add(SerializedMessage{
      .id = kj::str("id", i),
      .timestamp = kj::UNIX_EPOCH + int64_t(i) * kj::SECONDS,
      .contentType = ContentType::OPAQUE,
      .body = kj::str("AAE="),
    });
  }
  f.broker.forward("DLQ", messages.finish());

  auto pending = f.queue("DLQ").getPending();
  KJ_ASSERT(pending.size() == MAX_MESSAGE_BATCH_COUNT + 1);
  KJ_EXPECT(pending[7].getId() == "id7");
  KJ_EXPECT(pending[7].getTimestamp() == kj::UNIX_EPOCH + 7 * kj::SECONDS);
  KJ_EXPECT(f.queue("DLQ").getFlushState() == FlushState::IMMEDIATE);
}

KJ_TEST("dead letter queue without a consumer drops forwarded messages") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 0, "DLQ"_kj);
  consumer.respond = [](const FakeDispatcher::Call& call) { return retryEverything(call); };

  f.send("queue", "message1");
  f.advance(1 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 1);
  KJ_EXPECT(f.queue("DLQ").getPending().size() == 0);
}

KJ_TEST("resetConsumers detaches every queue") {
  QueueFixture f;
  auto& a = f.attach("a");
  auto& b = f.attach("b");
  f.send("a", "one");
  f.sendMany("b", 5);

  f.broker.resetConsumers();
  KJ_EXPECT(f.queue("a").getConsumer() == kj::none);
  KJ_EXPECT(f.queue("b").getConsumer() == kj::none);
  KJ_EXPECT(f.queue("b").getFlushState() == FlushState::IDLE);

  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(a.calls.size() == 0);
  KJ_EXPECT(b.calls.size() == 0);
}

KJ_TEST("dispose cancels timers and rejects ingress") {
  QueueFixture f;
  auto& consumer = f.attach("queue");
  f.sendMany("queue", 2);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  f.broker.dispose();
  KJ_EXPECT(f.broker.isDisposed());
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IDLE);

  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 0);

  KJ_EXPECT_THROW(DISCONNECTED, f.send("queue", "too late"));
  KJ_EXPECT_THROW(DISCONNECTED, f.broker.enqueueBatch("queue", kj::heapArray<IncomingMessage>(0)));
}

KJ_TEST("retries of an in-flight batch are not dispatched after dispose") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 2);
  consumer.holdResponses = true;

  f.send("queue", "message1");
  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(consumer.held.size() == 1);

  f.broker.dispose();
  QueueResponse response;
  response.retryAll = true;
  consumer.held[0]->fulfill(kj::mv(response));
  f.poll();

  // The retry is back in the buffer, but nothing is scheduled to send it.
  KJ_EXPECT(f.queue("queue").getPending().size() == 1);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IDLE);

  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 1);
}

KJ_TEST("dead letter forward after dispose is reported") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 0, "DLQ"_kj);
  consumer.holdResponses = true;
  f.attach("DLQ");

  f.send("queue", "message1");
  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(consumer.held.size() == 1);

  // The in-flight dispatch survives dispose, but its messages have nowhere to go.
  f.broker.dispose();
  QueueResponse response;
  response.retryAll = true;
  consumer.held[0]->fulfill(kj::mv(response));
  {
    KJ_EXPECT_LOG(WARNING, "to dead letter queue \"DLQ\" after 1 failed attempt...");
    KJ_EXPECT_LOG(ERROR, "queue broker has been disposed");
    f.poll();
  }
  KJ_EXPECT(f.queue("DLQ").getPending().size() == 0);
}

}  // namespace
}  // namespace queuesim::test
