// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "test-fixture.h"

#include <kj/debug.h>
#include <kj/test.h>

namespace queuesim::test {
namespace {

using FlushState = Queue::FlushState;

constexpr kj::TimePoint START = kj::origin<kj::TimePoint>();

KJ_TEST("full batch is dispatched on the next turn") {
  QueueFixture f;
  auto& consumer = f.attach("queue");

  f.sendMany("queue", 5);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IMMEDIATE);
  KJ_EXPECT(consumer.calls.size() == 0);

  f.poll();
  KJ_ASSERT(consumer.calls.size() == 1);
  auto& call = consumer.calls[0];
  KJ_EXPECT(call.queue == "queue");
  KJ_EXPECT(call.time == START);
  KJ_ASSERT(call.messages.size() == 5);
  for (size_t i = 0; i < 5; i++) {
    KJ_EXPECT(call.text(i) == kj::str("message", i));
    KJ_EXPECT(call.messages[i].contentType == ContentType::TEXT);
  }

  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IDLE);
  KJ_EXPECT(f.queue("queue").getPending().size() == 0);
}

KJ_TEST("partial batch is dispatched after maxBatchTimeout") {
  QueueFixture f;
  auto& consumer = f.attach("queue");

  f.sendMany("queue", 3);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  f.advance(999 * kj::MILLISECONDS);
  KJ_EXPECT(consumer.calls.size() == 0);

  f.advance(1 * kj::MILLISECONDS);
  KJ_ASSERT(consumer.calls.size() == 1);
  KJ_EXPECT(consumer.calls[0].messages.size() == 3);
  KJ_EXPECT(consumer.calls[0].time == START + 1 * kj::SECONDS);
}

KJ_TEST("twelve messages go out as [5, 5, 2] in order") {
  QueueFixture f;
  auto& consumer = f.attach("queue");

  f.sendMany("queue", 12);
  f.poll();
  KJ_EXPECT(consumer.batchSizes() == "5,5");
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  f.advance(1 * kj::SECONDS);
  KJ_EXPECT(consumer.batchSizes() == "5,5,2");
  KJ_EXPECT(consumer.calls[0].time == START);
  KJ_EXPECT(consumer.calls[1].time == START);
  KJ_EXPECT(consumer.calls[2].time == START + 1 * kj::SECONDS);

  size_t n = 0;
  for (auto& call: consumer.calls) {
    for (size_t i = 0; i < call.messages.size(); i++) {
      KJ_EXPECT(call.text(i) == kj::str("message", n++));
    }
  }
}

KJ_TEST("delayed flush is promoted once the batch fills") {
  QueueFixture f;
  auto& consumer = f.attach("queue");

  f.sendMany("queue", 2);
  f.advance(500 * kj::MILLISECONDS);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  f.sendMany("queue", 3);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IMMEDIATE);
  f.poll();
  KJ_EXPECT(consumer.batchSizes() == "5");
  KJ_EXPECT(consumer.calls[0].time == START + 500 * kj::MILLISECONDS);

  // The original timer was canceled along with the delayed flush.
  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 1);
}

KJ_TEST("zero maxBatchTimeout still waits for the timer") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 0 * kj::SECONDS);

  f.send("queue", "hello");
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);
  f.advance(0 * kj::SECONDS);
  KJ_EXPECT(consumer.batchSizes() == "1");
}

KJ_TEST("zero maxBatchSize behaves like one") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 0);

  f.sendMany("queue", 3);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IMMEDIATE);
  f.poll();
  KJ_EXPECT(consumer.batchSizes() == "1,1,1");
}

KJ_TEST("messages sent during a dispatch are not lost") {
  QueueFixture f;
  auto& consumer = f.attach("queue");
  consumer.holdResponses = true;

  f.sendMany("queue", 5);
  f.poll();
  KJ_ASSERT(consumer.calls.size() == 1);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IDLE);

  // The first batch is still in flight. New messages schedule their own flush.
  f.send("queue", "late");
  KJ_EXPECT(f.queue("queue").getPending().size() == 1);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(consumer.calls.size() == 2);
  KJ_EXPECT(consumer.calls[1].text(0) == "late");

  for (auto& fulfiller: consumer.held) {
    fulfiller->fulfill(QueueResponse{});
  }
  f.poll();
  KJ_EXPECT(f.queue("queue").getPending().size() == 0);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IDLE);
}

KJ_TEST("a consumer can send to its own queue while handling a batch") {
  QueueFixture f;
  auto& consumer = f.attach("queue");
  bool sent = false;
  consumer.respond = [&](const FakeDispatcher::Call&) {
    if (!sent) {
      sent = true;
      f.send("queue", "inner");
      // Buffered right away and scheduled on its own, even though the batch is still in flight.
      KJ_EXPECT(f.queue("queue").getPending().size() == 1);
      KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);
    }
    return kj::Promise<QueueResponse>(QueueResponse{});
  };

  f.sendMany("queue", 5);
  f.poll();
  KJ_ASSERT(consumer.calls.size() == 1);
  KJ_EXPECT(consumer.calls[0].messages.size() == 5);
  for (size_t i = 0; i < 5; i++) {
    KJ_EXPECT(consumer.calls[0].text(i) != "inner");
  }

  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(consumer.calls.size() == 2);
  KJ_ASSERT(consumer.calls[1].messages.size() == 1);
  KJ_EXPECT(consumer.calls[1].text(0) == "inner");

  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(consumer.batchSizes() == "5,1");
  KJ_EXPECT(f.queue("queue").getPending().size() == 0);
}

KJ_TEST("retried messages go to the back of the queue") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 10);
  consumer.holdResponses = true;

  f.sendMany("queue", 5);
  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(consumer.calls.size() == 1);
  f.sendMany("queue", 2);

  auto retried = consumer.calls[0].ids();
  QueueResponse response;
  response.retryAll = true;
  consumer.held[0]->fulfill(kj::mv(response));
  f.poll();

  auto pending = f.queue("queue").getPending();
  KJ_ASSERT(pending.size() == 7);
  KJ_EXPECT(pending[0].getFailedAttempts() == 0);
  KJ_EXPECT(pending[1].getFailedAttempts() == 0);
  for (size_t i = 0; i < 5; i++) {
    KJ_EXPECT(pending[i + 2].getId() == retried[i]);
    KJ_EXPECT(pending[i + 2].getFailedAttempts() == 1);
  }
}

KJ_TEST("consumer exception retries the whole batch") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 2);
  consumer.respond = [](const FakeDispatcher::Call& call) -> kj::Promise<QueueResponse> {
    if (call.messages.size() > 0) {
      KJ_FAIL_REQUIRE("consumer blew up");
    }
    return QueueResponse{};
  };

  f.sendMany("queue", 2);
  {
    KJ_EXPECT_LOG(ERROR, "Consumer of queue \"queue\" failed");
    f.advance(1 * kj::SECONDS);
  }
  KJ_EXPECT(consumer.calls.size() == 1);
  KJ_EXPECT(f.queue("queue").getPending().size() == 2);

  // A rejected promise is treated the same as a synchronous throw.
  consumer.respond = [](const FakeDispatcher::Call&) -> kj::Promise<QueueResponse> {
    return KJ_EXCEPTION(FAILED, "consumer rejected");
  };
  {
    KJ_EXPECT_LOG(ERROR, "consumer rejected");
    f.advance(1 * kj::SECONDS);
  }
  KJ_EXPECT(consumer.calls.size() == 2);
  KJ_EXPECT(consumer.calls[1].idList() == consumer.calls[0].idList());

  {
    KJ_EXPECT_LOG(ERROR, "consumer rejected");
    KJ_EXPECT_LOG(WARNING, "after 3 failed attempts!");
    KJ_EXPECT_LOG(WARNING, "after 3 failed attempts!");
    f.advance(1 * kj::SECONDS);
  }
  KJ_EXPECT(consumer.calls.size() == 3);
  KJ_EXPECT(f.queue("queue").getPending().size() == 0);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IDLE);
}

KJ_TEST("outcome other than ok retries the whole batch") {
  QueueFixture f;
  auto& consumer = f.attach("queue");
  consumer.respond = [](const FakeDispatcher::Call&) -> kj::Promise<QueueResponse> {
    QueueResponse response;
    response.outcome = rpc::EventOutcome::EXCEEDED_CPU;
    // Acks don't override a failed outcome.
    response.ackAll = true;
    return kj::mv(response);
  };

  f.sendMany("queue", 3);
  f.advance(1 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 1);

  auto pending = f.queue("queue").getPending();
  KJ_ASSERT(pending.size() == 3);
  for (auto& message: pending) {
    KJ_EXPECT(message.getFailedAttempts() == 1);
  }
}

KJ_TEST("explicit retries only retry the named messages") {
  kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  KJ_DEFER(kj::_::Debug::setLogLevel(kj::LogSeverity::WARNING));

  QueueFixture f;
  auto& consumer = f.attach("queue");
  consumer.respond = [](const FakeDispatcher::Call& call) -> kj::Promise<QueueResponse> {
    QueueResponse response;
    for (size_t i = 0; i < call.messages.size(); i++) {
      if (call.text(i) == "message1") {
        response.explicitRetries = kj::arr(kj::str(call.messages[i].id));
      }
    }
    return kj::mv(response);
  };

  f.sendMany("queue", 3);
  {
    KJ_EXPECT_LOG(INFO, "QUEUE queue 2/3 (0ms)");
    f.advance(1 * kj::SECONDS);
  }
  KJ_ASSERT(consumer.calls.size() == 1);
  auto firstIds = consumer.calls[0].ids();

  auto pending = f.queue("queue").getPending();
  KJ_ASSERT(pending.size() == 1);
  KJ_EXPECT(pending[0].getId() == firstIds[1]);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  // Identity is preserved across the retry.
  {
    KJ_EXPECT_LOG(INFO, "QUEUE queue 0/1 (0ms)");
    f.advance(1 * kj::SECONDS);
  }
  KJ_ASSERT(consumer.calls.size() == 2);
  KJ_EXPECT(consumer.calls[1].messages[0].id == firstIds[1]);
  KJ_EXPECT(consumer.calls[1].messages[0].timestamp == consumer.calls[0].messages[1].timestamp);
}

KJ_TEST("summary reports how long the consumer took") {
  kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  KJ_DEFER(kj::_::Debug::setLogLevel(kj::LogSeverity::WARNING));

  QueueFixture f;
  auto& consumer = f.attach("queue");
  consumer.holdResponses = true;

  f.sendMany("queue", 5);
  f.poll();
  f.advance(250 * kj::MILLISECONDS);
  {
    KJ_EXPECT_LOG(INFO, "QUEUE queue 5/5 (250ms)");
    consumer.held[0]->fulfill(QueueResponse{});
    f.poll();
  }
}

KJ_TEST("retries are bounded by maxRetries") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 1);
  consumer.respond = [](const FakeDispatcher::Call&) -> kj::Promise<QueueResponse> {
    QueueResponse response;
    response.retryAll = true;
    return kj::mv(response);
  };

  f.send("queue", "doomed");
  f.advance(1 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 1);
  {
    KJ_EXPECT_LOG(WARNING,
        "Dropped message \"000102030405060708090a0b0c0d0e0f\" on queue \"queue\" after 2 failed "
        "attempts!");
    f.advance(1 * kj::SECONDS);
  }
  KJ_EXPECT(consumer.calls.size() == 2);

  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 2);
  KJ_EXPECT(f.queue("queue").getPending().size() == 0);
}

KJ_TEST("zero maxRetries means a single attempt") {
  QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 0);
  consumer.respond = [](const FakeDispatcher::Call&) -> kj::Promise<QueueResponse> {
    QueueResponse response;
    response.retryAll = true;
    return kj::mv(response);
  };

  f.send("queue", "once");
  {
    KJ_EXPECT_LOG(WARNING, "after 1 failed attempt!");
    f.advance(1 * kj::SECONDS);
  }
  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(consumer.calls.size() == 1);
}

KJ_TEST("removing the consumer cancels the flush and keeps the buffer") {
  QueueFixture f;
  auto& first = f.attach("queue");

  f.sendMany("queue", 2);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  f.broker.removeConsumer("queue");
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::IDLE);
  KJ_EXPECT(f.queue("queue").getPending().size() == 2);
  KJ_EXPECT(f.queue("queue").getConsumer() == kj::none);

  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(first.calls.size() == 0);

  // Without a consumer new messages are acknowledged and discarded.
  f.send("queue", "ignored");
  KJ_EXPECT(f.queue("queue").getPending().size() == 2);

  // Attaching a consumer doesn't flush by itself; the next message does.
  auto& second = f.attach("queue");
  f.advance(10 * kj::SECONDS);
  KJ_EXPECT(second.calls.size() == 0);

  f.send("queue", "wake up");
  f.advance(1 * kj::SECONDS);
  KJ_ASSERT(second.calls.size() == 1);
  KJ_EXPECT(second.calls[0].messages.size() == 3);
  KJ_EXPECT(second.calls[0].text(2) == "wake up");
}

KJ_TEST("consumer replaced during a dispatch") {
  QueueFixture f;
  auto& first = f.attach("queue", 5, 1 * kj::SECONDS, 5);
  first.holdResponses = true;

  f.sendMany("queue", 5);
  f.poll();
  KJ_ASSERT(first.calls.size() == 1);

  // The in-flight batch is reconciled with the configuration it was dispatched under, and its
  // retries are delivered to whoever consumes the queue next.
  auto& second = f.attach("queue", 10, 2 * kj::SECONDS, 0);
  QueueResponse response;
  response.retryAll = true;
  first.held[0]->fulfill(kj::mv(response));
  f.poll();

  auto pending = f.queue("queue").getPending();
  KJ_ASSERT(pending.size() == 5);
  KJ_EXPECT(f.queue("queue").getFlushState() == FlushState::DELAYED);

  f.advance(1 * kj::SECONDS);
  KJ_EXPECT(second.calls.size() == 0);
  f.advance(1 * kj::SECONDS);
  KJ_EXPECT(second.batchSizes() == "5");
}

}  // namespace
}  // namespace queuesim::test
