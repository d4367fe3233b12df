// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "broker.h"

#include <queuesim/util/entropy.h>

#include <kj/async.h>
#include <kj/encoding.h>
#include <kj/function.h>
#include <kj/random.h>
#include <kj/test.h>
#include <kj/timer.h>
#include <kj/vector.h>

namespace queuesim::test {

// A calendar clock that follows the virtual timer, starting at the Unix epoch.
class FakeClock final: public kj::Clock {
 public:
  explicit FakeClock(kj::Timer& timer): timer(timer) {}

  kj::Date now() const override {
    return kj::UNIX_EPOCH + (timer.now() - kj::origin<kj::TimePoint>());
  }

 private:
  kj::Timer& timer;
};

// Records every batch it receives. Answers with `respond`, or holds the batch until the test
// fulfills it when `holdResponses` is set.
class FakeDispatcher final: public QueueDispatcher {
 public:
  struct Call {
    kj::String queue;
    kj::Array<SerializedMessage> messages;
    kj::TimePoint time;

    kj::Array<kj::String> ids() const {
      return KJ_MAP(message, messages) { return kj::str(message.id); };
    }
    kj::String idList() const {
      return kj::strArray(ids(), ",");
    }
    kj::String text(size_t i) const {
      auto decoded = kj::decodeBase64(messages[i].body);
      return kj::heapString(decoded.asChars());
    }
  };

  explicit FakeDispatcher(kj::Timer& timer): timer(timer) {}

  kj::Vector<Call> calls;
  kj::Function<kj::Promise<QueueResponse>(const Call&)> respond = [](const Call&) {
    return kj::Promise<QueueResponse>(QueueResponse{});
  };

  bool holdResponses = false;
  kj::Vector<kj::Own<kj::PromiseFulfiller<QueueResponse>>> held;

  kj::Promise<QueueResponse> dispatch(
      kj::StringPtr queueName, kj::Array<SerializedMessage> messages) override {
    calls.add(Call{kj::str(queueName), kj::mv(messages), timer.now()});
    if (holdResponses) {
      auto paf = kj::newPromiseAndFulfiller<QueueResponse>();
      held.add(kj::mv(paf.fulfiller));
      return kj::mv(paf.promise);
    }
    return respond(calls.back());
  }

  // Sizes of every batch received so far, e.g. "5,5,2".
  kj::String batchSizes() const {
    auto sizes = KJ_MAP(call, calls) { return call.messages.size(); };
    return kj::strArray(sizes, ",");
  }

 private:
  kj::Timer& timer;
};

// An event loop with a virtual timer and a broker running on it.
struct QueueFixture {
  kj::EventLoop loop;
  kj::WaitScope waitScope{loop};
  kj::TimerImpl timer{kj::origin<kj::TimePoint>()};
  FakeClock clock{timer};
  kj::Own<kj::EntropySource> entropy = getMockEntropySource();

  // Keeps every dispatcher alive for the whole test, even after its consumer is detached.
  kj::Vector<kj::Own<FakeDispatcher>> dispatchers;

  QueueBroker broker{timer, clock, *entropy};

  kj::Own<FakeDispatcher> newDispatcher() {
    auto dispatcher = kj::refcounted<FakeDispatcher>(timer);
    dispatchers.add(kj::addRef(*dispatcher));
    return dispatcher;
  }

  FakeDispatcher& attach(kj::StringPtr queueName,
      uint maxBatchSize = 5,
      kj::Duration maxBatchTimeout = 1 * kj::SECONDS,
      uint maxRetries = 2,
      kj::Maybe<kj::StringPtr> deadLetterQueue = kj::none) {
    auto dispatcher = newDispatcher();
    auto& result = *dispatcher;
    broker.setConsumer(queueName,
        Consumer{
          .maxBatchSize = maxBatchSize,
          .maxBatchTimeout = maxBatchTimeout,
          .maxRetries = maxRetries,
          .deadLetterQueue = deadLetterQueue.map([](kj::StringPtr name) { return kj::str(name); }),
          .dispatcher = kj::mv(dispatcher),
        });
    return result;
  }

  void send(kj::StringPtr queueName, kj::StringPtr text) {
    broker.enqueueOne(queueName, kj::heapArray(text.asBytes()), "text"_kj);
  }

  void sendMany(kj::StringPtr queueName, size_t count) {
    for (size_t i = 0; i < count; i++) {
      send(queueName, kj::str("message", i));
    }
  }

  void poll() {
    waitScope.poll();
  }

  void advance(kj::Duration duration) {
    timer.advanceTo(timer.now() + duration);
    waitScope.poll();
  }

  Queue& queue(kj::StringPtr name) {
    return KJ_ASSERT_NONNULL(broker.tryGetQueue(name));
  }
};

}  // namespace queuesim::test
