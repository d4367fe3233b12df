// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "queue.h"

#include <kj/async.h>
#include <kj/map.h>
#include <kj/timer.h>

namespace kj {
class EntropySource;
}

namespace queuesim {

// Owns every queue of a simulated account, keyed by name, plus the timer, clock and task set
// they schedule their flushes with. Queues are created lazily on first reference.
//
// Everything runs on the event loop the broker was created on.
class QueueBroker final: private kj::TaskSet::ErrorHandler {
 public:
  // `entropySource` replaces the system CSPRNG for message ids (tests use a mock one).
  QueueBroker(kj::Timer& timer,
      const kj::Clock& clock,
      kj::Maybe<kj::EntropySource&> entropySource = kj::none);
  ~QueueBroker() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(QueueBroker);

  Queue& getOrCreateQueue(kj::StringPtr name);
  kj::Maybe<Queue&> tryGetQueue(kj::StringPtr name);

  void setConsumer(kj::StringPtr queueName, Consumer consumer);
  void removeConsumer(kj::StringPtr queueName);

  // Detaches the consumers of every queue.
  void resetConsumers();

  // Producer operations. Both validate against the ingress limits first and throw without
  // buffering anything if a limit is exceeded.
  void enqueueOne(
      kj::StringPtr queueName, kj::Array<kj::byte> body, kj::Maybe<kj::StringPtr> contentType);
  void enqueueBatch(kj::StringPtr queueName, kj::Array<IncomingMessage> messages);

  // Re-enqueues messages that exhausted their retries elsewhere. Ids and timestamps are kept and
  // batch limits are not applied.
  void forward(kj::StringPtr queueName, kj::ArrayPtr<const SerializedMessage> messages);

  // Cancels every scheduled flush. Afterwards all ingress throws DISCONNECTED. Dispatches already
  // in flight run to completion.
  void dispose();

  bool isDisposed() const {
    return disposed;
  }

  kj::Timer& getTimer() {
    return timer;
  }
  kj::Date now() const {
    return clock.now();
  }
  kj::String newMessageId();

 private:
  kj::Timer& timer;
  const kj::Clock& clock;
  kj::Maybe<kj::EntropySource&> entropySource;
  bool disposed = false;

  kj::HashMap<kj::String, kj::Own<Queue>> queues;

  // Flushes that have started dispatching. Declared after `queues` so it is destroyed first.
  kj::TaskSet tasks;

  void requireOpen();
  void taskFailed(kj::Exception&& exception) override;

  friend class Queue;
};

}  // namespace queuesim
