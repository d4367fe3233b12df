// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "queue.h"

#include "broker.h"

#include <kj/debug.h>
#include <kj/map.h>

namespace queuesim {

namespace {

kj::StringPtr attemptsSuffix(uint attempts) {
  return attempts == 1 ? ""_kj : "s"_kj;
}

}  // namespace

Queue::Queue(QueueBroker& broker, kj::String name): broker(broker), name(kj::mv(name)) {}

Queue::~Queue() noexcept(false) {}

kj::Maybe<const Consumer&> Queue::getConsumer() const {
  KJ_IF_SOME(c, consumer) {
    return c;
  }
  return kj::none;
}

Queue::FlushState Queue::getFlushState() const {
  KJ_IF_SOME(flush, pendingFlush) {
    return flush.immediate ? FlushState::IMMEDIATE : FlushState::DELAYED;
  }
  return FlushState::IDLE;
}

void Queue::setConsumer(Consumer newConsumer) {
  KJ_REQUIRE(newConsumer.dispatcher.get() != nullptr, "consumer has no dispatcher", name);
  consumer = kj::mv(newConsumer);
}

void Queue::removeConsumer() {
  consumer = kj::none;
  cancelPendingFlush();
}

void Queue::cancelPendingFlush() {
  pendingFlush = kj::none;
}

void Queue::enqueue(kj::Array<IncomingMessage> messages) {
  if (consumer == kj::none) return;

  auto decoded = kj::heapArrayBuilder<QueueMessage>(messages.size());
  for (auto& message: messages) {
    kj::String id;
    KJ_IF_SOME(i, message.id) {
      id = kj::mv(i);
    } else {
      id = broker.newMessageId();
    }
    auto timestamp = message.timestamp.orDefault(broker.now());
    decoded.add(kj::mv(id), timestamp, deserialize(message.contentType, kj::mv(message.body)));
  }

  for (auto& message: decoded) {
    pending.add(kj::mv(message));
  }
  ensurePendingFlush();
}

void Queue::ensurePendingFlush() {
  // A disposed broker finishes in-flight dispatches but never starts new ones.
  if (broker.isDisposed()) return;

  auto& c = KJ_ASSERT_NONNULL(consumer);
  bool full = pending.size() >= c.getBatchSize();

  KJ_IF_SOME(flush, pendingFlush) {
    if (flush.immediate || !full) return;
  }

  // Assigning the slot destroys the previous task, which cancels its timer.
  if (full) {
    pendingFlush = PendingFlush{
      .immediate = true,
      .task = runPendingFlush(kj::evalLater([]() {})),
    };
  } else {
    pendingFlush = PendingFlush{
      .immediate = false,
      .task = runPendingFlush(broker.getTimer().afterDelay(c.maxBatchTimeout)),
    };
  }
}

kj::Promise<void> Queue::runPendingFlush(kj::Promise<void> trigger) {
  co_await trigger;

  // We can't clear our slot before moving ourselves out of it, as a promise cannot delete itself.
  auto& slot = KJ_ASSERT_NONNULL(pendingFlush);
  broker.tasks.add(kj::mv(slot.task));
  pendingFlush = kj::none;

  co_await flush();
}

kj::Vector<QueueMessage> Queue::takeBatch(size_t batchSize) {
  size_t count = kj::min(batchSize, pending.size());
  kj::Vector<QueueMessage> batch(count);
  kj::Vector<QueueMessage> rest(pending.size() - count);
  for (size_t i = 0; i < pending.size(); i++) {
    if (i < count) {
      batch.add(kj::mv(pending[i]));
    } else {
      rest.add(kj::mv(pending[i]));
    }
  }
  pending = kj::mv(rest);
  return batch;
}

kj::Promise<void> Queue::flush() {
  // Everything the reconciler needs is copied out before the dispatch suspends us, since the
  // consumer may be replaced or removed while the batch is in flight.
  auto& c = KJ_REQUIRE_NONNULL(consumer, "flushing a queue without a consumer", name);
  auto maxAttempts = c.getMaxAttempts();
  auto deadLetterQueue = c.deadLetterQueue.map([](const kj::String& dlq) { return kj::str(dlq); });
  auto dispatcher = kj::addRef(*c.dispatcher);

  auto batch = takeBatch(c.getBatchSize());
  auto serialized = KJ_MAP(message, batch) { return message.serialize(); };

  auto startTime = broker.getTimer().now();
  auto response = co_await kj::evalNow([&]() {
    return dispatcher->dispatch(name, kj::mv(serialized));
  }).catch_([&](kj::Exception&& exception) {
    KJ_LOG(ERROR, kj::str("Consumer of queue \"", name, "\" failed: ", exception));
    return QueueResponse{.outcome = rpc::EventOutcome::EXCEPTION};
  });
  auto elapsed = broker.getTimer().now() - startTime;

  bool retryAll = response.retryAll || response.outcome != rpc::EventOutcome::OK;
  kj::HashSet<kj::StringPtr> explicitRetries;
  for (auto& id: response.explicitRetries) {
    if (!explicitRetries.contains(id)) explicitRetries.insert(id);
  }

  size_t failed = 0;
  kj::Vector<QueueMessage> toRetry;
  kj::Vector<SerializedMessage> toDeadLetter;
  for (auto& message: batch) {
    if (!retryAll && !explicitRetries.contains(message.getId())) continue;

    ++failed;
    auto attempts = message.incrementFailedAttempts();
    if (attempts < maxAttempts) {
      KJ_LOG(DBG, kj::str("Retrying message \"", message.getId(), "\" on queue \"", name, "\"..."));
      toRetry.add(kj::mv(message));
    } else KJ_IF_SOME(dlq, deadLetterQueue) {
      KJ_LOG(WARNING,
          kj::str("Moving message \"", message.getId(), "\" on queue \"", name,
              "\" to dead letter queue \"", dlq, "\" after ", attempts, " failed attempt",
              attemptsSuffix(attempts), "..."));
      toDeadLetter.add(message.serialize());
    } else {
      KJ_LOG(WARNING,
          kj::str("Dropped message \"", message.getId(), "\" on queue \"", name, "\" after ",
              attempts, " failed attempt", attemptsSuffix(attempts), "!"));
    }
  }

  KJ_LOG(INFO,
      kj::str("QUEUE ", name, " ", batch.size() - failed, "/", batch.size(), " (",
          elapsed / kj::MILLISECONDS, "ms)"));

  for (auto& message: toRetry) {
    pending.add(kj::mv(message));
  }
  if (pending.size() > 0 && consumer != kj::none) {
    ensurePendingFlush();
  }

  KJ_IF_SOME(dlq, deadLetterQueue) {
    if (toDeadLetter.size() > 0) {
      // Posted to a later turn so the dead letter queue never runs inside our own flush.
      auto messages = toDeadLetter.releaseAsArray();
      co_await kj::evalLater([this, &dlq, &messages]() { broker.forward(dlq, messages); });
    }
  }
}

}  // namespace queuesim
