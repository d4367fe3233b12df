// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "message.h"

#include <queuesim/queue/queue.capnp.h>

#include <kj/async.h>
#include <kj/refcount.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace queuesim {

class QueueBroker;

// What a consumer reports back about a batch.
struct QueueResponse {
  rpc::EventOutcome outcome = rpc::EventOutcome::OK;
  bool retryAll = false;
  bool ackAll = false;
  kj::Array<kj::String> explicitRetries;
  kj::Array<kj::String> explicitAcks;
};

// The downstream target of a queue's batches.
class QueueDispatcher: public kj::Refcounted {
 public:
  virtual ~QueueDispatcher() noexcept(false) = default;

  // Delivers one batch. Throwing or rejecting counts as a failed delivery of the whole batch.
  virtual kj::Promise<QueueResponse> dispatch(
      kj::StringPtr queueName, kj::Array<SerializedMessage> messages) = 0;
};

// How a queue's batches are delivered.
struct Consumer {
  // In [0, 100]. Zero behaves like one, so a flush always makes progress.
  uint maxBatchSize = 5;

  // In [0, 30] seconds.
  kj::Duration maxBatchTimeout = 1 * kj::SECONDS;

  // In [0, 100]. A message gets up to maxRetries + 1 delivery attempts.
  uint maxRetries = 2;

  kj::Maybe<kj::String> deadLetterQueue;

  kj::Own<QueueDispatcher> dispatcher;

  uint getBatchSize() const {
    return kj::max(maxBatchSize, 1u);
  }
  uint getMaxAttempts() const {
    return maxRetries + 1;
  }
};

// A named queue: an ordered buffer of pending messages, the consumer draining it, and the flush
// that's currently scheduled, if any.
//
// Ingress never dispatches directly. Every append goes through ensurePendingFlush(), which arms
// either a delayed flush (maxBatchTimeout from now) or an immediate one (next event loop turn)
// once a full batch is buffered. When the flush fires the queue goes back to IDLE before the
// batch is dispatched, so messages arriving during a dispatch schedule the next flush normally.
class Queue {
 public:
  Queue(QueueBroker& broker, kj::String name);
  ~Queue() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(Queue);

  enum class FlushState {
    IDLE,
    DELAYED,
    IMMEDIATE,
  };

  kj::StringPtr getName() const {
    return name;
  }
  kj::Maybe<const Consumer&> getConsumer() const;
  kj::ArrayPtr<const QueueMessage> getPending() const {
    return pending.asPtr();
  }
  FlushState getFlushState() const;

  // Attaches or replaces the consumer. Doesn't schedule a flush by itself.
  void setConsumer(Consumer consumer);

  // Detaches the consumer and cancels any scheduled flush. Buffered messages stay where they are.
  void removeConsumer();

  // Cancels the scheduled flush, if any, without dispatching anything.
  void cancelPendingFlush();

  // Appends messages to the tail of the buffer, assigning ids and timestamps where missing, then
  // updates the flush schedule. With no consumer attached the messages are discarded. Bodies are
  // all decoded before anything is appended, so a bad body rejects the whole call.
  void enqueue(kj::Array<IncomingMessage> messages);

 private:
  struct PendingFlush {
    bool immediate;
    kj::Promise<void> task;
  };

  QueueBroker& broker;
  kj::String name;
  kj::Vector<QueueMessage> pending;
  kj::Maybe<Consumer> consumer;
  kj::Maybe<PendingFlush> pendingFlush;

  void ensurePendingFlush();
  kj::Promise<void> runPendingFlush(kj::Promise<void> trigger);
  kj::Promise<void> flush();

  kj::Vector<QueueMessage> takeBatch(size_t batchSize);
};

}  // namespace queuesim
