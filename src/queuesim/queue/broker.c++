// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "broker.h"

#include "limits.h"

#include <queuesim/util/entropy.h>

#include <kj/debug.h>

namespace queuesim {

QueueBroker::QueueBroker(
    kj::Timer& timer, const kj::Clock& clock, kj::Maybe<kj::EntropySource&> entropySource)
    : timer(timer),
      clock(clock),
      entropySource(entropySource),
      tasks(*this) {}

QueueBroker::~QueueBroker() noexcept(false) {}

Queue& QueueBroker::getOrCreateQueue(kj::StringPtr name) {
  return *queues.findOrCreate(name, [&]() -> decltype(queues)::Entry {
    auto queue = kj::heap<Queue>(*this, kj::str(name));
    return {kj::str(name), kj::mv(queue)};
  });
}

kj::Maybe<Queue&> QueueBroker::tryGetQueue(kj::StringPtr name) {
  KJ_IF_SOME(queue, queues.find(name)) {
    return *queue;
  }
  return kj::none;
}

void QueueBroker::setConsumer(kj::StringPtr queueName, Consumer consumer) {
  getOrCreateQueue(queueName).setConsumer(kj::mv(consumer));
}

void QueueBroker::removeConsumer(kj::StringPtr queueName) {
  KJ_IF_SOME(queue, tryGetQueue(queueName)) {
    queue.removeConsumer();
  }
}

void QueueBroker::resetConsumers() {
  for (auto& entry: queues) {
    entry.value->removeConsumer();
  }
}

void QueueBroker::enqueueOne(
    kj::StringPtr queueName, kj::Array<kj::byte> body, kj::Maybe<kj::StringPtr> contentType) {
  requireOpen();
  validateMessageSize(body.size());
  auto type = validateContentType(contentType);

  auto messages = kj::heapArrayBuilder<IncomingMessage>(1);
  messages.add(IncomingMessage{
    .contentType = type,
    .body = kj::mv(body),
  });
  getOrCreateQueue(queueName).enqueue(messages.finish());
}

void QueueBroker::enqueueBatch(kj::StringPtr queueName, kj::Array<IncomingMessage> messages) {
  requireOpen();
  validateBatchSize(describeBatch(messages));
  getOrCreateQueue(queueName).enqueue(kj::mv(messages));
}

void QueueBroker::forward(kj::StringPtr queueName, kj::ArrayPtr<const SerializedMessage> messages) {
  requireOpen();
  auto incoming = KJ_MAP(message, messages) { return IncomingMessage::fromSerialized(message); };
  getOrCreateQueue(queueName).enqueue(kj::mv(incoming));
}

void QueueBroker::dispose() {
  disposed = true;
  for (auto& entry: queues) {
    entry.value->cancelPendingFlush();
  }
}

kj::String QueueBroker::newMessageId() {
  return randomMessageId(entropySource);
}

void QueueBroker::requireOpen() {
  if (disposed) {
    kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "queue broker has been disposed"));
  }
}

void QueueBroker::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, kj::str("Queue flush failed: ", exception));
}

}  // namespace queuesim
