// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "config.h"

#include <kj/test.h>

namespace queuesim::server {
namespace {

kj::Array<ConsumerConfig> consumersOf(kj::StringPtr json) {
  capnp::MallocMessageBuilder message;
  return parseConsumers(parseConfig(json, message));
}

KJ_TEST("consumer defaults") {
  capnp::MallocMessageBuilder message;
  auto config = parseConfig(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "worker" } },
                { "name": "ignored" } ],
    "services": [ { "name": "worker", "url": "http://localhost:8080/" } ]
  })",
      message);
  KJ_EXPECT(config.getListen() == "localhost:8787");

  auto consumers = parseConsumers(config);
  KJ_ASSERT(consumers.size() == 1);
  auto& consumer = consumers[0];
  KJ_EXPECT(consumer.queueName == "jobs");
  KJ_EXPECT(consumer.maxBatchSize == 5);
  KJ_EXPECT(consumer.maxBatchTimeout == 1 * kj::SECONDS);
  KJ_EXPECT(consumer.maxRetries == 2);
  KJ_EXPECT(consumer.deadLetterQueue == kj::none);
  KJ_EXPECT(consumer.serviceName == "worker");
  KJ_EXPECT(consumer.serviceUrl == "http://localhost:8080/");
}

KJ_TEST("explicit consumer settings") {
  auto consumers = consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": {
      "service": "worker", "maxBatchSize": 0, "maxBatchTimeout": 2.5, "maxRetries": 100,
      "deadLetterQueue": "jobs-dlq" } } ],
    "services": [ { "name": "worker", "url": "http://localhost:8080/" } ],
    "listen": "*:9000"
  })");
  KJ_ASSERT(consumers.size() == 1);
  KJ_EXPECT(consumers[0].maxBatchSize == 0);
  KJ_EXPECT(consumers[0].maxBatchTimeout == 2500 * kj::MILLISECONDS);
  KJ_EXPECT(consumers[0].maxRetries == 100);
  KJ_EXPECT(KJ_ASSERT_NONNULL(consumers[0].deadLetterQueue) == "jobs-dlq");
}

KJ_TEST("secondsToDuration") {
  KJ_EXPECT(secondsToDuration(0) == 0 * kj::MILLISECONDS);
  KJ_EXPECT(secondsToDuration(0.001) == 1 * kj::MILLISECONDS);
  KJ_EXPECT(secondsToDuration(30) == 30 * kj::SECONDS);
}

KJ_TEST("invalid consumers") {
  KJ_EXPECT_THROW_MESSAGE("Multiple consumers defined for queue \"jobs\"", consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "a" } },
                { "name": "jobs", "consumer": { "service": "a" } } ],
    "services": [ { "name": "a", "url": "http://a/" } ]
  })"));

  KJ_EXPECT_THROW_MESSAGE("Dead letter queue for queue \"jobs\" cannot be itself", consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "a", "deadLetterQueue": "jobs" } } ],
    "services": [ { "name": "a", "url": "http://a/" } ]
  })"));

  KJ_EXPECT_THROW_MESSAGE("refers to unknown service \"b\"", consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "b" } } ],
    "services": [ { "name": "a", "url": "http://a/" } ]
  })"));

  KJ_EXPECT_THROW_MESSAGE("maxBatchSize of queue \"jobs\" must be between 0 and 100",
      consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "a", "maxBatchSize": 101 } } ],
    "services": [ { "name": "a", "url": "http://a/" } ]
  })"));

  KJ_EXPECT_THROW_MESSAGE("maxBatchTimeout of queue \"jobs\" must be between 0 and 30",
      consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "a", "maxBatchTimeout": 30.5 } } ],
    "services": [ { "name": "a", "url": "http://a/" } ]
  })"));

  KJ_EXPECT_THROW_MESSAGE("maxBatchTimeout of queue \"jobs\" must be between 0 and 30",
      consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "a", "maxBatchTimeout": -1 } } ],
    "services": [ { "name": "a", "url": "http://a/" } ]
  })"));

  KJ_EXPECT_THROW_MESSAGE("maxRetries of queue \"jobs\" must be between 0 and 100",
      consumersOf(R"({
    "queues": [ { "name": "jobs", "consumer": { "service": "a", "maxRetries": 1000 } } ],
    "services": [ { "name": "a", "url": "http://a/" } ]
  })"));

  KJ_EXPECT_THROW_MESSAGE("Multiple services named \"a\"", consumersOf(R"({
    "services": [ { "name": "a", "url": "http://a/" }, { "name": "a", "url": "http://b/" } ]
  })"));
}

KJ_TEST("malformed config") {
  capnp::MallocMessageBuilder message;
  KJ_EXPECT_THROW_MESSAGE("invalid config", parseConfig("{ \"queues\": ", message));
}

}  // namespace
}  // namespace queuesim::server
