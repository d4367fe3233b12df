// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "config.h"

#include <capnp/compat/json.h>
#include <kj/debug.h>
#include <kj/map.h>
#include <kj/vector.h>

#include <cmath>

namespace queuesim::server {

config::Config::Reader parseConfig(kj::StringPtr json, capnp::MallocMessageBuilder& message) {
  auto root = message.initRoot<config::Config>();
  capnp::JsonCodec codec;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { codec.decode(json, root); })) {
    KJ_FAIL_REQUIRE("invalid config", exception.getDescription());
  }
  return root.asReader();
}

kj::Duration secondsToDuration(double seconds) {
  return static_cast<int64_t>(std::round(seconds * 1000)) * kj::MILLISECONDS;
}

kj::Array<ConsumerConfig> parseConsumers(config::Config::Reader config) {
  kj::HashMap<kj::StringPtr, kj::StringPtr> services;
  for (auto service: config.getServices()) {
    kj::StringPtr name = service.getName();
    KJ_REQUIRE(name.size() > 0, "service must have a name");
    KJ_REQUIRE(service.hasUrl(), kj::str("Service \"", name, "\" has no url"));
    services.upsert(name, service.getUrl(), [&](kj::StringPtr&, kj::StringPtr&&) {
      KJ_FAIL_REQUIRE(kj::str("Multiple services named \"", name, "\""));
    });
  }

  kj::HashSet<kj::StringPtr> seen;
  kj::Vector<ConsumerConfig> result;
  for (auto queue: config.getQueues()) {
    kj::StringPtr name = queue.getName();
    KJ_REQUIRE(name.size() > 0, "queue must have a name");
    KJ_REQUIRE(!seen.contains(name), kj::str("Multiple consumers defined for queue \"", name, "\""));
    seen.insert(name);

    if (!queue.hasConsumer()) continue;
    auto consumer = queue.getConsumer();

    KJ_REQUIRE(consumer.getMaxBatchSize() <= MAX_BATCH_SIZE_LIMIT,
        kj::str("maxBatchSize of queue \"", name, "\" must be between 0 and ",
            MAX_BATCH_SIZE_LIMIT));
    double timeout = consumer.getMaxBatchTimeout();
    KJ_REQUIRE(std::isfinite(timeout) && timeout >= 0 &&
            timeout <= MAX_BATCH_TIMEOUT_LIMIT_SECONDS,
        kj::str("maxBatchTimeout of queue \"", name, "\" must be between 0 and ",
            MAX_BATCH_TIMEOUT_LIMIT_SECONDS, " seconds"));
    KJ_REQUIRE(consumer.getMaxRetries() <= MAX_RETRIES_LIMIT,
        kj::str("maxRetries of queue \"", name, "\" must be between 0 and ", MAX_RETRIES_LIMIT));

    kj::Maybe<kj::String> deadLetterQueue;
    if (consumer.hasDeadLetterQueue() && consumer.getDeadLetterQueue().size() > 0) {
      kj::StringPtr dlq = consumer.getDeadLetterQueue();
      KJ_REQUIRE(dlq != name, kj::str("Dead letter queue for queue \"", name,
                                  "\" cannot be itself"));
      deadLetterQueue = kj::str(dlq);
    }

    kj::StringPtr serviceName = consumer.getService();
    auto& url = KJ_REQUIRE_NONNULL(services.find(serviceName),
        kj::str("Consumer of queue \"", name, "\" refers to unknown service \"", serviceName,
            "\""));

    result.add(ConsumerConfig{
      .queueName = kj::str(name),
      .maxBatchSize = consumer.getMaxBatchSize(),
      .maxBatchTimeout = secondsToDuration(timeout),
      .maxRetries = consumer.getMaxRetries(),
      .deadLetterQueue = kj::mv(deadLetterQueue),
      .serviceName = kj::str(serviceName),
      .serviceUrl = kj::str(url),
    });
  }

  return result.releaseAsArray();
}

}  // namespace queuesim::server
